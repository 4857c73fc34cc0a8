#ifndef CONFLUX_RESERVATION_MANAGER_HPP
#define CONFLUX_RESERVATION_MANAGER_HPP

#include <conflux/clock.hpp>
#include <conflux/compatibility.hpp>
#include <conflux/config.hpp>
#include <conflux/overlap_analysis.hpp>
#include <conflux/repository_state.hpp>
#include <conflux/resolution.hpp>
#include <conflux/task_context.hpp>
#include <conflux/types.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace conflux {

// Where a waiting task enters its agent-type queue.
enum class QueuePlacement {
    Back = 0,   // Normal arrival
    Front       // Retry of an admitted task that lost its reservation to a race
};

struct ActiveReservationInfo {
    AgentType agent_type;
    UnitId unit_id;
    std::string branch_name;
    double working_minutes = 0.0;
};

/**
 * Read-only monitoring snapshot of one repository.
 */
struct RepositoryStatus {
    RepositoryId repo;
    std::vector<ActiveReservationInfo> active;
    std::size_t queued_tasks = 0;
    std::map<AgentType, std::size_t> queue_depths;
    std::size_t files_in_use = 0;
};

/**
 * Owns every repository's reservations, active units, file-usage index, agent queues
 * and resolution history. The only component allowed to mutate that state.
 *
 * State is sharded per repository behind its own mutex: the compatibility check and
 * the reservation it guards run in one critical section, and operations on different
 * repositories never contend. Queue admission callbacks always run with no lock held.
 */
class ReservationManager {
private:
    struct Shard {
        std::mutex mutex;
        RepositoryState state;

        explicit Shard(RepositoryId id) : state(std::move(id)) {}
    };

    SchedulerConfig config_;
    AgentCatalog catalog_;
    std::shared_ptr<TimeSource> clock_;
    TaskContextExtractor extractor_;
    CompatibilityChecker checker_;
    ConflictResolutionEngine engine_;

    // Lock order: a shard mutex may be held while taking registry_mutex_, never the reverse.
    mutable std::mutex registry_mutex_;
    std::map<RepositoryId, std::unique_ptr<Shard>> shards_;
    std::map<std::string, RepositoryId> branch_index_;

    Shard& shard_for(const RepositoryId& repo);
    Shard* find_shard(const RepositoryId& repo) const;
    std::vector<Shard*> all_shards() const;

    // Deterministic "agents/<agent>/<id tail>/<title slug>-<millis>", suffixed on collision.
    // Registers the name in branch_index_; caller holds the shard lock.
    std::string claim_branch_name(const UnitOfWork& unit, const AgentType& agent_type,
                                  const RepositoryId& repo, TimePoint now);

    static RepositoryStatus snapshot(const RepositoryState& state, TimePoint now);

public:
    explicit ReservationManager(SchedulerConfig config = {},
                                AgentCatalog catalog = AgentCatalog::default_catalog(),
                                std::shared_ptr<TimeSource> clock = default_time_source(),
                                std::shared_ptr<const ConflictPredictor> predictor = nullptr);

    ReservationManager(const ReservationManager&) = delete;
    ReservationManager& operator=(const ReservationManager&) = delete;

    /**
     * Atomically re-check compatibility and claim (repo, agent_type) for the unit.
     * On success the unit becomes active and its files are indexed.
     *
     * Throws ConflictError when the unit cannot run now, std::invalid_argument for
     * malformed input and std::logic_error if the unit already holds a reservation.
     */
    Reservation reserve_branch(const UnitOfWork& unit, const AgentType& agent_type, const RepositoryId& repo);

    /**
     * Drop a reservation, its active unit and every file it indexed, then run one
     * queue admission scan for the repository. Unknown branches are a logged no-op
     * and return false.
     */
    bool release_branch(const std::string& branch_name);

    bool force_release_branch(const std::string& branch_name, const std::string& reason = "Manual release");

    // Enter the repository's FIFO for agent_type. Returns the 1-based queue position.
    std::size_t queue_agent_task(const UnitOfWork& unit, const AgentType& agent_type,
                                 const RepositoryId& repo, std::function<void()> on_admit,
                                 QueuePlacement placement = QueuePlacement::Back);

    /**
     * For each agent-type queue, admit the first entry that is compatible right now
     * and remove only that entry. Returns the number admitted.
     */
    std::size_t process_queue(const RepositoryId& repo);

    bool cancel_queued_task(const RepositoryId& repo, const AgentType& agent_type, const UnitId& unit_id);

    // Release every reservation older than the threshold. Returns the count released.
    std::size_t emergency_cleanup(std::uint32_t older_than_minutes);
    std::size_t emergency_cleanup() { return emergency_cleanup(config_.default_cleanup_minutes); }

    // Change the status of an active unit; re-scans the queues. False if the unit is not active.
    bool update_unit_status(const RepositoryId& repo, const UnitId& unit_id, UnitStatus status);

    CompatibilityResult check_compatibility(const UnitOfWork& unit, const RepositoryId& repo) const;

    // Check, and on conflict resolve and record the outcome in the repository history.
    Resolution resolve_task_conflicts(const UnitOfWork& unit, const RepositoryId& repo,
                                      const ResolutionOptions& options = {});

    TaskSetValidation validate_task_set(const std::vector<UnitOfWork>& proposed, const RepositoryId& repo) const;

    RepositoryStatus get_repository_status(const RepositoryId& repo) const;
    std::vector<RepositoryStatus> get_all_repositories_status() const;

    std::vector<ResolutionRecord> resolution_history(const RepositoryId& repo) const;
    std::map<std::string, std::set<UnitId>> files_in_use(const RepositoryId& repo) const;
    std::vector<UnitOfWork> active_units(const RepositoryId& repo) const;
    std::size_t reservation_count(const RepositoryId& repo, const AgentType& agent_type) const;

    const ConflictResolutionEngine& engine() const { return engine_; }
    const TaskContextExtractor& extractor() const { return extractor_; }
    const AgentCatalog& catalog() const { return catalog_; }
    const SchedulerConfig& config() const { return config_; }
    const std::shared_ptr<TimeSource>& clock() const { return clock_; }
};

/**
 * Releases a branch when it goes out of scope, on success and error paths alike.
 */
class ReservationGuard {
private:
    ReservationManager* manager_;
    std::string branch_;

public:
    ReservationGuard(ReservationManager& manager, std::string branch)
        : manager_(&manager), branch_(std::move(branch)) {}

    ~ReservationGuard() { release(); }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    ReservationGuard(ReservationGuard&& other) noexcept
        : manager_(other.manager_), branch_(std::move(other.branch_)) {
        other.branch_.clear();
    }

    const std::string& branch() const { return branch_; }

    void release() {
        if (!branch_.empty()) {
            std::string branch = std::move(branch_);
            branch_.clear();
            manager_->release_branch(branch);
        }
    }
};

} // namespace conflux

#endif // CONFLUX_RESERVATION_MANAGER_HPP
