#include <conflux/reservation_manager.hpp>
#include <conflux/debug_log.hpp>
#include <conflux/text_analysis.hpp>
#include <algorithm>
#include <stdexcept>

namespace conflux {

namespace {

std::string join(const std::set<std::string>& items) {
    if (items.empty()) return "none";
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

void validate_repository(const RepositoryId& repo) {
    if (repo.owner.empty() || repo.name.empty()) {
        throw std::invalid_argument("Repository owner and name must be non-empty");
    }
}

} // namespace

ReservationManager::ReservationManager(SchedulerConfig config, AgentCatalog catalog,
                                       std::shared_ptr<TimeSource> clock,
                                       std::shared_ptr<const ConflictPredictor> predictor)
    : config_(config)
    , catalog_(std::move(catalog))
    , clock_(clock ? std::move(clock) : default_time_source())
    , extractor_(predictor ? TaskContextExtractor(std::move(predictor)) : TaskContextExtractor())
    , checker_(extractor_, catalog_)
    , engine_(extractor_, catalog_, config_, clock_) {}

ReservationManager::Shard& ReservationManager::shard_for(const RepositoryId& repo) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = shards_.find(repo);
    if (it == shards_.end()) {
        it = shards_.emplace(repo, std::make_unique<Shard>(repo)).first;
    }
    return *it->second;
}

ReservationManager::Shard* ReservationManager::find_shard(const RepositoryId& repo) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = shards_.find(repo);
    return it == shards_.end() ? nullptr : it->second.get();
}

std::vector<ReservationManager::Shard*> ReservationManager::all_shards() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<Shard*> shards;
    shards.reserve(shards_.size());
    for (const auto& [repo, shard] : shards_) shards.push_back(shard.get());
    return shards;
}

std::string ReservationManager::claim_branch_name(const UnitOfWork& unit, const AgentType& agent_type,
                                                  const RepositoryId& repo, TimePoint now) {
    std::string id_tail = unit.id.size() > 6 ? unit.id.substr(unit.id.size() - 6) : unit.id;
    std::string base = "agents/" + agent_type + "/" + id_tail + "/" + slugify(unit.title, 30) +
                       "-" + std::to_string(to_epoch_millis(now));

    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::string name = base;
    for (int suffix = 2; branch_index_.count(name); ++suffix) {
        name = base + "-" + std::to_string(suffix);
    }
    branch_index_.emplace(name, repo);
    return name;
}

Reservation ReservationManager::reserve_branch(const UnitOfWork& unit, const AgentType& agent_type,
                                               const RepositoryId& repo) {
    if (unit.id.empty()) {
        throw std::invalid_argument("Unit of work must have an id");
    }
    if (agent_type.empty()) {
        throw std::invalid_argument("Agent type must be non-empty");
    }
    validate_repository(repo);

    Shard& shard = shard_for(repo);
    std::lock_guard<std::mutex> lock(shard.mutex);
    RepositoryState& state = shard.state;

    if (state.active_units.count(unit.id)) {
        throw std::logic_error("Unit " + unit.id + " already holds a reservation on " + repo.to_string());
    }

    TimePoint now = clock_->now();
    CompatibilityResult compatibility = checker_.check(unit, agent_type, state, now);
    if (!compatibility.compatible) {
        CONFLUX_LOG_DEBUG("Reservation refused for %s on %s: %s", unit.id.c_str(),
                          repo.to_string().c_str(), to_string(*compatibility.category));
        throw ConflictError(std::move(compatibility));
    }

    Reservation reservation;
    reservation.repo = repo;
    reservation.agent_type = agent_type;
    reservation.unit = unit;
    if (reservation.unit.status == UnitStatus::Pending) {
        reservation.unit.status = UnitStatus::InProgress;
    }
    reservation.context = extractor_.extract(unit);
    reservation.created_at = now;
    reservation.branch_name = claim_branch_name(unit, agent_type, repo, now);

    state.reservations.emplace(reservation.branch_name, reservation);
    state.branch_by_agent[agent_type] = reservation.branch_name;
    state.active_units.emplace(unit.id, ActiveUnit{
        reservation.unit, reservation.context, agent_type, reservation.branch_name, now
    });
    for (const auto& file : reservation.context.affected_files) {
        state.file_usage[file].insert(unit.id);
    }

    CONFLUX_LOG_INFO("Branch reserved: %s for %s (Task: %s)", reservation.branch_name.c_str(),
                     agent_type.c_str(), unit.title.c_str());
    CONFLUX_LOG_INFO("Files affected: %s", join(reservation.context.affected_files).c_str());
    CONFLUX_LOG_INFO("Modules affected: %s", join(reservation.context.affected_modules).c_str());
    return reservation;
}

bool ReservationManager::release_branch(const std::string& branch_name) {
    RepositoryId repo;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = branch_index_.find(branch_name);
        if (it == branch_index_.end()) {
            CONFLUX_LOG_WARN("Attempted to release non-existent branch: %s", branch_name.c_str());
            return false;
        }
        repo = it->second;
    }

    Shard* shard = find_shard(repo);
    if (!shard) return false;

    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        RepositoryState& state = shard->state;

        auto it = state.reservations.find(branch_name);
        if (it == state.reservations.end()) {
            // Lost a race with another release of the same branch
            CONFLUX_LOG_WARN("Attempted to release non-existent branch: %s", branch_name.c_str());
            return false;
        }

        const Reservation& reservation = it->second;
        for (const auto& file : reservation.context.affected_files) {
            auto usage = state.file_usage.find(file);
            if (usage == state.file_usage.end()) continue;
            usage->second.erase(reservation.unit.id);
            if (usage->second.empty()) state.file_usage.erase(usage);
        }
        state.active_units.erase(reservation.unit.id);

        auto agent = state.branch_by_agent.find(reservation.agent_type);
        if (agent != state.branch_by_agent.end() && agent->second == branch_name) {
            state.branch_by_agent.erase(agent);
        }

        CONFLUX_LOG_INFO("Branch released: %s from %s", branch_name.c_str(), reservation.agent_type.c_str());
        CONFLUX_LOG_INFO("Files freed: %s", join(reservation.context.affected_files).c_str());

        state.reservations.erase(it);

        std::lock_guard<std::mutex> registry_lock(registry_mutex_);
        branch_index_.erase(branch_name);
    }

    process_queue(repo);
    return true;
}

bool ReservationManager::force_release_branch(const std::string& branch_name, const std::string& reason) {
    CONFLUX_LOG_WARN("Force releasing branch: %s - %s", branch_name.c_str(), reason.c_str());
    return release_branch(branch_name);
}

std::size_t ReservationManager::queue_agent_task(const UnitOfWork& unit, const AgentType& agent_type,
                                                 const RepositoryId& repo, std::function<void()> on_admit,
                                                 QueuePlacement placement) {
    if (unit.id.empty()) {
        throw std::invalid_argument("Unit of work must have an id");
    }
    if (!on_admit) {
        throw std::invalid_argument("Queued task requires an admission callback");
    }
    validate_repository(repo);

    Shard& shard = shard_for(repo);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto& queue = shard.state.queues[agent_type];
    QueuedTask entry{unit, agent_type, std::move(on_admit), clock_->now()};
    if (placement == QueuePlacement::Front) {
        queue.push_front(std::move(entry));
        CONFLUX_LOG_INFO("Task requeued at head: %s for %s on %s", unit.title.c_str(), agent_type.c_str(),
                         repo.to_string().c_str());
        return 1;
    }

    queue.push_back(std::move(entry));
    CONFLUX_LOG_INFO("Task queued: %s for %s on %s", unit.title.c_str(), agent_type.c_str(),
                     repo.to_string().c_str());
    return queue.size();
}

std::size_t ReservationManager::process_queue(const RepositoryId& repo) {
    Shard* shard = find_shard(repo);
    if (!shard) return 0;

    std::vector<QueuedTask> admitted;
    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        RepositoryState& state = shard->state;
        TimePoint now = clock_->now();

        for (auto& [agent_type, queue] : state.queues) {
            for (auto it = queue.begin(); it != queue.end(); ++it) {
                CompatibilityResult compatibility = checker_.check(it->unit, it->agent_type, state, now);
                if (compatibility.compatible) {
                    admitted.push_back(std::move(*it));
                    queue.erase(it);
                    break;  // One admission per agent type per scan
                }
                CONFLUX_LOG_DEBUG("Task still incompatible: %s - %s", it->unit.title.c_str(),
                                  to_string(*compatibility.category));
            }
        }

        for (auto it = state.queues.begin(); it != state.queues.end();) {
            it = it->second.empty() ? state.queues.erase(it) : std::next(it);
        }
    }

    std::size_t count = 0;
    for (auto& entry : admitted) {
        CONFLUX_LOG_INFO("Processing compatible queued task: %s for %s", entry.unit.title.c_str(),
                         entry.agent_type.c_str());
        try {
            entry.on_admit();
            ++count;
        } catch (const std::exception& e) {
            CONFLUX_LOG_ERROR("Failed to process queued task %s: %s", entry.unit.id.c_str(), e.what());
        }
    }
    return count;
}

bool ReservationManager::cancel_queued_task(const RepositoryId& repo, const AgentType& agent_type,
                                            const UnitId& unit_id) {
    Shard* shard = find_shard(repo);
    if (!shard) return false;

    std::lock_guard<std::mutex> lock(shard->mutex);
    auto queue = shard->state.queues.find(agent_type);
    if (queue == shard->state.queues.end()) return false;

    auto& entries = queue->second;
    auto it = std::find_if(entries.begin(), entries.end(), [&unit_id](const QueuedTask& entry) {
        return entry.unit.id == unit_id;
    });
    if (it == entries.end()) return false;

    entries.erase(it);
    if (entries.empty()) shard->state.queues.erase(queue);
    CONFLUX_LOG_INFO("Queued task cancelled: %s for %s on %s", unit_id.c_str(), agent_type.c_str(),
                     repo.to_string().c_str());
    return true;
}

std::size_t ReservationManager::emergency_cleanup(std::uint32_t older_than_minutes) {
    TimePoint threshold = clock_->now() - std::chrono::minutes(older_than_minutes);

    std::vector<std::string> stale;
    for (Shard* shard : all_shards()) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [branch, reservation] : shard->state.reservations) {
            if (reservation.created_at < threshold) stale.push_back(branch);
        }
    }

    CONFLUX_LOG_WARN("Emergency cleanup: releasing %zu stale locks", stale.size());

    std::size_t released = 0;
    for (const auto& branch : stale) {
        if (release_branch(branch)) ++released;
    }
    return released;
}

bool ReservationManager::update_unit_status(const RepositoryId& repo, const UnitId& unit_id, UnitStatus status) {
    Shard* shard = find_shard(repo);
    if (!shard) return false;

    {
        std::lock_guard<std::mutex> lock(shard->mutex);
        RepositoryState& state = shard->state;

        auto active = state.active_units.find(unit_id);
        if (active == state.active_units.end()) return false;

        active->second.unit.status = status;
        auto reservation = state.reservations.find(active->second.branch_name);
        if (reservation != state.reservations.end()) {
            reservation->second.unit.status = status;
        }
        CONFLUX_LOG_INFO("Task %s on %s is now %s", unit_id.c_str(), repo.to_string().c_str(), to_string(status));
    }

    process_queue(repo);
    return true;
}

CompatibilityResult ReservationManager::check_compatibility(const UnitOfWork& unit, const RepositoryId& repo) const {
    Shard* shard = find_shard(repo);
    if (!shard) {
        RepositoryState empty(repo);
        return checker_.check(unit, unit.assigned_agent, empty, clock_->now());
    }

    std::lock_guard<std::mutex> lock(shard->mutex);
    return checker_.check(unit, unit.assigned_agent, shard->state, clock_->now());
}

Resolution ReservationManager::resolve_task_conflicts(const UnitOfWork& unit, const RepositoryId& repo,
                                                      const ResolutionOptions& options) {
    validate_repository(repo);

    Shard& shard = shard_for(repo);
    std::lock_guard<std::mutex> lock(shard.mutex);
    RepositoryState& state = shard.state;

    CompatibilityResult compatibility = checker_.check(unit, unit.assigned_agent, state, clock_->now());
    if (compatibility.compatible) {
        return engine_.resolve(unit, state, compatibility, options);
    }

    CONFLUX_LOG_INFO("Attempting to resolve conflict: %s for task \"%s\"",
                     to_string(*compatibility.category), unit.title.c_str());

    Resolution resolution = engine_.resolve(unit, state, compatibility, options);

    state.history.push_back(ResolutionRecord{
        unit.id, *compatibility.category, resolution.strategy, resolution.resolved, clock_->now()
    });
    while (state.history.size() > config_.resolution_history_limit) {
        state.history.pop_front();
    }

    CONFLUX_LOG_INFO("Logged resolution: %s -> %s", to_string(*compatibility.category),
                     to_string(resolution.strategy));
    return resolution;
}

TaskSetValidation ReservationManager::validate_task_set(const std::vector<UnitOfWork>& proposed,
                                                        const RepositoryId& repo) const {
    OverlapAnalyzer analyzer(extractor_, config_);
    return analyzer.validate_task_set(proposed, active_units(repo));
}

RepositoryStatus ReservationManager::snapshot(const RepositoryState& state, TimePoint now) {
    RepositoryStatus status;
    status.repo = state.repo;
    for (const auto& [branch, reservation] : state.reservations) {
        status.active.push_back(ActiveReservationInfo{
            reservation.agent_type, reservation.unit.id, branch, minutes_between(reservation.created_at, now)
        });
    }
    for (const auto& [agent_type, queue] : state.queues) {
        status.queue_depths[agent_type] = queue.size();
        status.queued_tasks += queue.size();
    }
    status.files_in_use = state.file_usage.size();
    return status;
}

RepositoryStatus ReservationManager::get_repository_status(const RepositoryId& repo) const {
    Shard* shard = find_shard(repo);
    if (!shard) {
        RepositoryStatus status;
        status.repo = repo;
        return status;
    }

    std::lock_guard<std::mutex> lock(shard->mutex);
    return snapshot(shard->state, clock_->now());
}

std::vector<RepositoryStatus> ReservationManager::get_all_repositories_status() const {
    std::vector<RepositoryStatus> statuses;
    TimePoint now = clock_->now();
    for (Shard* shard : all_shards()) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        if (shard->state.empty()) continue;
        statuses.push_back(snapshot(shard->state, now));
    }
    return statuses;
}

std::vector<ResolutionRecord> ReservationManager::resolution_history(const RepositoryId& repo) const {
    Shard* shard = find_shard(repo);
    if (!shard) return {};

    std::lock_guard<std::mutex> lock(shard->mutex);
    return std::vector<ResolutionRecord>(shard->state.history.begin(), shard->state.history.end());
}

std::map<std::string, std::set<UnitId>> ReservationManager::files_in_use(const RepositoryId& repo) const {
    Shard* shard = find_shard(repo);
    if (!shard) return {};

    std::lock_guard<std::mutex> lock(shard->mutex);
    return shard->state.file_usage;
}

std::vector<UnitOfWork> ReservationManager::active_units(const RepositoryId& repo) const {
    Shard* shard = find_shard(repo);
    if (!shard) return {};

    std::lock_guard<std::mutex> lock(shard->mutex);
    std::vector<UnitOfWork> units;
    units.reserve(shard->state.active_units.size());
    for (const auto& [id, active] : shard->state.active_units) units.push_back(active.unit);
    return units;
}

std::size_t ReservationManager::reservation_count(const RepositoryId& repo, const AgentType& agent_type) const {
    Shard* shard = find_shard(repo);
    if (!shard) return 0;

    std::lock_guard<std::mutex> lock(shard->mutex);
    std::size_t count = 0;
    for (const auto& [branch, reservation] : shard->state.reservations) {
        if (reservation.agent_type == agent_type) ++count;
    }
    return count;
}

} // namespace conflux
