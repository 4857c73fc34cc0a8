#ifndef CONFLUX_PIPELINE_HPP
#define CONFLUX_PIPELINE_HPP

#include <conflux/types.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conflux {

struct StageDefinition {
    AgentType agent_type;
    bool mutates_code = false;   // Only these stages reserve a branch
};

/**
 * Pipeline tunables. Stages run strictly in the listed order.
 */
struct PipelineConfig {
    std::vector<StageDefinition> stages = default_stages();
    std::size_t worker_threads = 4;
    std::chrono::milliseconds admission_timeout = std::chrono::minutes(30);
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50);
    bool open_pull_requests = true;

    // product-manager, project-manager, tech-lead, then the code-mutating
    // senior-developer, junior-developer and qa-engineer.
    static std::vector<StageDefinition> default_stages();
};

struct StageRecord {
    AgentType agent_type;
    bool mutates_code = false;
    UnitStatus status = UnitStatus::Pending;
    std::string output;
    std::vector<std::string> files_changed;
    std::string error;
    std::string branch_name;
    std::string pull_request;
    std::optional<ResolutionStrategy> resolution;   // Set when the stage had to wait out a conflict
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;
};

/**
 * Persisted state of one unit's trip through the pipeline.
 */
struct PipelineRecord {
    UnitOfWork unit;
    RepositoryId repo;
    UnitStatus status = UnitStatus::Pending;
    std::vector<StageRecord> stages;
    std::string error;

    static PipelineRecord create(const UnitOfWork& unit, const RepositoryId& repo,
                                 const std::vector<StageDefinition>& stages);

    const StageRecord* find_stage(const AgentType& agent_type) const;
};

// Aggregate: pending -> in-progress -> {completed | failed | cancelled}, or pending -> cancelled.
bool can_transition(UnitStatus from, UnitStatus to);

// Stages: pending -> in-progress -> {completed | failed}. Stages are never cancelled.
bool can_transition_stage(UnitStatus from, UnitStatus to);

// Both throw InvalidTransition when the move is not allowed.
void transition(PipelineRecord& record, UnitStatus next);
void transition(StageRecord& stage, UnitStatus next);

struct StageContext {
    RepositoryId repo;
    std::string branch_name;                                     // Empty for non-mutating stages
    std::vector<std::pair<AgentType, std::string>> previous_outputs;
    bool final_stage = false;
};

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::vector<std::string> files_changed;
    std::string error;
};

/**
 * External code-generation engine, invoked once per stage.
 */
class Executor {
public:
    virtual ~Executor() = default;
    virtual ExecutionResult execute(const UnitOfWork& unit, const AgentType& agent_type,
                                    const std::string& instructions, const StageContext& context) = 0;
};

/**
 * Git hosting API used after a code-mutating stage succeeds.
 */
class SourceHost {
public:
    virtual ~SourceHost() = default;
    virtual void create_branch(const RepositoryId& repo, const std::string& branch_name) = 0;

    // Returns the pull request reference (URL or number).
    virtual std::string create_pull_request(const RepositoryId& repo, const std::string& branch_name,
                                            const std::string& title, const std::string& body) = 0;
};

/**
 * Persistence of pipeline records, keyed by unit id.
 */
class UnitStore {
public:
    virtual ~UnitStore() = default;
    virtual std::optional<PipelineRecord> load(const UnitId& id) const = 0;
    virtual void save(const PipelineRecord& record) = 0;

    // Atomic read-modify-write. Returns false if no record exists.
    virtual bool update(const UnitId& id, const std::function<void(PipelineRecord&)>& mutate) = 0;
};

class InMemoryUnitStore : public UnitStore {
private:
    mutable std::mutex mutex_;
    std::map<UnitId, PipelineRecord> records_;

public:
    std::optional<PipelineRecord> load(const UnitId& id) const override;
    void save(const PipelineRecord& record) override;
    bool update(const UnitId& id, const std::function<void(PipelineRecord&)>& mutate) override;

    std::size_t size() const;
};

/**
 * Shared cancellation flag, observed by the orchestrator at stage boundaries
 * and while waiting for queue admission.
 */
class CancellationToken {
private:
    std::shared_ptr<std::atomic<bool>> flag_;

public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    bool operator==(const CancellationToken& other) const { return flag_ == other.flag_; }
};

} // namespace conflux

#endif // CONFLUX_PIPELINE_HPP
