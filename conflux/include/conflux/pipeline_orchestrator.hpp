#ifndef CONFLUX_PIPELINE_ORCHESTRATOR_HPP
#define CONFLUX_PIPELINE_ORCHESTRATOR_HPP

#include <conflux/dependency_planner.hpp>
#include <conflux/job_system.hpp>
#include <conflux/pipeline.hpp>
#include <conflux/reservation_manager.hpp>
#include <conflux/resolution.hpp>
#include <conflux/types.hpp>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace conflux {

/**
 * A pipeline running in the background. The token cancels it at the next
 * stage boundary; the future yields the final record.
 */
struct PipelineHandle {
    UnitId unit_id;
    CancellationToken token;
    std::shared_future<PipelineRecord> result;
};

struct BatchResult {
    OverlapPrevention prevention;
    ExecutionPlan plan;
    std::vector<PipelineRecord> records;   // Plan order

    std::size_t count(UnitStatus status) const;
};

/**
 * Drives units through the fixed sequence of agent stages.
 *
 * Code-mutating stages hold a branch reservation for exactly the duration of the
 * stage; a stage that conflicts is queued and waits cooperatively for admission.
 * Cancellation and failure are observed at stage boundaries, and every state
 * change is written through the UnitStore.
 */
class PipelineOrchestrator {
private:
    ReservationManager& reservations_;
    Executor& executor_;
    SourceHost& host_;
    UnitStore& store_;
    PipelineConfig config_;

    std::mutex tokens_mutex_;
    std::map<UnitId, CancellationToken> tokens_;

    // Declared last so workers are joined before anything they touch is destroyed.
    JobSystem jobs_;

    PipelineRecord execute(const UnitOfWork& unit, const RepositoryId& repo, const CancellationToken& token);

    // Runs one stage; returns false if it failed. Throws AbortedError on cancellation.
    bool run_stage(PipelineRecord& record, std::size_t index, const CancellationToken& token);

    // Reserve the branch for a mutating stage, queueing until admitted.
    // Throws AbortedError on cancellation and std::runtime_error on admission timeout.
    Reservation acquire_reservation(const UnitOfWork& unit, const AgentType& agent_type,
                                    const RepositoryId& repo, const CancellationToken& token,
                                    StageRecord& stage);

    bool is_cancelled(const UnitId& unit_id, const CancellationToken& token) const;

    std::string build_instructions(const PipelineRecord& record, std::size_t index) const;

    // Write the orchestrator-owned fields (stages, error) and pick up the latest status.
    void persist_stages(PipelineRecord& record);

    // Move the persisted aggregate to `next`. A terminal persisted status is kept as is.
    void set_status(PipelineRecord& record, UnitStatus next);

    CancellationToken register_token(const UnitId& unit_id, CancellationToken token);
    void unregister_token(const UnitId& unit_id, const CancellationToken& token);

public:
    PipelineOrchestrator(ReservationManager& reservations, Executor& executor, SourceHost& host,
                         UnitStore& store, PipelineConfig config = {});
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    // Run every remaining stage on the calling thread.
    PipelineRecord run_pipeline(const UnitOfWork& unit, const RepositoryId& repo);

    // Run every remaining stage on a worker thread.
    PipelineHandle start_pipeline(const UnitOfWork& unit, const RepositoryId& repo);

    /**
     * Mark the unit cancelled in the store and signal its running pipeline, if any.
     * Returns false when the unit is unknown or already terminal.
     */
    bool cancel(const UnitId& unit_id);

    /**
     * Prevent overlaps, plan with DependencyPlanner and run the plan group by group,
     * units of one group concurrently. Units whose in-batch dependencies did not
     * complete are cancelled without running. Throws CycleError for cyclic batches.
     */
    BatchResult run_batch(const std::vector<UnitOfWork>& units, const RepositoryId& repo,
                          const ResolutionOptions& options = {});

    /**
     * Block until every background pipeline has finished. abort_check is polled from
     * the calling thread every poll_interval; when it returns true the wait stops and
     * true is returned. Pipelines keep running either way.
     */
    bool wait_for_pipelines(const std::function<bool()>& abort_check);
    void wait_for_pipelines() { jobs_.wait_for_completion(); }

    // Background pipelines submitted and not yet finished.
    std::size_t pending_pipelines() const { return jobs_.get_pending_count(); }

    // Classification of the last exception that escaped a background pipeline.
    ErrorType background_error() const { return jobs_.get_error_type(); }

    const PipelineConfig& config() const { return config_; }
};

} // namespace conflux

#endif // CONFLUX_PIPELINE_ORCHESTRATOR_HPP
