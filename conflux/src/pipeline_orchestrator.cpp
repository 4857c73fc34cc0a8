#include <conflux/pipeline_orchestrator.hpp>
#include <conflux/debug_log.hpp>
#include <conflux/errors.hpp>
#include <condition_variable>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace conflux {

namespace {

// Set by the reservation manager's queue admission; waited on by the blocked stage.
class AdmissionSignal {
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool admitted_ = false;

public:
    void signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            admitted_ = true;
        }
        cv_.notify_all();
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return admitted_; });
    }
};

std::string pull_request_body(const UnitOfWork& unit, const AgentType& agent_type,
                              const std::vector<std::string>& files) {
    std::ostringstream body;
    body << "Automated changes by " << agent_type << " for " << unit.id << "\n\n";
    if (!unit.description.empty()) {
        body << unit.description << "\n\n";
    }
    body << "Files changed:\n";
    for (const auto& file : files) {
        body << "- " << file << "\n";
    }
    return body.str();
}

} // namespace

std::size_t BatchResult::count(UnitStatus status) const {
    std::size_t total = 0;
    for (const auto& record : records) {
        if (record.status == status) ++total;
    }
    return total;
}

PipelineOrchestrator::PipelineOrchestrator(ReservationManager& reservations, Executor& executor,
                                           SourceHost& host, UnitStore& store, PipelineConfig config)
    : reservations_(reservations)
    , executor_(executor)
    , host_(host)
    , store_(store)
    , config_(std::move(config))
    , jobs_(config_.worker_threads) {
    if (config_.stages.empty()) {
        throw std::invalid_argument("Pipeline requires at least one stage");
    }
    if (config_.poll_interval.count() <= 0) {
        throw std::invalid_argument("Pipeline poll interval must be positive");
    }
    jobs_.start();
}

// Pipelines still running are cancelled at their next stage boundary, then drained.
PipelineOrchestrator::~PipelineOrchestrator() {
    {
        std::lock_guard<std::mutex> lock(tokens_mutex_);
        for (auto& [unit_id, token] : tokens_) {
            token.cancel();
        }
    }
    jobs_.wait_for_completion();
    jobs_.shutdown();
}

CancellationToken PipelineOrchestrator::register_token(const UnitId& unit_id, CancellationToken token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    if (!tokens_.emplace(unit_id, token).second) {
        throw std::logic_error("Pipeline for " + unit_id + " is already running");
    }
    return token;
}

void PipelineOrchestrator::unregister_token(const UnitId& unit_id, const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto it = tokens_.find(unit_id);
    if (it != tokens_.end() && it->second == token) {
        tokens_.erase(it);
    }
}

bool PipelineOrchestrator::is_cancelled(const UnitId& unit_id, const CancellationToken& token) const {
    if (token.is_cancelled()) return true;
    std::optional<PipelineRecord> latest = store_.load(unit_id);
    return latest && latest->status == UnitStatus::Cancelled;
}

void PipelineOrchestrator::persist_stages(PipelineRecord& record) {
    bool found = store_.update(record.unit.id, [&record](PipelineRecord& latest) {
        latest.stages = record.stages;
        latest.error = record.error;
        record = latest;
    });
    if (!found) {
        store_.save(record);
    }
}

void PipelineOrchestrator::set_status(PipelineRecord& record, UnitStatus next) {
    bool found = store_.update(record.unit.id, [&record, next](PipelineRecord& latest) {
        latest.stages = record.stages;
        latest.error = record.error;
        if (!is_terminal(latest.status)) {
            transition(latest, next);
        }
        record = latest;
    });
    if (!found) {
        transition(record, next);
        store_.save(record);
    }
}

std::string PipelineOrchestrator::build_instructions(const PipelineRecord& record, std::size_t index) const {
    const UnitOfWork& unit = record.unit;
    const StageRecord& stage = record.stages[index];

    std::ostringstream out;
    out << "Unit: " << unit.title << " (" << unit.id << ")\n";
    out << "Type: " << unit.type << ", complexity " << to_string(unit.complexity)
        << ", priority " << to_string(unit.priority) << "\n\n";
    if (!unit.description.empty()) {
        out << unit.description << "\n\n";
    }
    out << "You are acting as " << stage.agent_type << ".\n";

    bool header = false;
    for (std::size_t i = 0; i < index; ++i) {
        const StageRecord& previous = record.stages[i];
        if (previous.status != UnitStatus::Completed) continue;
        if (!header) {
            out << "\nOutput of previous stages:\n";
            header = true;
        }
        out << "--- " << previous.agent_type << " ---\n" << previous.output << "\n";
    }

    if (index + 1 == record.stages.size()) {
        out << "\nThis is the final stage. Review the work of every previous stage and act as the "
               "final quality gate before the unit is marked completed.\n";
    }
    return out.str();
}

Reservation PipelineOrchestrator::acquire_reservation(const UnitOfWork& unit, const AgentType& agent_type,
                                                      const RepositoryId& repo, const CancellationToken& token,
                                                      StageRecord& stage) {
    const auto deadline = std::chrono::steady_clock::now() + config_.admission_timeout;
    QueuePlacement placement = QueuePlacement::Back;

    while (true) {
        if (is_cancelled(unit.id, token)) {
            throw AbortedError();
        }

        try {
            return reservations_.reserve_branch(unit, agent_type, repo);
        } catch (const ConflictError& e) {
            CONFLUX_LOG_INFO("Stage %s for %s blocked: %s", agent_type.c_str(), unit.id.c_str(), e.what());
            Resolution resolution = reservations_.resolve_task_conflicts(unit, repo);
            stage.resolution = resolution.strategy;
        }

        auto admission = std::make_shared<AdmissionSignal>();
        reservations_.queue_agent_task(unit, agent_type, repo, [admission] { admission->signal(); }, placement);

        // The blocker may have released between the failed reserve and the enqueue
        reservations_.process_queue(repo);

        while (!admission->wait_for(config_.poll_interval)) {
            if (is_cancelled(unit.id, token)) {
                reservations_.cancel_queued_task(repo, agent_type, unit.id);
                throw AbortedError();
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                reservations_.cancel_queued_task(repo, agent_type, unit.id);
                throw StageExecutionError(agent_type, "Timed out waiting for admission on " + repo.to_string());
            }
        }

        // Admitted but the reserve may still lose to another caller; keep our place
        placement = QueuePlacement::Front;
    }
}

bool PipelineOrchestrator::run_stage(PipelineRecord& record, std::size_t index, const CancellationToken& token) {
    const AgentType agent_type = record.stages[index].agent_type;
    const bool mutates_code = record.stages[index].mutates_code;
    const RepositoryId repo = record.repo;

    UnitOfWork unit = record.unit;
    unit.assigned_agent = agent_type;

    StageContext context;
    context.repo = repo;
    context.final_stage = index + 1 == record.stages.size();
    for (std::size_t i = 0; i < index; ++i) {
        if (record.stages[i].status == UnitStatus::Completed) {
            context.previous_outputs.emplace_back(record.stages[i].agent_type, record.stages[i].output);
        }
    }
    const std::string instructions = build_instructions(record, index);

    StageRecord stage = record.stages[index];
    std::optional<ReservationGuard> guard;

    try {
        if (mutates_code) {
            Reservation reservation = acquire_reservation(unit, agent_type, repo, token, stage);
            guard.emplace(reservations_, reservation.branch_name);
            stage.branch_name = reservation.branch_name;
            context.branch_name = reservation.branch_name;
        }

        if (stage.status == UnitStatus::Pending) {
            transition(stage, UnitStatus::InProgress);
        }
        stage.started_at = reservations_.clock()->now();
        stage.error.clear();
        record.stages[index] = stage;
        persist_stages(record);
        CONFLUX_LOG_INFO("Stage %s started for %s", agent_type.c_str(), unit.id.c_str());

        ExecutionResult result;
        try {
            result = executor_.execute(unit, agent_type, instructions, context);
        } catch (const StageExecutionError&) {
            throw;
        } catch (const std::exception& e) {
            throw StageExecutionError(agent_type, e.what());
        }
        if (!result.success) {
            throw StageExecutionError(agent_type, result.error.empty() ? "executor reported failure" : result.error);
        }

        stage.output = std::move(result.output);
        stage.files_changed = std::move(result.files_changed);

        if (mutates_code) {
            host_.create_branch(repo, stage.branch_name);
            if (config_.open_pull_requests && !stage.files_changed.empty()) {
                stage.pull_request = host_.create_pull_request(
                    repo, stage.branch_name, "[" + agent_type + "] " + unit.title,
                    pull_request_body(unit, agent_type, stage.files_changed));
            }
            bool later_mutation = false;
            for (std::size_t i = index + 1; i < record.stages.size(); ++i) {
                later_mutation = later_mutation || record.stages[i].mutates_code;
            }
            if (!later_mutation) {
                reservations_.update_unit_status(repo, unit.id, UnitStatus::Completed);
            }
        }

        transition(stage, UnitStatus::Completed);
        stage.finished_at = reservations_.clock()->now();
        record.stages[index] = stage;
        persist_stages(record);
        CONFLUX_LOG_INFO("Stage %s completed for %s (%zu files changed)", agent_type.c_str(), unit.id.c_str(),
                         stage.files_changed.size());
        return true;
    } catch (const AbortedError&) {
        record.stages[index].resolution = stage.resolution;
        persist_stages(record);
        throw;
    } catch (const std::exception& e) {
        const std::string message = dynamic_cast<const StageExecutionError*>(&e)
            ? std::string(e.what())
            : StageExecutionError(agent_type, e.what()).what();

        if (!is_terminal(stage.status)) {
            if (stage.status == UnitStatus::Pending) {
                transition(stage, UnitStatus::InProgress);
            }
            transition(stage, UnitStatus::Failed);
        }
        stage.error = message;
        stage.finished_at = reservations_.clock()->now();
        record.stages[index] = stage;
        record.error = message;
        persist_stages(record);
        CONFLUX_LOG_ERROR("Stage %s failed for %s: %s", agent_type.c_str(), unit.id.c_str(), message.c_str());
        return false;
    }
}

PipelineRecord PipelineOrchestrator::execute(const UnitOfWork& unit, const RepositoryId& repo,
                                             const CancellationToken& token) {
    std::optional<PipelineRecord> existing = store_.load(unit.id);
    PipelineRecord record = existing ? *existing : PipelineRecord::create(unit, repo, config_.stages);
    if (!existing) {
        store_.save(record);
    }

    if (is_terminal(record.status)) {
        CONFLUX_LOG_INFO("Pipeline for %s already %s", unit.id.c_str(), to_string(record.status));
        return record;
    }

    if (token.is_cancelled()) {
        set_status(record, UnitStatus::Cancelled);
        CONFLUX_LOG_INFO("Pipeline cancelled for %s before start", unit.id.c_str());
        return record;
    }

    if (record.status == UnitStatus::Pending) {
        set_status(record, UnitStatus::InProgress);
    }
    CONFLUX_LOG_INFO("Pipeline started for %s on %s (%zu stages)", unit.id.c_str(),
                     record.repo.to_string().c_str(), record.stages.size());

    for (std::size_t i = 0; i < record.stages.size(); ++i) {
        // External cancellation lands in the store between stages
        std::optional<PipelineRecord> latest = store_.load(unit.id);
        if (latest) {
            record = *latest;
        }

        if (record.status == UnitStatus::Cancelled || token.is_cancelled()) {
            set_status(record, UnitStatus::Cancelled);
            CONFLUX_LOG_INFO("Pipeline cancelled for %s before stage %s", unit.id.c_str(),
                             record.stages[i].agent_type.c_str());
            return record;
        }

        if (record.stages[i].status == UnitStatus::Completed) {
            CONFLUX_LOG_DEBUG("Skipping completed stage %s for %s", record.stages[i].agent_type.c_str(),
                              unit.id.c_str());
            continue;
        }

        // A stage persisted as failed ends the pipeline without running again
        if (is_terminal(record.stages[i].status)) {
            if (record.error.empty()) {
                record.error = record.stages[i].error;
            }
            set_status(record, UnitStatus::Failed);
            CONFLUX_LOG_ERROR("Pipeline failed for %s: stage %s already %s", unit.id.c_str(),
                              record.stages[i].agent_type.c_str(), to_string(record.stages[i].status));
            return record;
        }

        bool succeeded = false;
        try {
            succeeded = run_stage(record, i, token);
        } catch (const AbortedError&) {
            set_status(record, UnitStatus::Cancelled);
            CONFLUX_LOG_INFO("Pipeline cancelled for %s while waiting for %s", unit.id.c_str(),
                             record.stages[i].agent_type.c_str());
            return record;
        }

        if (!succeeded) {
            set_status(record, UnitStatus::Failed);
            CONFLUX_LOG_ERROR("Pipeline failed for %s: %s", unit.id.c_str(), record.error.c_str());
            return record;
        }
    }

    set_status(record, UnitStatus::Completed);
    CONFLUX_LOG_INFO("Pipeline %s for %s", to_string(record.status), unit.id.c_str());
    return record;
}

PipelineRecord PipelineOrchestrator::run_pipeline(const UnitOfWork& unit, const RepositoryId& repo) {
    if (unit.id.empty()) {
        throw std::invalid_argument("Unit of work must have an id");
    }

    CancellationToken token = register_token(unit.id, CancellationToken());
    try {
        PipelineRecord record = execute(unit, repo, token);
        unregister_token(unit.id, token);
        return record;
    } catch (const std::exception&) {
        unregister_token(unit.id, token);
        throw;
    }
}

PipelineHandle PipelineOrchestrator::start_pipeline(const UnitOfWork& unit, const RepositoryId& repo) {
    if (unit.id.empty()) {
        throw std::invalid_argument("Unit of work must have an id");
    }

    CancellationToken token = register_token(unit.id, CancellationToken());
    auto promise = std::make_shared<std::promise<PipelineRecord>>();
    PipelineHandle handle{unit.id, token, promise->get_future().share()};

    try {
        jobs_.submit_function([this, unit, repo, token, promise] {
            try {
                PipelineRecord record = execute(unit, repo, token);
                unregister_token(unit.id, token);
                promise->set_value(std::move(record));
            } catch (...) {
                unregister_token(unit.id, token);
                promise->set_exception(std::current_exception());
                throw;  // Classified and logged by the job system
            }
        });
    } catch (const std::exception&) {
        unregister_token(unit.id, token);
        throw;
    }

    return handle;
}

bool PipelineOrchestrator::cancel(const UnitId& unit_id) {
    bool cancelled = false;
    store_.update(unit_id, [&cancelled](PipelineRecord& record) {
        if (!is_terminal(record.status)) {
            transition(record, UnitStatus::Cancelled);
            cancelled = true;
        }
    });

    {
        std::lock_guard<std::mutex> lock(tokens_mutex_);
        auto it = tokens_.find(unit_id);
        if (it != tokens_.end()) {
            it->second.cancel();
            cancelled = true;
        }
    }

    if (cancelled) {
        CONFLUX_LOG_INFO("Cancellation requested for %s", unit_id.c_str());
    }
    return cancelled;
}

bool PipelineOrchestrator::wait_for_pipelines(const std::function<bool()>& abort_check) {
    return jobs_.wait_for_completion_with_abort(abort_check, config_.poll_interval);
}

BatchResult PipelineOrchestrator::run_batch(const std::vector<UnitOfWork>& units, const RepositoryId& repo,
                                            const ResolutionOptions& options) {
    BatchResult result;
    result.prevention = reservations_.engine().prevent_overlaps(units, options);
    if (!result.prevention.safe) {
        CONFLUX_LOG_WARN("Batch has %zu overlaps that require review; running it unchanged",
                         result.prevention.analysis.overlaps.size());
    }

    const std::vector<UnitOfWork>& batch = result.prevention.units;
    DependencyPlanner planner(reservations_.config().max_parallel_group_size);
    result.plan = planner.validate_and_order(batch);

    CONFLUX_LOG_INFO("Batch planned: %zu units in %zu groups (%u min sequential, %u min parallel)",
                     result.plan.order.size(), result.plan.groups.size(),
                     result.plan.sequential_minutes, result.plan.parallel_minutes);

    std::map<UnitId, const UnitOfWork*> by_id;
    for (const auto& unit : batch) {
        by_id.emplace(unit.id, &unit);
    }

    std::map<UnitId, PipelineRecord> outcomes;
    for (const auto& group : result.plan.groups) {
        std::vector<PipelineHandle> running;
        running.reserve(group.size());

        for (const auto& id : group) {
            const UnitOfWork& unit = *by_id.at(id);

            std::optional<UnitId> blocker;
            for (const auto& dependency : unit.dependencies) {
                auto outcome = outcomes.find(dependency);
                if (outcome != outcomes.end() && outcome->second.status != UnitStatus::Completed) {
                    blocker = dependency;
                    break;
                }
            }

            if (blocker) {
                std::optional<PipelineRecord> existing = store_.load(id);
                PipelineRecord record = existing ? *existing : PipelineRecord::create(unit, repo, config_.stages);
                if (!is_terminal(record.status)) {
                    transition(record, UnitStatus::Cancelled);
                    record.error = "Dependency " + *blocker + " did not complete";
                    store_.save(record);
                }
                CONFLUX_LOG_WARN("Skipping %s: dependency %s is %s", id.c_str(), blocker->c_str(),
                                 to_string(outcomes.at(*blocker).status));
                outcomes[id] = std::move(record);
                continue;
            }

            try {
                running.push_back(start_pipeline(unit, repo));
            } catch (const std::exception& e) {
                CONFLUX_LOG_ERROR("Batch aborted at %s: %s; waiting for %zu started pipeline(s)", id.c_str(),
                                  e.what(), running.size());
                for (auto& handle : running) {
                    handle.result.wait();
                }
                throw;
            }
        }

        for (auto& handle : running) {
            outcomes[handle.unit_id] = handle.result.get();
        }
    }

    result.records.reserve(result.plan.order.size());
    for (const auto& id : result.plan.order) {
        result.records.push_back(outcomes.at(id));
    }
    return result;
}

} // namespace conflux
