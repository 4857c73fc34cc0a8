#include <conflux/pipeline.hpp>
#include <conflux/errors.hpp>

namespace conflux {

std::vector<StageDefinition> PipelineConfig::default_stages() {
    return {
        {"product-manager", false},
        {"project-manager", false},
        {"tech-lead", false},
        {"senior-developer", true},
        {"junior-developer", true},
        {"qa-engineer", true}
    };
}

PipelineRecord PipelineRecord::create(const UnitOfWork& unit, const RepositoryId& repo,
                                      const std::vector<StageDefinition>& stages) {
    PipelineRecord record;
    record.unit = unit;
    record.unit.status = UnitStatus::Pending;
    record.repo = repo;
    record.stages.reserve(stages.size());
    for (const auto& definition : stages) {
        StageRecord stage;
        stage.agent_type = definition.agent_type;
        stage.mutates_code = definition.mutates_code;
        record.stages.push_back(std::move(stage));
    }
    return record;
}

const StageRecord* PipelineRecord::find_stage(const AgentType& agent_type) const {
    for (const auto& stage : stages) {
        if (stage.agent_type == agent_type) return &stage;
    }
    return nullptr;
}

bool can_transition(UnitStatus from, UnitStatus to) {
    switch (from) {
        case UnitStatus::Pending:
            return to == UnitStatus::InProgress || to == UnitStatus::Cancelled;
        case UnitStatus::InProgress:
            return to == UnitStatus::Completed || to == UnitStatus::Failed || to == UnitStatus::Cancelled;
        case UnitStatus::Completed:
        case UnitStatus::Failed:
        case UnitStatus::Cancelled:
            return false;
    }
    return false;
}

bool can_transition_stage(UnitStatus from, UnitStatus to) {
    switch (from) {
        case UnitStatus::Pending:
            return to == UnitStatus::InProgress;
        case UnitStatus::InProgress:
            return to == UnitStatus::Completed || to == UnitStatus::Failed;
        case UnitStatus::Completed:
        case UnitStatus::Failed:
        case UnitStatus::Cancelled:
            return false;
    }
    return false;
}

void transition(PipelineRecord& record, UnitStatus next) {
    if (!can_transition(record.status, next)) {
        throw InvalidTransition(std::string("Pipeline for ") + record.unit.id + " cannot move from " +
                                to_string(record.status) + " to " + to_string(next));
    }
    record.status = next;
    record.unit.status = next;
}

void transition(StageRecord& stage, UnitStatus next) {
    if (!can_transition_stage(stage.status, next)) {
        throw InvalidTransition(std::string("Stage ") + stage.agent_type + " cannot move from " +
                                to_string(stage.status) + " to " + to_string(next));
    }
    stage.status = next;
}

std::optional<PipelineRecord> InMemoryUnitStore::load(const UnitId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void InMemoryUnitStore::save(const PipelineRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.unit.id] = record;
}

bool InMemoryUnitStore::update(const UnitId& id, const std::function<void(PipelineRecord&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    mutate(it->second);
    return true;
}

std::size_t InMemoryUnitStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace conflux
