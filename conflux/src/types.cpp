#include <conflux/types.hpp>
#include <algorithm>
#include <stdexcept>

namespace conflux {

const char* to_string(Complexity complexity) {
    switch (complexity) {
        case Complexity::Simple: return "simple";
        case Complexity::Moderate: return "moderate";
        case Complexity::Complex: return "complex";
        case Complexity::Expert: return "expert";
    }
    return "unknown";
}

const char* to_string(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Low: return "low";
        case PriorityTier::Medium: return "medium";
        case PriorityTier::High: return "high";
        case PriorityTier::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(UnitStatus status) {
    switch (status) {
        case UnitStatus::Pending: return "pending";
        case UnitStatus::InProgress: return "in-progress";
        case UnitStatus::Completed: return "completed";
        case UnitStatus::Failed: return "failed";
        case UnitStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(ConflictCategory category) {
    switch (category) {
        case ConflictCategory::FileOverlap: return "file_overlap";
        case ConflictCategory::ModuleOverlap: return "module_overlap";
        case ConflictCategory::DependencyConflict: return "dependency_conflict";
        case ConflictCategory::AgentBusy: return "agent_busy";
        case ConflictCategory::ConceptualConflict: return "conceptual_conflict";
    }
    return "unknown";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::NoConflict: return "no_conflict";
        case ResolutionStrategy::SequenceAfterConflicts: return "sequence_after_conflicts";
        case ResolutionStrategy::SplitTask: return "split_task";
        case ResolutionStrategy::PreemptLowerPriority: return "preempt_lower_priority";
        case ResolutionStrategy::IntelligentQueue: return "intelligent_queue";
        case ResolutionStrategy::LayerSeparation: return "layer_separation";
        case ResolutionStrategy::MergeRelatedTasks: return "merge_related_tasks";
        case ResolutionStrategy::SequentialWithInterface: return "sequential_with_interface";
        case ResolutionStrategy::ResolveCircularDependencies: return "resolve_circular_dependencies";
        case ResolutionStrategy::WaitForDependencies: return "wait_for_dependencies";
        case ResolutionStrategy::ParallelExecution: return "parallel_execution";
        case ResolutionStrategy::ReassignToAvailableAgent: return "reassign_to_available_agent";
        case ResolutionStrategy::SplitForAgentCapacity: return "split_for_agent_capacity";
        case ResolutionStrategy::WorkloadBalancedQueue: return "workload_balanced_queue";
        case ResolutionStrategy::MergeConceptualTasks: return "merge_conceptual_tasks";
        case ResolutionStrategy::CoordinateRelatedFeatures: return "coordinate_related_features";
        case ResolutionStrategy::ManualIntervention: return "manual_intervention";
    }
    return "unknown";
}

Complexity parse_complexity(const std::string& label) {
    if (label == "simple") return Complexity::Simple;
    if (label == "moderate") return Complexity::Moderate;
    if (label == "complex") return Complexity::Complex;
    if (label == "expert") return Complexity::Expert;
    throw std::invalid_argument("Unknown complexity tier: " + label);
}

PriorityTier parse_priority_tier(const std::string& label) {
    if (label == "low") return PriorityTier::Low;
    if (label == "medium") return PriorityTier::Medium;
    if (label == "high") return PriorityTier::High;
    if (label == "critical") return PriorityTier::Critical;
    throw std::invalid_argument("Unknown priority tier: " + label);
}

UnitStatus parse_unit_status(const std::string& label) {
    if (label == "pending") return UnitStatus::Pending;
    if (label == "in-progress") return UnitStatus::InProgress;
    if (label == "completed") return UnitStatus::Completed;
    if (label == "failed") return UnitStatus::Failed;
    if (label == "cancelled") return UnitStatus::Cancelled;
    throw std::invalid_argument("Unknown unit status: " + label);
}

ConflictCategory parse_conflict_category(const std::string& label) {
    if (label == "file_overlap") return ConflictCategory::FileOverlap;
    if (label == "module_overlap") return ConflictCategory::ModuleOverlap;
    if (label == "dependency_conflict") return ConflictCategory::DependencyConflict;
    if (label == "agent_busy") return ConflictCategory::AgentBusy;
    if (label == "conceptual_conflict") return ConflictCategory::ConceptualConflict;
    throw std::invalid_argument("Unknown conflict category: " + label);
}

RepositoryId RepositoryId::parse(const std::string& id) {
    auto slash = id.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= id.size() ||
        id.find('/', slash + 1) != std::string::npos) {
        throw std::invalid_argument("Repository id must be owner/name: " + id);
    }
    return RepositoryId(id.substr(0, slash), id.substr(slash + 1));
}

bool UnitOfWork::depends_on(const UnitId& other) const {
    return std::find(dependencies.begin(), dependencies.end(), other) != dependencies.end();
}

bool UnitOfWork::is_blocking(const UnitId& other) const {
    return std::find(blocks.begin(), blocks.end(), other) != blocks.end();
}

} // namespace conflux
