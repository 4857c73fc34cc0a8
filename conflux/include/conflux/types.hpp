#ifndef CONFLUX_TYPES_HPP
#define CONFLUX_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace conflux {

using UnitId = std::string;
using AgentType = std::string;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * Complexity tier of a unit of work. Ordered: simple < moderate < complex < expert.
 */
enum class Complexity : std::uint8_t {
    Simple = 0,
    Moderate,
    Complex,
    Expert
};

/**
 * Declared business priority of a unit of work.
 */
enum class PriorityTier : std::uint8_t {
    Low = 0,
    Medium,
    High,
    Critical
};

/**
 * Lifecycle of a unit of work and of a whole pipeline run.
 */
enum class UnitStatus : std::uint8_t {
    Pending = 0,
    InProgress,
    Completed,
    Failed,
    Cancelled
};

enum class ConflictCategory : std::uint8_t {
    FileOverlap = 0,
    ModuleOverlap,
    DependencyConflict,
    AgentBusy,
    ConceptualConflict
};

enum class Severity : std::uint8_t {
    Low = 0,
    Medium,
    High,
    Critical
};

/**
 * Remedy chosen for a detected conflict. Closed set: every handler in the
 * resolution engine switches over it exhaustively.
 */
enum class ResolutionStrategy : std::uint8_t {
    NoConflict = 0,
    SequenceAfterConflicts,
    SplitTask,
    PreemptLowerPriority,
    IntelligentQueue,
    LayerSeparation,
    MergeRelatedTasks,
    SequentialWithInterface,
    ResolveCircularDependencies,
    WaitForDependencies,
    ParallelExecution,
    ReassignToAvailableAgent,
    SplitForAgentCapacity,
    WorkloadBalancedQueue,
    MergeConceptualTasks,
    CoordinateRelatedFeatures,
    ManualIntervention
};

const char* to_string(Complexity complexity);
const char* to_string(PriorityTier tier);
const char* to_string(UnitStatus status);
const char* to_string(ConflictCategory category);
const char* to_string(Severity severity);
const char* to_string(ResolutionStrategy strategy);

// Parsers accept the lower-case labels produced by to_string and throw
// std::invalid_argument for anything else.
Complexity parse_complexity(const std::string& label);
PriorityTier parse_priority_tier(const std::string& label);
UnitStatus parse_unit_status(const std::string& label);
ConflictCategory parse_conflict_category(const std::string& label);

inline bool is_terminal(UnitStatus status) {
    return status == UnitStatus::Completed || status == UnitStatus::Failed ||
           status == UnitStatus::Cancelled;
}

inline Severity escalate(Severity current, Severity incoming) {
    return incoming > current ? incoming : current;
}

/**
 * Repository identity (owner + name). Printed as "owner/name".
 */
struct RepositoryId {
    std::string owner;
    std::string name;

    RepositoryId() = default;
    RepositoryId(std::string owner_, std::string name_)
        : owner(std::move(owner_)), name(std::move(name_)) {}

    std::string to_string() const { return owner + "/" + name; }

    bool operator==(const RepositoryId& other) const {
        return owner == other.owner && name == other.name;
    }
    bool operator!=(const RepositoryId& other) const { return !(*this == other); }
    bool operator<(const RepositoryId& other) const {
        return owner != other.owner ? owner < other.owner : name < other.name;
    }

    // Parse "owner/name"; throws std::invalid_argument on malformed ids.
    static RepositoryId parse(const std::string& id);
};

/**
 * The schedulable item routed through the pipeline.
 */
struct UnitOfWork {
    UnitId id;
    std::string title;
    std::string description;
    std::string type = "feature";               // feature, bug, enhancement, testing, documentation, security, ...
    Complexity complexity = Complexity::Moderate;
    PriorityTier priority = PriorityTier::Medium;
    std::vector<UnitId> dependencies;            // Must complete before this unit
    std::vector<UnitId> blocks;                  // Units waiting on this one
    std::vector<std::string> files;              // Explicitly declared file paths
    AgentType assigned_agent;
    UnitStatus status = UnitStatus::Pending;
    std::optional<TimePoint> deadline;

    std::optional<UnitId> parent_id;             // Set on units produced by a split
    std::vector<UnitId> merged_from;             // Set on units produced by a merge

    bool depends_on(const UnitId& other) const;
    bool is_blocking(const UnitId& other) const;
};

/**
 * Derived structural fingerprint of a unit of work, used only for conflict prediction.
 */
struct TaskContext {
    UnitId unit_id;
    std::set<std::string> affected_files;
    std::set<std::string> affected_modules;
    std::vector<UnitId> dependencies;
    std::vector<UnitId> blocking;
    std::uint32_t estimated_minutes = 0;
};

} // namespace conflux

#endif // CONFLUX_TYPES_HPP
