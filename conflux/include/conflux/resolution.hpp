#ifndef CONFLUX_RESOLUTION_HPP
#define CONFLUX_RESOLUTION_HPP

#include <conflux/clock.hpp>
#include <conflux/compatibility.hpp>
#include <conflux/config.hpp>
#include <conflux/overlap_analysis.hpp>
#include <conflux/repository_state.hpp>
#include <conflux/task_context.hpp>
#include <conflux/types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace conflux {

/**
 * Interface contract placeholder between two units sharing a module.
 */
struct ModuleInterface {
    std::string module;
    std::string first_interface;
    std::string second_interface;
    std::vector<std::string> coordination_points;
};

/**
 * Outcome of resolving one conflict. Only the payload fields of the chosen
 * strategy are filled in.
 */
struct Resolution {
    bool resolved = false;
    ResolutionStrategy strategy = ResolutionStrategy::ManualIntervention;
    std::optional<ConflictCategory> category;
    std::string summary;

    UnitOfWork unit;                                   // Candidate as it should now be scheduled

    std::vector<UnitId> added_dependencies;            // sequence_after_conflicts
    std::vector<UnitOfWork> sub_units;                 // split_task, split_for_agent_capacity
    std::vector<UnitId> preempted_units;               // preempt_lower_priority
    std::optional<AgentType> reassigned_agent;         // reassign_to_available_agent
    std::optional<UnitOfWork> merged_unit;             // merge_related_tasks, merge_conceptual_tasks
    std::uint32_t estimated_wait_minutes = 0;          // queues and waits
    std::size_t queue_position = 0;

    std::map<UnitId, std::set<std::string>> layers;    // layer_separation
    std::vector<UnitId> execution_order;               // sequential_with_interface, resolve_circular_dependencies
    std::vector<ModuleInterface> interfaces;           // sequential_with_interface

    std::vector<std::vector<UnitId>> cycles;           // resolve_circular_dependencies
    std::vector<std::pair<UnitId, UnitId>> demoted_edges;   // (dependent, prerequisite)
    std::vector<UnitOfWork> restructured_units;
    std::vector<UnitId> waiting_for;                   // wait_for_dependencies
    std::vector<UnitId> parallel_units;                // parallel_execution

    std::optional<UnitId> lead_unit;                   // coordinate_related_features
    std::vector<std::string> shared_components;
    std::vector<std::string> integration_points;

    std::string fallback_suggestion;                   // Unresolved only
    std::vector<std::string> fallback_options;
};

enum class OverlapAction : std::uint8_t {
    AddDependency = 0,
    MergeUnits,
    CoordinateModules
};

const char* to_string(OverlapAction action);

struct AppliedOverlapResolution {
    OverlapAction action = OverlapAction::AddDependency;
    UnitId first;
    UnitId second;
    UnitId dependent;                       // AddDependency
    UnitId prerequisite;
    std::optional<UnitOfWork> merged_unit;  // MergeUnits
    std::vector<ModuleInterface> interfaces;  // CoordinateModules
    std::string reason;
};

struct OverlapPrevention {
    bool safe = true;
    bool modified = false;
    bool requires_review = false;
    std::vector<UnitOfWork> units;
    std::vector<AppliedOverlapResolution> resolutions;
    OverlapReport analysis;
};

/**
 * Picks and applies a remedy for a conflict reported by the CompatibilityChecker.
 * One handler per category, each trying its strategies in a fixed order. Never
 * mutates repository state; callers apply the returned Resolution.
 */
class ConflictResolutionEngine {
private:
    const TaskContextExtractor& extractor_;
    const AgentCatalog& catalog_;
    SchedulerConfig config_;
    std::shared_ptr<TimeSource> clock_;

    Resolution resolve_file_overlap(const UnitOfWork& unit, const RepositoryState& state,
                                    const std::vector<Conflict>& conflicts,
                                    const ResolutionOptions& options) const;
    Resolution resolve_module_overlap(const UnitOfWork& unit, const RepositoryState& state,
                                      const std::vector<Conflict>& conflicts,
                                      const ResolutionOptions& options) const;
    Resolution resolve_dependency_conflict(const UnitOfWork& unit, const RepositoryState& state,
                                           const std::vector<Conflict>& conflicts) const;
    Resolution resolve_agent_busy(const UnitOfWork& unit, const RepositoryState& state,
                                  const std::vector<Conflict>& conflicts,
                                  const ResolutionOptions& options) const;
    Resolution resolve_conceptual_conflict(const UnitOfWork& unit, const RepositoryState& state,
                                           const std::vector<Conflict>& conflicts,
                                           const ResolutionOptions& options) const;

    // Estimated minutes until an active unit finishes; full estimate if not active.
    std::uint32_t remaining_minutes(const UnitOfWork& unit, const RepositoryState& state) const;

    std::size_t queue_position(const AgentType& agent_type, const RepositoryState& state) const;

    // Active units with `replacements` swapped in (by id) and `removed` dropped.
    std::vector<UnitOfWork> dependency_graph(const RepositoryState& state,
                                             const std::vector<UnitOfWork>& replacements,
                                             const std::vector<UnitId>& removed = {}) const;

public:
    ConflictResolutionEngine(const TaskContextExtractor& extractor, const AgentCatalog& catalog,
                             SchedulerConfig config = {},
                             std::shared_ptr<TimeSource> clock = default_time_source());

    /**
     * Resolve `category` for `unit` against the given conflicts on the repository
     * described by `state`. Returns an unresolved Resolution with fallback options when
     * no strategy applies. The caller must hold the repository lock.
     */
    Resolution resolve(const UnitOfWork& unit, const RepositoryState& state,
                       ConflictCategory category, const std::vector<Conflict>& conflicts,
                       const ResolutionOptions& options = {}) const;

    // Convenience overload for a failed compatibility check.
    Resolution resolve(const UnitOfWork& unit, const RepositoryState& state,
                       const CompatibilityResult& compatibility,
                       const ResolutionOptions& options = {}) const;

    /**
     * Analyze a batch for overlaps and, when auto_resolve is set, rewrite it:
     * file overlaps become dependency edges (lower priority waits, ties keep batch order),
     * high-severity conceptual overlaps are merged when allowed, module overlaps get an
     * interface coordination plan. Edges that would close a cycle are never added.
     */
    OverlapPrevention prevent_overlaps(const std::vector<UnitOfWork>& units,
                                       const ResolutionOptions& options = {}) const;

    static std::string fallback_suggestion(ConflictCategory category);
    static std::vector<std::string> fallback_options();
};

} // namespace conflux

#endif // CONFLUX_RESOLUTION_HPP
