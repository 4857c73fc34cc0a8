#ifndef CONFLUX_DEPENDENCY_PLANNER_HPP
#define CONFLUX_DEPENDENCY_PLANNER_HPP

#include <conflux/errors.hpp>
#include <conflux/types.hpp>
#include <map>
#include <vector>

namespace conflux {

/**
 * Topologically valid order of a batch plus its partition into parallel groups.
 * Groups run one after another; units inside a group are mutually independent.
 */
struct ExecutionPlan {
    std::vector<UnitId> order;
    std::vector<std::vector<UnitId>> groups;

    std::uint32_t sequential_minutes = 0;   // Sum of unit estimates
    std::uint32_t parallel_minutes = 0;     // Sum over groups of the longest unit

    // Declared dependencies that point outside the batch; ignored for ordering.
    std::map<UnitId, std::vector<UnitId>> external_dependencies;

    // Index of the group containing id, or groups.size() if absent.
    std::size_t group_of(const UnitId& id) const;
};

class DependencyPlanner {
private:
    std::size_t max_group_size_;

public:
    explicit DependencyPlanner(std::size_t max_group_size = 3);

    /**
     * Kahn's algorithm over the declared in-batch dependencies. Every unit appears
     * after all of its dependencies. Grouping is greedy over that order: a unit joins
     * the running group unless the group is full or the unit depends on a member.
     *
     * Throws CycleError naming every unit that could not be ordered, and
     * std::invalid_argument for empty or duplicate ids.
     */
    ExecutionPlan validate_and_order(const std::vector<UnitOfWork>& units) const;

    // Every elementary cycle reachable by depth-first search, in discovery order.
    // Each cycle lists its units in dependency order and is not closed.
    static std::vector<std::vector<UnitId>> find_cycles(const std::vector<UnitOfWork>& units);

    // True when making `dependent` wait for `prerequisite` would close a cycle.
    static bool would_create_cycle(const std::vector<UnitOfWork>& units,
                                   const UnitId& dependent, const UnitId& prerequisite);

    std::size_t max_group_size() const { return max_group_size_; }
};

} // namespace conflux

#endif // CONFLUX_DEPENDENCY_PLANNER_HPP
