#ifndef CONFLUX_PRIORITY_HPP
#define CONFLUX_PRIORITY_HPP

#include <conflux/config.hpp>
#include <conflux/types.hpp>

namespace conflux {

/**
 * Priority score in [0, 100] used to decide preemption and batch sequencing.
 *
 * Starts at 50 and is adjusted by:
 *   declared tier   critical +40, high +20, medium 0, low -20
 *   complexity      simple -10, moderate 0, complex +10, expert +20
 *   type            security +40, bug +30, feature 0, enhancement -10, documentation -20
 *   deadline        < 1 day +30, < 3 days +20, < 7 days +10 (measured from now)
 *   blocking        +5 per unit this one blocks
 */
int calculate_priority(const UnitOfWork& unit, TimePoint now);

Complexity escalate_complexity(Complexity a, Complexity b);
PriorityTier escalate_priority(PriorityTier a, PriorityTier b);

// Agent with the higher capability rank; ties keep the first unit's agent.
AgentType select_agent_for_merge(const UnitOfWork& a, const UnitOfWork& b, const AgentCatalog& catalog);

/**
 * Combine two units into one. The result is identified as "merged_<a>_<b>",
 * keeps links to both originals in merged_from, and takes the union of their
 * files, dependencies and blocked units (references to either original dropped).
 */
UnitOfWork make_merged_unit(const UnitOfWork& a, const UnitOfWork& b, const AgentCatalog& catalog);

} // namespace conflux

#endif // CONFLUX_PRIORITY_HPP
