#ifndef CONFLUX_ERRORS_HPP
#define CONFLUX_ERRORS_HPP

#include <conflux/types.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace conflux {

/**
 * Dependency cycle detected while planning a batch.
 * Carries every unit that could not be placed in topological order.
 */
class CycleError : public std::runtime_error {
private:
    std::vector<UnitId> nodes_;

public:
    explicit CycleError(std::vector<UnitId> nodes);

    const std::vector<UnitId>& nodes() const { return nodes_; }
};

/**
 * The external executor failed a pipeline stage.
 */
class StageExecutionError : public std::runtime_error {
private:
    AgentType agent_type_;

public:
    StageExecutionError(const AgentType& agent_type, const std::string& message)
        : std::runtime_error(agent_type + " stage failed: " + message)
        , agent_type_(agent_type) {}

    const AgentType& agent_type() const { return agent_type_; }
};

/**
 * Cooperative abort observed at a cancellation point.
 */
class AbortedError : public std::runtime_error {
public:
    AbortedError() : std::runtime_error("Operation aborted") {}
};

/**
 * Attempt to move a pipeline or stage out of a terminal state, or to skip a state.
 */
class InvalidTransition : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace conflux

#endif // CONFLUX_ERRORS_HPP
