#ifndef CONFLUX_COMPATIBILITY_HPP
#define CONFLUX_COMPATIBILITY_HPP

#include <conflux/config.hpp>
#include <conflux/repository_state.hpp>
#include <conflux/task_context.hpp>
#include <conflux/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace conflux {

/**
 * One detected conflict between a candidate unit and the units active on a repository.
 * Only the fields relevant to the category are filled in.
 */
struct Conflict {
    ConflictCategory category = ConflictCategory::FileOverlap;
    Severity severity = Severity::Low;

    std::vector<UnitOfWork> units;            // Offending units
    std::vector<std::string> files;           // file_overlap: contested file
    std::vector<std::string> modules;         // module_overlap: shared modules
    UnitStatus dependency_status = UnitStatus::Pending;  // dependency_conflict
    AgentType agent_type;                     // agent_busy: the busy agent
    std::uint32_t estimated_wait_minutes = 0; // agent_busy: remaining time of the holder
    std::string detail;

    std::vector<UnitId> unit_ids() const;
};

struct CompatibilityResult {
    bool compatible = true;
    std::optional<ConflictCategory> category;
    std::string reason;
    std::vector<Conflict> conflicts;

    // Highest severity over all conflicts; Low when compatible.
    Severity severity() const;

    // Ids of every unit referenced by a conflict, first-seen order, no duplicates.
    std::vector<UnitId> conflicting_unit_ids() const;

    // Every file named by a file_overlap conflict.
    std::vector<std::string> contested_files() const;
};

/**
 * Raised by ReservationManager::reserve_branch when a unit cannot run now.
 * The caller is expected to hand result() to the resolution engine.
 */
class ConflictError : public std::runtime_error {
private:
    CompatibilityResult result_;

public:
    explicit ConflictError(CompatibilityResult result);

    const CompatibilityResult& result() const { return result_; }
    ConflictCategory category() const { return *result_.category; }
};

/**
 * Decides whether a unit can start on a repository given the units already active there.
 * Checks in precedence order file -> dependency -> module -> agent capacity and reports
 * the first category that triggers. The unit's own active entry, if any, is ignored.
 *
 * Callers must hold the repository's lock for the duration of the check.
 */
class CompatibilityChecker {
private:
    const TaskContextExtractor& extractor_;
    const AgentCatalog& catalog_;

    std::vector<Conflict> check_files(const UnitOfWork& unit, const TaskContext& context,
                                      const RepositoryState& state) const;
    std::vector<Conflict> check_dependencies(const UnitOfWork& unit, const TaskContext& context,
                                             const RepositoryState& state) const;
    std::vector<Conflict> check_modules(const UnitOfWork& unit, const TaskContext& context,
                                        const RepositoryState& state) const;
    std::optional<Conflict> check_agent_capacity(const AgentType& agent_type,
                                                 const RepositoryState& state, TimePoint now) const;

public:
    CompatibilityChecker(const TaskContextExtractor& extractor, const AgentCatalog& catalog)
        : extractor_(extractor), catalog_(catalog) {}

    CompatibilityResult check(const UnitOfWork& unit, const AgentType& agent_type,
                              const RepositoryState& state, TimePoint now) const;

    // Minutes the holder of a reservation is still expected to need:
    // ceil(max(0, base minutes of its agent type - age)).
    std::uint32_t remaining_minutes(const Reservation& reservation, TimePoint now) const;
};

} // namespace conflux

#endif // CONFLUX_COMPATIBILITY_HPP
