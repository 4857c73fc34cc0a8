#include <conflux/compatibility.hpp>
#include <conflux/clock.hpp>
#include <algorithm>
#include <cmath>

namespace conflux {

namespace {

void push_unique(std::vector<UnitId>& ids, const UnitId& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
}

Severity file_overlap_severity(std::size_t shared_files) {
    if (shared_files > 3) return Severity::High;
    if (shared_files > 1) return Severity::Medium;
    return Severity::Low;
}

std::string describe(ConflictCategory category, const AgentType& agent_type) {
    switch (category) {
        case ConflictCategory::FileOverlap: return "Tasks modify overlapping files";
        case ConflictCategory::DependencyConflict: return "Task depends on incomplete tasks";
        case ConflictCategory::ModuleOverlap: return "Tasks affect same business modules";
        case ConflictCategory::AgentBusy: return "Agent " + agent_type + " already working";
        case ConflictCategory::ConceptualConflict: return "Tasks describe the same feature";
    }
    return "Conflict";
}

CompatibilityResult incompatible(ConflictCategory category, std::vector<Conflict> conflicts,
                                 const AgentType& agent_type) {
    CompatibilityResult result;
    result.compatible = false;
    result.category = category;
    result.reason = describe(category, agent_type);
    result.conflicts = std::move(conflicts);
    return result;
}

} // namespace

std::vector<UnitId> Conflict::unit_ids() const {
    std::vector<UnitId> ids;
    for (const auto& unit : units) push_unique(ids, unit.id);
    return ids;
}

Severity CompatibilityResult::severity() const {
    Severity highest = Severity::Low;
    for (const auto& conflict : conflicts) {
        highest = escalate(highest, conflict.severity);
    }
    return highest;
}

std::vector<UnitId> CompatibilityResult::conflicting_unit_ids() const {
    std::vector<UnitId> ids;
    for (const auto& conflict : conflicts) {
        for (const auto& unit : conflict.units) push_unique(ids, unit.id);
    }
    return ids;
}

std::vector<std::string> CompatibilityResult::contested_files() const {
    std::vector<std::string> files;
    for (const auto& conflict : conflicts) {
        if (conflict.category != ConflictCategory::FileOverlap) continue;
        for (const auto& file : conflict.files) {
            if (std::find(files.begin(), files.end(), file) == files.end()) files.push_back(file);
        }
    }
    return files;
}

ConflictError::ConflictError(CompatibilityResult result)
    : std::runtime_error(std::string("Task conflict detected: ") +
                         (result.category ? to_string(*result.category) : "unknown") + " - " +
                         result.reason)
    , result_(std::move(result)) {}

std::vector<Conflict> CompatibilityChecker::check_files(const UnitOfWork& unit, const TaskContext& context,
                                                        const RepositoryState& state) const {
    std::vector<Conflict> conflicts;

    for (const auto& file : context.affected_files) {
        auto usage = state.file_usage.find(file);
        if (usage == state.file_usage.end()) continue;

        Conflict conflict;
        conflict.category = ConflictCategory::FileOverlap;
        conflict.files.push_back(file);
        for (const auto& holder_id : usage->second) {
            if (holder_id == unit.id) continue;
            auto holder = state.active_units.find(holder_id);
            if (holder != state.active_units.end()) {
                conflict.units.push_back(holder->second.unit);
            }
        }
        if (!conflict.units.empty()) {
            conflict.detail = "File " + file + " is claimed by another active task";
            conflicts.push_back(std::move(conflict));
        }
    }

    // Severity follows how many files the candidate shares with each holder,
    // escalated to high when the pair also shares a business module.
    for (auto& conflict : conflicts) {
        for (const auto& holder : conflict.units) {
            const auto& holder_context = state.active_units.at(holder.id).context;
            std::size_t shared = 0;
            for (const auto& file : context.affected_files) {
                if (holder_context.affected_files.count(file)) ++shared;
            }
            conflict.severity = escalate(conflict.severity, file_overlap_severity(shared));

            for (const auto& module : context.affected_modules) {
                if (holder_context.affected_modules.count(module)) {
                    conflict.severity = escalate(conflict.severity, Severity::High);
                    break;
                }
            }
        }
    }
    return conflicts;
}

std::vector<Conflict> CompatibilityChecker::check_dependencies(const UnitOfWork& unit, const TaskContext& context,
                                                               const RepositoryState& state) const {
    std::vector<Conflict> conflicts;

    for (const auto& dependency_id : context.dependencies) {
        if (dependency_id == unit.id) continue;
        auto active = state.active_units.find(dependency_id);
        if (active == state.active_units.end()) continue;
        if (active->second.unit.status == UnitStatus::Completed) continue;

        Conflict conflict;
        conflict.category = ConflictCategory::DependencyConflict;
        conflict.severity = Severity::High;
        conflict.units.push_back(active->second.unit);
        conflict.dependency_status = active->second.unit.status;
        conflict.detail = "Depends on " + dependency_id + " (" + to_string(active->second.unit.status) + ")";
        conflicts.push_back(std::move(conflict));
    }
    return conflicts;
}

std::vector<Conflict> CompatibilityChecker::check_modules(const UnitOfWork& unit, const TaskContext& context,
                                                          const RepositoryState& state) const {
    std::vector<Conflict> conflicts;

    for (const auto& [active_id, active] : state.active_units) {
        if (active_id == unit.id) continue;

        std::vector<std::string> shared;
        for (const auto& module : context.affected_modules) {
            if (active.context.affected_modules.count(module)) shared.push_back(module);
        }
        if (shared.empty()) continue;

        Conflict conflict;
        conflict.category = ConflictCategory::ModuleOverlap;
        conflict.severity = Severity::High;
        conflict.units.push_back(active.unit);
        conflict.modules = std::move(shared);
        conflict.detail = "Shares business modules with " + active_id;
        conflicts.push_back(std::move(conflict));
    }
    return conflicts;
}

std::optional<Conflict> CompatibilityChecker::check_agent_capacity(const AgentType& agent_type,
                                                                   const RepositoryState& state,
                                                                   TimePoint now) const {
    auto branch = state.branch_by_agent.find(agent_type);
    if (branch == state.branch_by_agent.end()) return std::nullopt;

    const Reservation& holder = state.reservations.at(branch->second);

    Conflict conflict;
    conflict.category = ConflictCategory::AgentBusy;
    conflict.severity = Severity::Medium;
    conflict.units.push_back(holder.unit);
    conflict.agent_type = agent_type;
    conflict.estimated_wait_minutes = remaining_minutes(holder, now);
    conflict.detail = "Agent " + agent_type + " already working on: " + holder.unit.title;
    return conflict;
}

CompatibilityResult CompatibilityChecker::check(const UnitOfWork& unit, const AgentType& agent_type,
                                                const RepositoryState& state, TimePoint now) const {
    TaskContext context = extractor_.extract(unit);

    auto file_conflicts = check_files(unit, context, state);
    if (!file_conflicts.empty()) {
        return incompatible(ConflictCategory::FileOverlap, std::move(file_conflicts), agent_type);
    }

    auto dependency_conflicts = check_dependencies(unit, context, state);
    if (!dependency_conflicts.empty()) {
        return incompatible(ConflictCategory::DependencyConflict, std::move(dependency_conflicts), agent_type);
    }

    auto module_conflicts = check_modules(unit, context, state);
    if (!module_conflicts.empty()) {
        return incompatible(ConflictCategory::ModuleOverlap, std::move(module_conflicts), agent_type);
    }

    auto agent_conflict = check_agent_capacity(agent_type, state, now);
    if (agent_conflict && agent_conflict->units.front().id != unit.id) {
        std::vector<Conflict> conflicts;
        conflicts.push_back(std::move(*agent_conflict));
        return incompatible(ConflictCategory::AgentBusy, std::move(conflicts), agent_type);
    }

    return CompatibilityResult{};
}

std::uint32_t CompatibilityChecker::remaining_minutes(const Reservation& reservation, TimePoint now) const {
    double base = static_cast<double>(catalog_.base_minutes_of(reservation.agent_type));
    double elapsed = minutes_between(reservation.created_at, now);
    return static_cast<std::uint32_t>(std::ceil(std::max(0.0, base - elapsed)));
}

} // namespace conflux
