#include <conflux/priority.hpp>
#include <algorithm>
#include <chrono>

namespace conflux {

namespace {

int tier_modifier(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Low: return -20;
        case PriorityTier::Medium: return 0;
        case PriorityTier::High: return 20;
        case PriorityTier::Critical: return 40;
    }
    return 0;
}

int complexity_modifier(Complexity complexity) {
    switch (complexity) {
        case Complexity::Simple: return -10;
        case Complexity::Moderate: return 0;
        case Complexity::Complex: return 10;
        case Complexity::Expert: return 20;
    }
    return 0;
}

int type_modifier(const std::string& type) {
    if (type == "security") return 40;
    if (type == "bug") return 30;
    if (type == "enhancement") return -10;
    if (type == "documentation") return -20;
    return 0;
}

void append_unique(std::vector<UnitId>& target, const std::vector<UnitId>& source,
                   const UnitId& skip_a, const UnitId& skip_b) {
    for (const auto& id : source) {
        if (id == skip_a || id == skip_b) continue;
        if (std::find(target.begin(), target.end(), id) == target.end()) {
            target.push_back(id);
        }
    }
}

} // namespace

int calculate_priority(const UnitOfWork& unit, TimePoint now) {
    int score = 50;
    score += tier_modifier(unit.priority);
    score += complexity_modifier(unit.complexity);
    score += type_modifier(unit.type);

    if (unit.deadline) {
        double days = std::chrono::duration<double, std::ratio<86400>>(*unit.deadline - now).count();
        if (days < 1.0) score += 30;
        else if (days < 3.0) score += 20;
        else if (days < 7.0) score += 10;
    }

    score += static_cast<int>(unit.blocks.size()) * 5;

    return std::max(0, std::min(100, score));
}

Complexity escalate_complexity(Complexity a, Complexity b) {
    return a > b ? a : b;
}

PriorityTier escalate_priority(PriorityTier a, PriorityTier b) {
    return a > b ? a : b;
}

AgentType select_agent_for_merge(const UnitOfWork& a, const UnitOfWork& b, const AgentCatalog& catalog) {
    return catalog.rank_of(a.assigned_agent) >= catalog.rank_of(b.assigned_agent)
        ? a.assigned_agent
        : b.assigned_agent;
}

UnitOfWork make_merged_unit(const UnitOfWork& a, const UnitOfWork& b, const AgentCatalog& catalog) {
    UnitOfWork merged;
    merged.id = "merged_" + a.id + "_" + b.id;
    merged.title = "Combined: " + a.title + " & " + b.title;
    merged.description = "Merged task combining:\n1. " + a.title + ": " + a.description +
                         "\n2. " + b.title + ": " + b.description;
    merged.type = a.type == b.type ? a.type : "feature";
    merged.complexity = escalate_complexity(a.complexity, b.complexity);
    merged.priority = escalate_priority(a.priority, b.priority);
    merged.assigned_agent = select_agent_for_merge(a, b, catalog);

    append_unique(merged.dependencies, a.dependencies, a.id, b.id);
    append_unique(merged.dependencies, b.dependencies, a.id, b.id);
    append_unique(merged.blocks, a.blocks, a.id, b.id);
    append_unique(merged.blocks, b.blocks, a.id, b.id);

    merged.files = a.files;
    for (const auto& file : b.files) {
        if (std::find(merged.files.begin(), merged.files.end(), file) == merged.files.end()) {
            merged.files.push_back(file);
        }
    }

    if (a.deadline && b.deadline) merged.deadline = std::min(*a.deadline, *b.deadline);
    else if (a.deadline) merged.deadline = a.deadline;
    else merged.deadline = b.deadline;

    merged.merged_from = {a.id, b.id};
    return merged;
}

} // namespace conflux
