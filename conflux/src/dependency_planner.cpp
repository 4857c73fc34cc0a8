#include <conflux/dependency_planner.hpp>
#include <conflux/debug_log.hpp>
#include <conflux/task_context.hpp>
#include <algorithm>
#include <queue>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace conflux {

namespace {

std::string join_ids(const std::vector<UnitId>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

// In-batch dependencies of each unit, deduplicated, declaration order kept.
std::unordered_map<UnitId, std::vector<UnitId>> internal_edges(const std::vector<UnitOfWork>& units) {
    std::set<UnitId> ids;
    for (const auto& unit : units) ids.insert(unit.id);

    std::unordered_map<UnitId, std::vector<UnitId>> edges;
    for (const auto& unit : units) {
        auto& deps = edges[unit.id];
        for (const auto& dep : unit.dependencies) {
            if (ids.count(dep) && std::find(deps.begin(), deps.end(), dep) == deps.end()) {
                deps.push_back(dep);
            }
        }
    }
    return edges;
}

enum class Mark : std::uint8_t { Unvisited, OnStack, Done };

void visit(const UnitId& node,
           const std::unordered_map<UnitId, std::vector<UnitId>>& edges,
           std::unordered_map<UnitId, Mark>& marks,
           std::vector<UnitId>& stack,
           std::vector<std::vector<UnitId>>& cycles) {
    marks[node] = Mark::OnStack;
    stack.push_back(node);

    auto it = edges.find(node);
    if (it != edges.end()) {
        for (const auto& dep : it->second) {
            Mark mark = marks[dep];
            if (mark == Mark::OnStack) {
                auto start = std::find(stack.begin(), stack.end(), dep);
                cycles.emplace_back(start, stack.end());
            } else if (mark == Mark::Unvisited) {
                visit(dep, edges, marks, stack, cycles);
            }
        }
    }

    stack.pop_back();
    marks[node] = Mark::Done;
}

} // namespace

CycleError::CycleError(std::vector<UnitId> nodes)
    : std::runtime_error("Dependency cycle detected among: " + join_ids(nodes))
    , nodes_(std::move(nodes)) {}

std::size_t ExecutionPlan::group_of(const UnitId& id) const {
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (std::find(groups[i].begin(), groups[i].end(), id) != groups[i].end()) return i;
    }
    return groups.size();
}

DependencyPlanner::DependencyPlanner(std::size_t max_group_size)
    : max_group_size_(max_group_size) {
    if (max_group_size_ == 0) {
        throw std::invalid_argument("Parallel group size must be at least 1");
    }
}

ExecutionPlan DependencyPlanner::validate_and_order(const std::vector<UnitOfWork>& units) const {
    std::unordered_map<UnitId, const UnitOfWork*> by_id;
    for (const auto& unit : units) {
        if (unit.id.empty()) {
            throw std::invalid_argument("Unit of work without an id in batch");
        }
        if (!by_id.emplace(unit.id, &unit).second) {
            throw std::invalid_argument("Duplicate unit id in batch: " + unit.id);
        }
    }

    ExecutionPlan plan;
    auto edges = internal_edges(units);

    std::unordered_map<UnitId, std::size_t> in_degree;
    std::unordered_map<UnitId, std::vector<UnitId>> dependents;
    for (const auto& unit : units) {
        in_degree[unit.id] = edges[unit.id].size();
        for (const auto& dep : edges[unit.id]) {
            dependents[dep].push_back(unit.id);
        }
        for (const auto& dep : unit.dependencies) {
            if (!by_id.count(dep)) plan.external_dependencies[unit.id].push_back(dep);
        }
    }

    std::queue<UnitId> ready;
    for (const auto& unit : units) {
        if (in_degree[unit.id] == 0) ready.push(unit.id);
    }

    while (!ready.empty()) {
        UnitId current = ready.front();
        ready.pop();
        plan.order.push_back(current);

        for (const auto& next : dependents[current]) {
            if (--in_degree[next] == 0) ready.push(next);
        }
    }

    if (plan.order.size() != units.size()) {
        std::vector<UnitId> unresolved;
        for (const auto& unit : units) {
            if (in_degree[unit.id] > 0) unresolved.push_back(unit.id);
        }
        CONFLUX_LOG_ERROR("Dependency cycle in batch of %zu units: %s",
                          units.size(), join_ids(unresolved).c_str());
        throw CycleError(std::move(unresolved));
    }

    std::vector<UnitId> current;
    for (const auto& id : plan.order) {
        const UnitOfWork& unit = *by_id.at(id);
        bool depends_on_member = std::any_of(current.begin(), current.end(), [&unit](const UnitId& member) {
            return unit.depends_on(member);
        });

        if (!current.empty() && (current.size() >= max_group_size_ || depends_on_member)) {
            plan.groups.push_back(std::move(current));
            current.clear();
        }
        current.push_back(id);
    }
    if (!current.empty()) plan.groups.push_back(std::move(current));

    for (const auto& group : plan.groups) {
        std::uint32_t longest = 0;
        for (const auto& id : group) {
            std::uint32_t minutes = estimate_duration_minutes(*by_id.at(id));
            plan.sequential_minutes += minutes;
            longest = std::max(longest, minutes);
        }
        plan.parallel_minutes += longest;
    }

    CONFLUX_LOG_DEBUG("Planned %zu units into %zu groups (sequential %u min, parallel %u min)",
                      plan.order.size(), plan.groups.size(), plan.sequential_minutes, plan.parallel_minutes);
    return plan;
}

std::vector<std::vector<UnitId>> DependencyPlanner::find_cycles(const std::vector<UnitOfWork>& units) {
    auto edges = internal_edges(units);
    std::unordered_map<UnitId, Mark> marks;
    std::vector<UnitId> stack;
    std::vector<std::vector<UnitId>> cycles;

    for (const auto& unit : units) {
        if (marks[unit.id] == Mark::Unvisited) {
            visit(unit.id, edges, marks, stack, cycles);
        }
    }
    return cycles;
}

bool DependencyPlanner::would_create_cycle(const std::vector<UnitOfWork>& units,
                                           const UnitId& dependent, const UnitId& prerequisite) {
    if (dependent == prerequisite) return true;

    // The new edge closes a cycle iff the prerequisite already reaches the dependent.
    auto edges = internal_edges(units);
    std::set<UnitId> seen{prerequisite};
    std::vector<UnitId> pending{prerequisite};
    while (!pending.empty()) {
        UnitId node = pending.back();
        pending.pop_back();
        auto it = edges.find(node);
        if (it == edges.end()) continue;
        for (const auto& dep : it->second) {
            if (dep == dependent) return true;
            if (seen.insert(dep).second) pending.push_back(dep);
        }
    }
    return false;
}

} // namespace conflux
