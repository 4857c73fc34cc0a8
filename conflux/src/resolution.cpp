#include <conflux/resolution.hpp>
#include <conflux/debug_log.hpp>
#include <conflux/dependency_planner.hpp>
#include <conflux/priority.hpp>
#include <conflux/text_analysis.hpp>
#include <algorithm>
#include <climits>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace conflux {

namespace {

bool contains(const std::vector<UnitId>& ids, const UnitId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& items) {
    for (const auto& item : items) {
        if (std::find(target.begin(), target.end(), item) == target.end()) target.push_back(item);
    }
}

// Offending units across all conflicts, first-seen order, one entry per id.
std::vector<UnitOfWork> offending_units(const std::vector<Conflict>& conflicts) {
    std::vector<UnitOfWork> units;
    std::vector<UnitId> seen;
    for (const auto& conflict : conflicts) {
        for (const auto& unit : conflict.units) {
            if (contains(seen, unit.id)) continue;
            seen.push_back(unit.id);
            units.push_back(unit);
        }
    }
    return units;
}

std::vector<UnitId> ids_of(const std::vector<UnitOfWork>& units) {
    std::vector<UnitId> ids;
    ids.reserve(units.size());
    for (const auto& unit : units) ids.push_back(unit.id);
    return ids;
}

TaskContext context_of(const TaskContextExtractor& extractor, const UnitOfWork& unit,
                       const RepositoryState& state) {
    auto active = state.active_units.find(unit.id);
    if (active != state.active_units.end()) return active->second.context;
    return extractor.extract(unit);
}

std::vector<ModuleInterface> module_interfaces(const UnitOfWork& first, const UnitOfWork& second,
                                               const std::vector<std::string>& modules) {
    std::vector<ModuleInterface> interfaces;
    for (const auto& module : modules) {
        interfaces.push_back(ModuleInterface{
            module,
            module + "_" + first.id + "_interface",
            module + "_" + second.id + "_interface",
            {"data_flow", "api_contracts", "shared_components"}
        });
    }
    return interfaces;
}

bool in_any_cycle(const std::vector<UnitOfWork>& graph, const UnitId& id) {
    for (const auto& cycle : DependencyPlanner::find_cycles(graph)) {
        if (contains(cycle, id)) return true;
    }
    return false;
}

Complexity lower_tier(Complexity complexity) {
    switch (complexity) {
        case Complexity::Simple: return Complexity::Simple;
        case Complexity::Moderate: return Complexity::Simple;
        case Complexity::Complex: return Complexity::Moderate;
        case Complexity::Expert: return Complexity::Complex;
    }
    return complexity;
}

} // namespace

const char* to_string(OverlapAction action) {
    switch (action) {
        case OverlapAction::AddDependency: return "add_dependency";
        case OverlapAction::MergeUnits: return "merge_tasks";
        case OverlapAction::CoordinateModules: return "coordinate_modules";
    }
    return "unknown";
}

ConflictResolutionEngine::ConflictResolutionEngine(const TaskContextExtractor& extractor,
                                                   const AgentCatalog& catalog,
                                                   SchedulerConfig config,
                                                   std::shared_ptr<TimeSource> clock)
    : extractor_(extractor)
    , catalog_(catalog)
    , config_(config)
    , clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("ConflictResolutionEngine requires a time source");
    }
}

Resolution ConflictResolutionEngine::resolve(const UnitOfWork& unit, const RepositoryState& state,
                                             const CompatibilityResult& compatibility,
                                             const ResolutionOptions& options) const {
    if (compatibility.compatible || !compatibility.category) {
        Resolution resolution;
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::NoConflict;
        resolution.unit = unit;
        resolution.summary = "No conflict";
        return resolution;
    }
    return resolve(unit, state, *compatibility.category, compatibility.conflicts, options);
}

Resolution ConflictResolutionEngine::resolve(const UnitOfWork& unit, const RepositoryState& state,
                                             ConflictCategory category, const std::vector<Conflict>& conflicts,
                                             const ResolutionOptions& options) const {
    Resolution resolution;
    switch (category) {
        case ConflictCategory::FileOverlap:
            resolution = resolve_file_overlap(unit, state, conflicts, options);
            break;
        case ConflictCategory::ModuleOverlap:
            resolution = resolve_module_overlap(unit, state, conflicts, options);
            break;
        case ConflictCategory::DependencyConflict:
            resolution = resolve_dependency_conflict(unit, state, conflicts);
            break;
        case ConflictCategory::AgentBusy:
            resolution = resolve_agent_busy(unit, state, conflicts, options);
            break;
        case ConflictCategory::ConceptualConflict:
            resolution = resolve_conceptual_conflict(unit, state, conflicts, options);
            break;
    }

    resolution.category = category;
    if (!resolution.resolved) {
        resolution.strategy = ResolutionStrategy::ManualIntervention;
        if (resolution.unit.id.empty()) resolution.unit = unit;
        resolution.fallback_suggestion = fallback_suggestion(category);
        resolution.fallback_options = fallback_options();
    }

    CONFLUX_LOG_DEBUG("Resolved %s for %s -> %s", to_string(category), unit.id.c_str(),
                      to_string(resolution.strategy));
    return resolution;
}

Resolution ConflictResolutionEngine::resolve_file_overlap(const UnitOfWork& unit, const RepositoryState& state,
                                                          const std::vector<Conflict>& conflicts,
                                                          const ResolutionOptions& options) const {
    Resolution resolution;
    resolution.unit = unit;

    auto others = offending_units(conflicts);
    if (others.empty()) {
        resolution.summary = "File overlap reported without conflicting units";
        return resolution;
    }

    TaskContext context = extractor_.extract(unit);
    std::set<std::string> contested;
    for (const auto& conflict : conflicts) contested.insert(conflict.files.begin(), conflict.files.end());

    std::uint32_t wait = 0;
    for (const auto& other : others) wait = std::max(wait, remaining_minutes(other, state));

    auto graph = dependency_graph(state, {unit});
    bool acyclic = std::none_of(others.begin(), others.end(), [&](const UnitOfWork& other) {
        return DependencyPlanner::would_create_cycle(graph, unit.id, other.id);
    });

    // Sequencing: little actual overlap, or the two units work on different kinds of change
    bool can_sequence = acyclic;
    for (const auto& other : others) {
        if (!can_sequence) break;
        TaskContext other_context = context_of(extractor_, other, state);
        std::size_t shared = 0;
        for (const auto& file : context.affected_files) {
            if (other_context.affected_files.count(file)) ++shared;
        }
        can_sequence = shared <= config_.sequencing_overlap_limit || unit.type != other.type;
    }
    if (can_sequence) {
        for (const auto& other : others) {
            if (!resolution.unit.depends_on(other.id)) {
                resolution.unit.dependencies.push_back(other.id);
                resolution.added_dependencies.push_back(other.id);
            }
        }
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::SequenceAfterConflicts;
        resolution.estimated_wait_minutes = wait;
        resolution.summary = "Run after " + std::to_string(others.size()) + " conflicting task(s)";
        return resolution;
    }

    // Splitting: isolate the files nobody else holds from the contested ones
    if (options.allow_split && unit.complexity != Complexity::Simple && acyclic) {
        std::vector<std::string> free_files;
        std::vector<std::string> contested_files;
        for (const auto& file : context.affected_files) {
            (contested.count(file) ? contested_files : free_files).push_back(file);
        }

        if (!free_files.empty() && !contested_files.empty()) {
            UnitOfWork first = unit;
            first.id = unit.id + "-part1";
            first.title = unit.title + " - Phase 1 (Non-conflicting)";
            first.files = free_files;
            first.parent_id = unit.id;

            UnitOfWork second = unit;
            second.id = unit.id + "-part2";
            second.title = unit.title + " - Phase 2 (Integration)";
            second.files = contested_files;
            second.parent_id = unit.id;
            for (const auto& other : others) {
                if (!second.depends_on(other.id)) second.dependencies.push_back(other.id);
            }
            second.dependencies.push_back(first.id);

            resolution.resolved = true;
            resolution.strategy = ResolutionStrategy::SplitTask;
            resolution.unit = first;
            resolution.sub_units = {first, second};
            resolution.summary = "Split into a non-conflicting phase (" + std::to_string(free_files.size()) +
                                 " files) and an integration phase";
            return resolution;
        }
    }

    // Preemption: strictly higher score than every conflicting unit
    TimePoint now = clock_->now();
    int score = calculate_priority(unit, now);
    int highest = INT_MIN;
    for (const auto& other : others) highest = std::max(highest, calculate_priority(other, now));

    if (score > highest) {
        for (const auto& other : others) resolution.preempted_units.push_back(other.id);
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::PreemptLowerPriority;
        resolution.summary = "Priority " + std::to_string(score) + " preempts " +
                             std::to_string(others.size()) + " lower-priority task(s)";
        return resolution;
    }

    resolution.resolved = true;
    resolution.strategy = ResolutionStrategy::IntelligentQueue;
    resolution.estimated_wait_minutes = wait;
    resolution.queue_position = queue_position(unit.assigned_agent, state);
    resolution.summary = "Queued at position " + std::to_string(resolution.queue_position);
    return resolution;
}

Resolution ConflictResolutionEngine::resolve_module_overlap(const UnitOfWork& unit, const RepositoryState& state,
                                                            const std::vector<Conflict>& conflicts,
                                                            const ResolutionOptions& options) const {
    Resolution resolution;
    resolution.unit = unit;

    auto others = offending_units(conflicts);
    if (others.empty()) {
        resolution.summary = "Module overlap reported without conflicting units";
        return resolution;
    }

    // Layer separation: every pair works on disjoint, non-empty layer sets
    auto unit_layers = infer_layers(unit, extractor_.extract(unit));
    bool separable = !unit_layers.empty();
    std::map<UnitId, std::set<std::string>> layers{{unit.id, unit_layers}};
    for (const auto& other : others) {
        auto other_layers = infer_layers(other, context_of(extractor_, other, state));
        bool disjoint = std::none_of(other_layers.begin(), other_layers.end(), [&](const std::string& layer) {
            return unit_layers.count(layer) > 0;
        });
        separable = separable && !other_layers.empty() && disjoint;
        layers[other.id] = std::move(other_layers);
    }
    if (separable) {
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::LayerSeparation;
        resolution.layers = std::move(layers);
        resolution.summary = "Tasks work on separate architectural layers of the shared module";
        return resolution;
    }

    if (options.allow_merge) {
        for (const auto& other : others) {
            if (keyword_similarity(unit, other) <= config_.merge_similarity_threshold) continue;

            UnitOfWork merged = make_merged_unit(unit, other, catalog_);
            if (in_any_cycle(dependency_graph(state, {merged}, {unit.id, other.id}), merged.id)) continue;

            resolution.resolved = true;
            resolution.strategy = ResolutionStrategy::MergeRelatedTasks;
            resolution.unit = merged;
            resolution.merged_unit = merged;
            resolution.summary = "Merged with " + other.id;
            return resolution;
        }
    }

    auto graph = dependency_graph(state, {unit});
    for (const auto& conflict : conflicts) {
        for (const auto& other : conflict.units) {
            if (!contains(resolution.execution_order, other.id)) resolution.execution_order.push_back(other.id);
            auto interfaces = module_interfaces(other, unit, conflict.modules);
            resolution.interfaces.insert(resolution.interfaces.end(), interfaces.begin(), interfaces.end());

            if (!resolution.unit.depends_on(other.id) &&
                !DependencyPlanner::would_create_cycle(graph, unit.id, other.id)) {
                resolution.unit.dependencies.push_back(other.id);
                resolution.added_dependencies.push_back(other.id);
            }
        }
    }
    resolution.execution_order.push_back(unit.id);
    resolution.resolved = true;
    resolution.strategy = ResolutionStrategy::SequentialWithInterface;
    resolution.summary = "Sequential execution with " + std::to_string(resolution.interfaces.size()) +
                         " module interface(s)";
    return resolution;
}

Resolution ConflictResolutionEngine::resolve_dependency_conflict(const UnitOfWork& unit, const RepositoryState& state,
                                                                 const std::vector<Conflict>& conflicts) const {
    Resolution resolution;
    resolution.unit = unit;

    auto graph = dependency_graph(state, {unit});
    auto cycles = DependencyPlanner::find_cycles(graph);

    if (!cycles.empty()) {
        TimePoint now = clock_->now();
        std::unordered_map<UnitId, std::size_t> index;
        for (std::size_t i = 0; i < graph.size(); ++i) index[graph[i].id] = i;

        std::vector<UnitId> changed;
        auto remaining = cycles;
        std::size_t passes = 0;
        for (const auto& node : graph) passes += node.dependencies.size();

        // Demote the edge whose dependent has the lowest priority, one cycle per pass
        while (!remaining.empty() && passes-- > 0) {
            const auto& cycle = remaining.front();
            std::size_t pick = 0;
            int lowest = INT_MAX;
            for (std::size_t i = 0; i < cycle.size(); ++i) {
                int score = calculate_priority(graph[index.at(cycle[i])], now);
                if (score < lowest) {
                    lowest = score;
                    pick = i;
                }
            }

            UnitId dependent = cycle[pick];
            UnitId prerequisite = cycle[(pick + 1) % cycle.size()];
            auto& deps = graph[index.at(dependent)].dependencies;
            deps.erase(std::remove(deps.begin(), deps.end(), prerequisite), deps.end());

            resolution.demoted_edges.emplace_back(dependent, prerequisite);
            if (!contains(changed, dependent)) changed.push_back(dependent);
            remaining = DependencyPlanner::find_cycles(graph);
        }

        if (!remaining.empty()) {
            resolution.cycles = std::move(cycles);
            resolution.summary = "Could not break dependency cycles";
            return resolution;
        }

        DependencyPlanner planner(graph.size());
        resolution.execution_order = planner.validate_and_order(graph).order;
        for (const auto& id : changed) resolution.restructured_units.push_back(graph[index.at(id)]);

        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::ResolveCircularDependencies;
        resolution.cycles = std::move(cycles);
        resolution.unit = graph[index.at(unit.id)];
        resolution.summary = "Broke " + std::to_string(resolution.demoted_edges.size()) + " dependency edge(s)";
        return resolution;
    }

    std::uint32_t wait = 0;
    for (const auto& conflict : conflicts) {
        if (conflict.dependency_status == UnitStatus::Completed) continue;
        for (const auto& blocker : conflict.units) {
            if (contains(resolution.waiting_for, blocker.id)) continue;
            resolution.waiting_for.push_back(blocker.id);
            wait = std::max(wait, remaining_minutes(blocker, state));
        }
    }
    if (!resolution.waiting_for.empty()) {
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::WaitForDependencies;
        resolution.estimated_wait_minutes = wait;
        resolution.summary = "Waiting for " + std::to_string(resolution.waiting_for.size()) + " dependency(ies)";
        return resolution;
    }

    auto others = offending_units(conflicts);
    if (!others.empty()) {
        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::ParallelExecution;
        resolution.parallel_units = ids_of(others);
        resolution.summary = "Dependencies complete, can run in parallel";
        return resolution;
    }

    resolution.summary = "Manual dependency resolution required";
    return resolution;
}

Resolution ConflictResolutionEngine::resolve_agent_busy(const UnitOfWork& unit, const RepositoryState& state,
                                                        const std::vector<Conflict>& conflicts,
                                                        const ResolutionOptions& options) const {
    Resolution resolution;
    resolution.unit = unit;

    AgentType busy = unit.assigned_agent;
    std::uint32_t wait = 0;
    if (!conflicts.empty()) {
        if (!conflicts.front().agent_type.empty()) busy = conflicts.front().agent_type;
        wait = conflicts.front().estimated_wait_minutes;
    }

    auto requirements = infer_requirement_tags(unit);
    for (const auto& profile : catalog_.profiles()) {
        if (profile.name == busy || state.branch_by_agent.count(profile.name)) continue;
        bool capable = std::any_of(requirements.begin(), requirements.end(), [&profile](const std::string& tag) {
            return profile.has_capability(tag);
        });
        if (!capable) continue;

        resolution.resolved = true;
        resolution.strategy = ResolutionStrategy::ReassignToAvailableAgent;
        resolution.reassigned_agent = profile.name;
        resolution.unit.assigned_agent = profile.name;
        resolution.summary = "Reassigned from " + busy + " to " + profile.name;
        return resolution;
    }

    if (options.allow_split &&
        (unit.complexity == Complexity::Complex || unit.complexity == Complexity::Expert)) {
        TaskContext context = extractor_.extract(unit);
        std::vector<std::string> files(context.affected_files.begin(), context.affected_files.end());

        if (files.size() >= 2) {
            std::size_t half = (files.size() + 1) / 2;

            UnitOfWork first = unit;
            first.id = unit.id + "-part1";
            first.title = unit.title + " - Part 1";
            first.files.assign(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(half));
            first.complexity = lower_tier(unit.complexity);
            first.assigned_agent = busy;
            first.parent_id = unit.id;

            UnitOfWork second = first;
            second.id = unit.id + "-part2";
            second.title = unit.title + " - Part 2";
            second.files.assign(files.begin() + static_cast<std::ptrdiff_t>(half), files.end());
            second.dependencies.push_back(first.id);

            resolution.resolved = true;
            resolution.strategy = ResolutionStrategy::SplitForAgentCapacity;
            resolution.unit = first;
            resolution.sub_units = {first, second};
            resolution.summary = "Split into two " + std::string(to_string(first.complexity)) +
                                 " parts for " + busy;
            return resolution;
        }
    }

    resolution.resolved = true;
    resolution.strategy = ResolutionStrategy::WorkloadBalancedQueue;
    resolution.estimated_wait_minutes = wait;
    resolution.queue_position = queue_position(busy, state);
    resolution.summary = "Queued behind " + busy + " (position " + std::to_string(resolution.queue_position) +
                         ", ~" + std::to_string(wait) + " min)";
    return resolution;
}

Resolution ConflictResolutionEngine::resolve_conceptual_conflict(const UnitOfWork& unit, const RepositoryState& state,
                                                                 const std::vector<Conflict>& conflicts,
                                                                 const ResolutionOptions& options) const {
    Resolution resolution;
    resolution.unit = unit;

    auto others = offending_units(conflicts);
    if (others.empty()) {
        resolution.summary = "Conceptual conflict reported without related units";
        return resolution;
    }

    const UnitOfWork* closest = nullptr;
    double best = -1.0;
    for (const auto& other : others) {
        double similarity = keyword_similarity(unit, other);
        if (similarity > best) {
            best = similarity;
            closest = &other;
        }
    }

    if (options.allow_merge && best > config_.merge_similarity_threshold) {
        UnitOfWork merged = make_merged_unit(unit, *closest, catalog_);
        if (!in_any_cycle(dependency_graph(state, {merged}, {unit.id, closest->id}), merged.id)) {
            resolution.resolved = true;
            resolution.strategy = ResolutionStrategy::MergeConceptualTasks;
            resolution.unit = merged;
            resolution.merged_unit = merged;
            resolution.shared_components = common_keywords(unit, *closest);
            resolution.summary = "Unified with " + closest->id;
            return resolution;
        }
    }

    TimePoint now = clock_->now();
    UnitId lead = unit.id;
    int lead_score = calculate_priority(unit, now);
    for (const auto& other : others) {
        int score = calculate_priority(other, now);
        if (score > lead_score) {
            lead_score = score;
            lead = other.id;
        }
        append_unique(resolution.shared_components, common_keywords(unit, other));
        append_unique(resolution.integration_points, shared_conceptual_patterns(unit, other));
    }

    resolution.resolved = true;
    resolution.strategy = ResolutionStrategy::CoordinateRelatedFeatures;
    resolution.lead_unit = lead;
    resolution.summary = lead + " leads " + std::to_string(others.size() + 1) + " related tasks";
    return resolution;
}

std::uint32_t ConflictResolutionEngine::remaining_minutes(const UnitOfWork& unit, const RepositoryState& state) const {
    std::uint32_t estimate = estimate_duration_minutes(unit);
    auto active = state.active_units.find(unit.id);
    if (active == state.active_units.end()) return estimate;

    double elapsed = minutes_between(active->second.reserved_at, clock_->now());
    return static_cast<std::uint32_t>(std::ceil(std::max(0.0, static_cast<double>(estimate) - elapsed)));
}

std::size_t ConflictResolutionEngine::queue_position(const AgentType& agent_type, const RepositoryState& state) const {
    auto queue = state.queues.find(agent_type);
    return queue == state.queues.end() ? 1 : queue->second.size() + 1;
}

std::vector<UnitOfWork> ConflictResolutionEngine::dependency_graph(const RepositoryState& state,
                                                                   const std::vector<UnitOfWork>& replacements,
                                                                   const std::vector<UnitId>& removed) const {
    std::vector<UnitOfWork> graph;
    for (const auto& [id, active] : state.active_units) {
        if (contains(removed, id)) continue;
        bool replaced = std::any_of(replacements.begin(), replacements.end(), [&id](const UnitOfWork& unit) {
            return unit.id == id;
        });
        if (!replaced) graph.push_back(active.unit);
    }
    graph.insert(graph.end(), replacements.begin(), replacements.end());
    return graph;
}

OverlapPrevention ConflictResolutionEngine::prevent_overlaps(const std::vector<UnitOfWork>& units,
                                                             const ResolutionOptions& options) const {
    OverlapPrevention prevention;
    OverlapAnalyzer analyzer(extractor_, config_);
    prevention.analysis = analyzer.detect(units);
    prevention.units = units;

    CONFLUX_LOG_INFO("Analyzed %zu tasks: %zu overlaps (risk %s)", units.size(),
                     prevention.analysis.overlaps.size(), to_string(prevention.analysis.risk_level));

    if (prevention.analysis.overlaps.empty()) return prevention;

    if (!options.auto_resolve) {
        prevention.safe = false;
        prevention.requires_review = true;
        return prevention;
    }

    auto& batch = prevention.units;
    auto find = [&batch](const UnitId& id) -> std::ptrdiff_t {
        for (std::size_t i = 0; i < batch.size(); ++i) {
            if (batch[i].id == id) return static_cast<std::ptrdiff_t>(i);
        }
        return -1;
    };

    TimePoint now = clock_->now();
    for (const auto& overlap : prevention.analysis.overlaps) {
        std::ptrdiff_t first_index = find(overlap.first);
        std::ptrdiff_t second_index = find(overlap.second);
        if (first_index < 0 || second_index < 0) continue;

        UnitOfWork& first = batch[static_cast<std::size_t>(first_index)];
        UnitOfWork& second = batch[static_cast<std::size_t>(second_index)];

        AppliedOverlapResolution applied;
        applied.first = first.id;
        applied.second = second.id;

        if (overlap.has(OverlapKind::File) && overlap.severity != Severity::Critical) {
            bool first_leads = calculate_priority(first, now) >= calculate_priority(second, now);
            UnitOfWork& dependent = first_leads ? second : first;
            const UnitOfWork& prerequisite = first_leads ? first : second;

            if (dependent.depends_on(prerequisite.id)) continue;
            if (!DependencyPlanner::would_create_cycle(batch, dependent.id, prerequisite.id)) {
                dependent.dependencies.push_back(prerequisite.id);
                applied.action = OverlapAction::AddDependency;
                applied.dependent = dependent.id;
                applied.prerequisite = prerequisite.id;
                applied.reason = "Added dependency: " + dependent.title + " waits for " + prerequisite.title;
                prevention.resolutions.push_back(std::move(applied));
                prevention.modified = true;
                continue;
            }
            CONFLUX_LOG_DEBUG("Skipped edge %s -> %s: would close a cycle",
                              dependent.id.c_str(), prerequisite.id.c_str());
        }

        if (overlap.has(OverlapKind::Conceptual) && overlap.severity == Severity::High && options.allow_merge) {
            UnitOfWork merged = make_merged_unit(first, second, catalog_);

            std::vector<UnitOfWork> rewritten;
            for (const auto& unit : batch) {
                if (unit.id == first.id) {
                    rewritten.push_back(merged);
                    continue;
                }
                if (unit.id == second.id) continue;

                UnitOfWork copy = unit;
                std::vector<UnitId> deps;
                for (const auto& dep : copy.dependencies) {
                    UnitId target = (dep == first.id || dep == second.id) ? merged.id : dep;
                    if (!contains(deps, target)) deps.push_back(target);
                }
                copy.dependencies = std::move(deps);
                rewritten.push_back(std::move(copy));
            }

            if (!in_any_cycle(rewritten, merged.id)) {
                applied.action = OverlapAction::MergeUnits;
                applied.merged_unit = merged;
                applied.reason = "Merged conceptually similar tasks: " + first.title + " + " + second.title;
                batch = std::move(rewritten);
                prevention.resolutions.push_back(std::move(applied));
                prevention.modified = true;
                continue;
            }
        }

        if (overlap.has(OverlapKind::Module)) {
            applied.action = OverlapAction::CoordinateModules;
            applied.interfaces = module_interfaces(first, second, overlap.shared_modules);
            applied.reason = "Created coordination plan for module overlap";
            prevention.resolutions.push_back(std::move(applied));
        }
    }

    CONFLUX_LOG_INFO("Applied %zu automatic overlap resolutions", prevention.resolutions.size());
    return prevention;
}

std::string ConflictResolutionEngine::fallback_suggestion(ConflictCategory category) {
    switch (category) {
        case ConflictCategory::FileOverlap: return "Consider manual coordination or task postponement";
        case ConflictCategory::ModuleOverlap: return "Recommend splitting task or sequential execution";
        case ConflictCategory::DependencyConflict: return "Review and restructure task dependencies";
        case ConflictCategory::AgentBusy: return "Queue task or consider alternative agent assignment";
        case ConflictCategory::ConceptualConflict: return "Coordinate related tasks or merge into single task";
    }
    return "Manual review required";
}

std::vector<std::string> ConflictResolutionEngine::fallback_options() {
    return {
        "Queue task for later execution",
        "Split task into smaller components",
        "Reassign to different agent",
        "Manual coordination between agents"
    };
}

} // namespace conflux
