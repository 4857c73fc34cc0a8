#include <conflux/overlap_analysis.hpp>
#include <conflux/text_analysis.hpp>
#include <algorithm>
#include <initializer_list>

namespace conflux {

namespace {

std::vector<std::string> intersect(const std::set<std::string>& a, const std::set<std::string>& b) {
    std::vector<std::string> shared;
    for (const auto& item : a) {
        if (b.count(item)) shared.push_back(item);
    }
    return shared;
}

bool contains(const std::vector<UnitId>& ids, const UnitId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void add_affected(std::vector<UnitId>& affected, const UnitId& id) {
    if (!contains(affected, id)) affected.push_back(id);
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

} // namespace

const char* to_string(OverlapKind kind) {
    switch (kind) {
        case OverlapKind::File: return "file_overlap";
        case OverlapKind::Module: return "module_overlap";
        case OverlapKind::Conceptual: return "conceptual_overlap";
        case OverlapKind::Dependency: return "dependency_overlap";
    }
    return "unknown";
}

const char* to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::None: return "none";
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "unknown";
}

bool PairOverlap::has(OverlapKind kind) const {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

std::string PairOverlap::label() const {
    std::string result;
    for (OverlapKind kind : kinds) {
        if (result.empty()) {
            result = to_string(kind);
        } else if (kind == OverlapKind::Module) {
            result = "file_and_module_overlap";
        } else if (kind == OverlapKind::Conceptual) {
            result += "_and_conceptual";
        } else if (kind == OverlapKind::Dependency) {
            result += "_and_dependency";
        }
    }
    return result;
}

PairOverlap OverlapAnalyzer::analyze_pair(const UnitOfWork& a, const UnitOfWork& b) const {
    PairOverlap overlap;
    overlap.first = a.id;
    overlap.second = b.id;

    TaskContext context_a = extractor_.extract(a);
    TaskContext context_b = extractor_.extract(b);

    overlap.shared_files = intersect(context_a.affected_files, context_b.affected_files);
    if (!overlap.shared_files.empty()) {
        std::size_t count = overlap.shared_files.size();
        overlap.kinds.push_back(OverlapKind::File);
        overlap.severity = count > 3 ? Severity::High : count > 1 ? Severity::Medium : Severity::Low;
    }

    overlap.shared_modules = intersect(context_a.affected_modules, context_b.affected_modules);
    if (!overlap.shared_modules.empty()) {
        overlap.kinds.push_back(OverlapKind::Module);
        overlap.severity = escalate(overlap.severity, Severity::High);
    }

    overlap.similarity = keyword_similarity(a, b);
    overlap.patterns = shared_conceptual_patterns(a, b);
    if (overlap.similarity > config_.conceptual_overlap_threshold || !overlap.patterns.empty()) {
        overlap.common_keywords = common_keywords(a, b);
        Severity conceptual = overlap.similarity > 0.7 ? Severity::High
                            : overlap.similarity > 0.5 ? Severity::Medium
                            : Severity::Low;
        overlap.kinds.push_back(OverlapKind::Conceptual);
        overlap.severity = escalate(overlap.severity, conceptual);
    }

    bool dependency_overlap = false;
    Severity dependency_severity = Severity::Low;
    if (a.depends_on(b.id) && b.depends_on(a.id)) {
        overlap.circular = true;
        dependency_overlap = true;
        dependency_severity = Severity::Critical;
    }
    if (a.is_blocking(b.id) || b.is_blocking(a.id)) {
        overlap.blocking = true;
        dependency_overlap = true;
        dependency_severity = escalate(dependency_severity, Severity::High);
    }
    for (const auto& dep : a.dependencies) {
        if (b.depends_on(dep) && !contains(overlap.shared_dependencies, dep)) {
            overlap.shared_dependencies.push_back(dep);
        }
    }
    if (!overlap.shared_dependencies.empty()) {
        dependency_overlap = true;
        dependency_severity = escalate(dependency_severity, Severity::Medium);
    }
    if (dependency_overlap) {
        overlap.kinds.push_back(OverlapKind::Dependency);
        overlap.severity = escalate(overlap.severity, dependency_severity);
    }

    return overlap;
}

OverlapReport OverlapAnalyzer::detect(const std::vector<UnitOfWork>& units) const {
    OverlapReport report;
    report.total_units = units.size();

    for (std::size_t i = 0; i < units.size(); ++i) {
        for (std::size_t j = i + 1; j < units.size(); ++j) {
            PairOverlap overlap = analyze_pair(units[i], units[j]);
            if (overlap.has_overlap()) {
                report.overlaps.push_back(std::move(overlap));
            }
        }
    }

    report.risk_level = risk_level(report.overlaps);
    report.recommendations = recommendations(report.overlaps);
    return report;
}

RiskLevel OverlapAnalyzer::risk_level(const std::vector<PairOverlap>& overlaps) {
    if (overlaps.empty()) return RiskLevel::None;

    std::size_t critical = 0, high = 0, medium = 0;
    for (const auto& overlap : overlaps) {
        switch (overlap.severity) {
            case Severity::Critical: ++critical; break;
            case Severity::High: ++high; break;
            case Severity::Medium: ++medium; break;
            case Severity::Low: break;
        }
    }

    if (critical > 0) return RiskLevel::Critical;
    if (high > 2) return RiskLevel::High;
    if (high > 0 || medium > 3) return RiskLevel::Medium;
    return RiskLevel::Low;
}

std::vector<OverlapRecommendation> OverlapAnalyzer::recommendations(const std::vector<PairOverlap>& overlaps) {
    OverlapRecommendation sequencing{"task_sequencing", Severity::High,
        "Sequence tasks that modify the same files",
        "Add dependencies between overlapping tasks", {}};
    OverlapRecommendation architecture{"architectural_coordination", Severity::Critical,
        "Coordinate tasks affecting the same business modules",
        "Consider merging tasks or defining clear interfaces", {}};
    OverlapRecommendation feature{"feature_coordination", Severity::Medium,
        "Coordinate conceptually related tasks",
        "Assign to same agent or create feature epic", {}};
    OverlapRecommendation restructuring{"dependency_restructuring", Severity::Critical,
        "Resolve dependency conflicts",
        "Restructure task dependencies to eliminate cycles", {}};

    for (const auto& overlap : overlaps) {
        for (OverlapKind kind : overlap.kinds) {
            OverlapRecommendation* target = nullptr;
            switch (kind) {
                case OverlapKind::File: target = &sequencing; break;
                case OverlapKind::Module: target = &architecture; break;
                case OverlapKind::Conceptual: target = &feature; break;
                case OverlapKind::Dependency: target = &restructuring; break;
            }
            add_affected(target->affected_units, overlap.first);
            add_affected(target->affected_units, overlap.second);
        }
    }

    std::vector<OverlapRecommendation> result;
    for (auto* recommendation : {&sequencing, &architecture, &feature, &restructuring}) {
        if (!recommendation->affected_units.empty()) result.push_back(std::move(*recommendation));
    }
    return result;
}

std::optional<SetConflict> OverlapAnalyzer::first_conflict(const UnitOfWork& a, const TaskContext& context_a,
                                                           const UnitOfWork& b, const TaskContext& context_b) const {
    SetConflict conflict;
    conflict.proposed = a.id;
    conflict.other = b.id;

    auto files = intersect(context_a.affected_files, context_b.affected_files);
    if (!files.empty()) {
        conflict.kind = OverlapKind::File;
        conflict.severity = files.size() > 3 ? Severity::High : Severity::Medium;
        conflict.description = "Both tasks modify: " + join(files);
        conflict.details = std::move(files);
        return conflict;
    }

    auto modules = intersect(context_a.affected_modules, context_b.affected_modules);
    if (!modules.empty()) {
        conflict.kind = OverlapKind::Module;
        conflict.severity = Severity::High;
        conflict.description = "Both tasks affect: " + join(modules);
        conflict.details = std::move(modules);
        return conflict;
    }

    if (a.depends_on(b.id) || b.depends_on(a.id)) {
        conflict.kind = OverlapKind::Dependency;
        conflict.severity = Severity::Critical;
        conflict.description = "Tasks have circular or conflicting dependencies";
        return conflict;
    }

    auto keywords_a = title_keywords(a.title);
    auto keywords_b = title_keywords(b.title);
    std::vector<std::string> shared;
    for (const auto& keyword : keywords_a) {
        if (std::find(keywords_b.begin(), keywords_b.end(), keyword) != keywords_b.end()) {
            shared.push_back(keyword);
        }
    }
    if (shared.size() >= 2) {
        conflict.kind = OverlapKind::Conceptual;
        conflict.severity = Severity::Low;
        conflict.description = "Tasks work on the same feature area and may interfere";
        conflict.details = std::move(shared);
        return conflict;
    }

    return std::nullopt;
}

TaskSetValidation OverlapAnalyzer::validate_task_set(const std::vector<UnitOfWork>& proposed,
                                                     const std::vector<UnitOfWork>& active) const {
    TaskSetValidation validation;

    std::vector<TaskContext> proposed_contexts;
    proposed_contexts.reserve(proposed.size());
    for (const auto& unit : proposed) proposed_contexts.push_back(extractor_.extract(unit));

    for (std::size_t i = 0; i < proposed.size(); ++i) {
        for (std::size_t j = i + 1; j < proposed.size(); ++j) {
            auto conflict = first_conflict(proposed[i], proposed_contexts[i], proposed[j], proposed_contexts[j]);
            if (conflict) validation.internal_conflicts.push_back(std::move(*conflict));
        }
    }

    for (const auto& active_unit : active) {
        TaskContext active_context = extractor_.extract(active_unit);
        for (std::size_t i = 0; i < proposed.size(); ++i) {
            auto conflict = first_conflict(proposed[i], proposed_contexts[i], active_unit, active_context);
            if (conflict) validation.active_conflicts.push_back(std::move(*conflict));
        }
    }

    validation.valid = validation.internal_conflicts.empty() && validation.active_conflicts.empty();

    OverlapRecommendation sequencing{"task_sequencing", Severity::High,
        "Sequence tasks that modify the same files to run one after another",
        "Add dependencies between conflicting tasks", {}};
    OverlapRecommendation redesign{"task_redesign", Severity::High,
        "Consider splitting tasks that affect the same business modules",
        "Break down tasks into smaller, non-overlapping pieces", {}};
    OverlapRecommendation dependencies{"dependency_resolution", Severity::Critical,
        "Resolve circular dependencies by reordering or merging tasks",
        "Review task dependencies and restructure workflow", {}};
    OverlapRecommendation coordination{"coordination", Severity::Low,
        "Tasks work on related features - ensure consistent approach",
        "Consider assigning to same agent or adding review checkpoints", {}};

    auto collect = [&](const std::vector<SetConflict>& conflicts) {
        for (const auto& conflict : conflicts) {
            OverlapRecommendation* target = nullptr;
            switch (conflict.kind) {
                case OverlapKind::File: target = &sequencing; break;
                case OverlapKind::Module: target = &redesign; break;
                case OverlapKind::Dependency: target = &dependencies; break;
                case OverlapKind::Conceptual: target = &coordination; break;
            }
            add_affected(target->affected_units, conflict.proposed);
            add_affected(target->affected_units, conflict.other);
        }
    };
    collect(validation.internal_conflicts);
    collect(validation.active_conflicts);

    for (auto* recommendation : {&sequencing, &redesign, &dependencies, &coordination}) {
        if (!recommendation->affected_units.empty()) {
            validation.recommendations.push_back(std::move(*recommendation));
        }
    }
    return validation;
}

} // namespace conflux
