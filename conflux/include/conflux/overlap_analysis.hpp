#ifndef CONFLUX_OVERLAP_ANALYSIS_HPP
#define CONFLUX_OVERLAP_ANALYSIS_HPP

#include <conflux/config.hpp>
#include <conflux/task_context.hpp>
#include <conflux/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conflux {

enum class OverlapKind : std::uint8_t {
    File = 0,
    Module,
    Conceptual,
    Dependency
};

enum class RiskLevel : std::uint8_t {
    None = 0,
    Low,
    Medium,
    High,
    Critical
};

const char* to_string(OverlapKind kind);
const char* to_string(RiskLevel level);

/**
 * Every kind of overlap found between two units, with the severity escalated
 * across kinds.
 */
struct PairOverlap {
    UnitId first;
    UnitId second;
    std::vector<OverlapKind> kinds;      // Detection order: file, module, conceptual, dependency
    Severity severity = Severity::Low;

    std::vector<std::string> shared_files;
    std::vector<std::string> shared_modules;

    double similarity = 0.0;
    std::vector<std::string> common_keywords;
    std::vector<std::string> patterns;

    bool circular = false;
    bool blocking = false;
    std::vector<UnitId> shared_dependencies;

    bool has_overlap() const { return !kinds.empty(); }
    bool has(OverlapKind kind) const;

    // "file_overlap", "file_and_module_overlap", "module_overlap_and_conceptual", ...
    std::string label() const;
};

struct OverlapRecommendation {
    std::string kind;           // task_sequencing, architectural_coordination, ...
    Severity priority = Severity::Medium;
    std::string action;
    std::string implementation;
    std::vector<UnitId> affected_units;
};

struct OverlapReport {
    std::size_t total_units = 0;
    std::vector<PairOverlap> overlaps;
    RiskLevel risk_level = RiskLevel::None;
    std::vector<OverlapRecommendation> recommendations;
};

/**
 * First-matching conflict between two units of a proposed set, or between a
 * proposed unit and one already active on the repository.
 */
struct SetConflict {
    UnitId proposed;
    UnitId other;
    OverlapKind kind = OverlapKind::File;
    Severity severity = Severity::Medium;
    std::vector<std::string> details;
    std::string description;
};

struct TaskSetValidation {
    bool valid = true;
    std::vector<SetConflict> internal_conflicts;
    std::vector<SetConflict> active_conflicts;
    std::vector<OverlapRecommendation> recommendations;
};

/**
 * Pairwise overlap analysis for a batch of units before any of them is reserved.
 */
class OverlapAnalyzer {
private:
    const TaskContextExtractor& extractor_;
    SchedulerConfig config_;

    std::optional<SetConflict> first_conflict(const UnitOfWork& a, const TaskContext& context_a,
                                              const UnitOfWork& b, const TaskContext& context_b) const;

public:
    OverlapAnalyzer(const TaskContextExtractor& extractor, SchedulerConfig config = {})
        : extractor_(extractor), config_(config) {}

    PairOverlap analyze_pair(const UnitOfWork& a, const UnitOfWork& b) const;

    OverlapReport detect(const std::vector<UnitOfWork>& units) const;

    /**
     * Conflicts inside the proposed set plus conflicts against the active units,
     * first matching kind per pair: file, module, dependency, then conceptual
     * (two or more shared title keywords).
     */
    TaskSetValidation validate_task_set(const std::vector<UnitOfWork>& proposed,
                                        const std::vector<UnitOfWork>& active) const;

    // none when empty; critical if any critical; high if more than two high;
    // medium if any high or more than three medium; low otherwise.
    static RiskLevel risk_level(const std::vector<PairOverlap>& overlaps);

    static std::vector<OverlapRecommendation> recommendations(const std::vector<PairOverlap>& overlaps);
};

} // namespace conflux

#endif // CONFLUX_OVERLAP_ANALYSIS_HPP
