#ifndef CONFLUX_TASK_CONTEXT_HPP
#define CONFLUX_TASK_CONTEXT_HPP

#include <conflux/types.hpp>
#include <memory>
#include <set>
#include <string>

namespace conflux {

/**
 * Predicts which files and business modules a unit of work will touch.
 * Swapping the predictor changes conflict prediction only; the rest of the
 * engine works on the resulting TaskContext.
 */
class ConflictPredictor {
public:
    virtual ~ConflictPredictor() = default;

    virtual std::set<std::string> predict_affected_files(const UnitOfWork& unit) const = 0;
    virtual std::set<std::string> predict_affected_modules(const UnitOfWork& unit) const = 0;
};

/**
 * Default predictor: keyword matching over the unit text plus any explicit file list.
 * Keyword-derived paths are only added for "feature" units that are not the product
 * of a split; modules are derived for every unit.
 */
class KeywordPredictor : public ConflictPredictor {
private:
    bool scan_description_;

    std::string scanned_text(const UnitOfWork& unit) const;

public:
    explicit KeywordPredictor(bool scan_description = false)
        : scan_description_(scan_description) {}

    std::set<std::string> predict_affected_files(const UnitOfWork& unit) const override;
    std::set<std::string> predict_affected_modules(const UnitOfWork& unit) const override;
};

/**
 * Estimated minutes: base by complexity (30/60/120/180) times a type multiplier
 * (feature 1.0, bug 0.7, enhancement 0.8, testing 0.5, documentation 0.3).
 */
std::uint32_t estimate_duration_minutes(const UnitOfWork& unit);

/**
 * Derives TaskContext values. Pure, no shared state.
 */
class TaskContextExtractor {
private:
    std::shared_ptr<const ConflictPredictor> predictor_;

public:
    TaskContextExtractor();
    explicit TaskContextExtractor(std::shared_ptr<const ConflictPredictor> predictor);

    TaskContext extract(const UnitOfWork& unit) const;

    const ConflictPredictor& predictor() const { return *predictor_; }
};

} // namespace conflux

#endif // CONFLUX_TASK_CONTEXT_HPP
