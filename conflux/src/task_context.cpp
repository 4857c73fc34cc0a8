#include <conflux/task_context.hpp>
#include <conflux/text_analysis.hpp>
#include <cmath>
#include <stdexcept>

namespace conflux {

namespace {

bool contains(const std::string& text, const char* term) {
    return text.find(term) != std::string::npos;
}

} // namespace

std::string KeywordPredictor::scanned_text(const UnitOfWork& unit) const {
    return scan_description_ ? combined_text(unit) : to_lower(unit.title);
}

std::set<std::string> KeywordPredictor::predict_affected_files(const UnitOfWork& unit) const {
    std::set<std::string> files;

    // Units produced by a split carry an exact file list
    if (unit.type == "feature" && !unit.parent_id) {
        std::string text = scanned_text(unit);
        if (contains(text, "auth")) {
            files.insert("src/auth/");
            files.insert("src/middleware/auth.js");
        }
        if (contains(text, "api")) {
            files.insert("src/routes/");
            files.insert("src/controllers/");
        }
        if (contains(text, "ui") || contains(text, "component")) {
            files.insert("src/components/");
            files.insert("src/views/");
        }
        if (contains(text, "database") || contains(text, "model")) {
            files.insert("src/models/");
            files.insert("src/migrations/");
        }
    }

    files.insert(unit.files.begin(), unit.files.end());
    return files;
}

std::set<std::string> KeywordPredictor::predict_affected_modules(const UnitOfWork& unit) const {
    std::set<std::string> modules;
    std::string text = scanned_text(unit);

    if (contains(text, "user")) modules.insert("user-service");
    if (contains(text, "auth")) modules.insert("auth-service");
    if (contains(text, "payment")) modules.insert("payment-service");
    if (contains(text, "notification")) modules.insert("notification-service");
    if (contains(text, "api")) modules.insert("api-layer");
    if (contains(text, "database")) modules.insert("data-layer");

    return modules;
}

std::uint32_t estimate_duration_minutes(const UnitOfWork& unit) {
    double base = 60.0;
    switch (unit.complexity) {
        case Complexity::Simple: base = 30.0; break;
        case Complexity::Moderate: base = 60.0; break;
        case Complexity::Complex: base = 120.0; break;
        case Complexity::Expert: base = 180.0; break;
    }

    double multiplier = 1.0;
    if (unit.type == "bug") multiplier = 0.7;
    else if (unit.type == "enhancement") multiplier = 0.8;
    else if (unit.type == "testing") multiplier = 0.5;
    else if (unit.type == "documentation") multiplier = 0.3;

    return static_cast<std::uint32_t>(std::lround(base * multiplier));
}

TaskContextExtractor::TaskContextExtractor()
    : predictor_(std::make_shared<KeywordPredictor>()) {}

TaskContextExtractor::TaskContextExtractor(std::shared_ptr<const ConflictPredictor> predictor)
    : predictor_(std::move(predictor)) {
    if (!predictor_) {
        throw std::invalid_argument("TaskContextExtractor requires a predictor");
    }
}

TaskContext TaskContextExtractor::extract(const UnitOfWork& unit) const {
    TaskContext context;
    context.unit_id = unit.id;
    context.affected_files = predictor_->predict_affected_files(unit);
    context.affected_modules = predictor_->predict_affected_modules(unit);
    context.dependencies = unit.dependencies;
    context.blocking = unit.blocks;
    context.estimated_minutes = estimate_duration_minutes(unit);
    return context;
}

} // namespace conflux
