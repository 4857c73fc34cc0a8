#include <conflux/text_analysis.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <unordered_set>

namespace conflux {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "the", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with",
        "by", "from", "up", "about", "into", "through", "during", "before",
        "after", "above", "below", "between", "among", "task", "feature",
        "implement", "create", "update", "add", "remove", "fix", "improve"
    };
    return words;
}

// Split lower-cased text on anything that is not [a-z0-9]
std::vector<std::string> split_words(const std::string& lowered) {
    std::vector<std::string> words;
    std::string current;
    for (char c : lowered) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

// True when some word of the text starts with the term ("auth" matches "authentication").
bool mentions(const std::vector<std::string>& words, const std::string& term) {
    for (const auto& word : words) {
        if (word.compare(0, term.size(), term) == 0) return true;
    }
    return false;
}

bool mentions_any(const std::vector<std::string>& words, std::initializer_list<const char*> terms) {
    for (const char* term : terms) {
        if (mentions(words, term)) return true;
    }
    return false;
}

bool any_path_contains(const std::set<std::string>& files, std::initializer_list<const char*> fragments) {
    for (const auto& file : files) {
        for (const char* fragment : fragments) {
            if (file.find(fragment) != std::string::npos) return true;
        }
    }
    return false;
}

bool is_number(const std::string& word) {
    return std::all_of(word.begin(), word.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string combined_text(const UnitOfWork& unit) {
    return to_lower(unit.title + " " + unit.description);
}

std::vector<std::string> extract_meaningful_keywords(const std::string& text) {
    std::vector<std::string> keywords;
    std::unordered_set<std::string> seen;
    const auto& stops = stop_words();

    std::string token;
    auto flush = [&]() {
        // Strip everything outside [a-z0-9] from the whitespace-delimited token
        std::string word;
        for (char c : token) {
            char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9')) word.push_back(lc);
        }
        token.clear();
        if (word.size() <= 2 || stops.count(word) || is_number(word)) return;
        if (seen.insert(word).second) keywords.push_back(std::move(word));
    };

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!token.empty()) flush();
        } else {
            token.push_back(c);
        }
    }
    if (!token.empty()) flush();
    return keywords;
}

std::vector<std::string> common_keywords(const UnitOfWork& a, const UnitOfWork& b) {
    auto keywords_a = extract_meaningful_keywords(combined_text(a));
    auto keywords_b = extract_meaningful_keywords(combined_text(b));
    std::unordered_set<std::string> set_b(keywords_b.begin(), keywords_b.end());

    std::vector<std::string> common;
    for (const auto& keyword : keywords_a) {
        if (set_b.count(keyword)) common.push_back(keyword);
    }
    return common;
}

double keyword_similarity(const UnitOfWork& a, const UnitOfWork& b) {
    auto keywords_a = extract_meaningful_keywords(combined_text(a));
    auto keywords_b = extract_meaningful_keywords(combined_text(b));

    std::unordered_set<std::string> all(keywords_a.begin(), keywords_a.end());
    all.insert(keywords_b.begin(), keywords_b.end());
    if (all.empty()) return 0.0;

    std::size_t shared = common_keywords(a, b).size();
    return static_cast<double>(shared) / static_cast<double>(all.size());
}

std::vector<std::string> shared_conceptual_patterns(const UnitOfWork& a, const UnitOfWork& b) {
    std::vector<std::string> patterns;
    auto words_a = split_words(combined_text(a));
    auto words_b = split_words(combined_text(b));

    static const char* feature_areas[] = {
        "auth", "payment", "user", "profile", "dashboard", "api", "database"
    };
    for (const char* area : feature_areas) {
        if (mentions(words_a, area) && mentions(words_b, area)) {
            patterns.push_back(std::string("same_feature_area:") + area);
        }
    }

    if (mentions_any(words_a, {"ui", "component"}) && mentions_any(words_b, {"ui", "component"})) {
        patterns.push_back("ui_component_overlap");
    }
    if (mentions_any(words_a, {"api", "endpoint", "route"}) &&
        mentions_any(words_b, {"api", "endpoint", "route"})) {
        patterns.push_back("api_endpoint_overlap");
    }
    return patterns;
}

std::vector<std::string> infer_requirement_tags(const UnitOfWork& unit) {
    std::vector<std::string> tags;
    auto words = split_words(combined_text(unit));
    auto push = [&tags](std::initializer_list<const char*> items) {
        for (const char* item : items) {
            if (std::find(tags.begin(), tags.end(), item) == tags.end()) tags.emplace_back(item);
        }
    };

    if (mentions_any(words, {"requirement", "analysis", "analyze"})) {
        push({"requirements", "analysis"});
    }
    if (mentions_any(words, {"plan", "coordinate"})) {
        push({"planning", "coordination"});
    }
    if (mentions_any(words, {"architect", "design"})) {
        push({"architecture", "design"});
    }
    if (mentions(words, "complex") || unit.complexity == Complexity::Complex ||
        unit.complexity == Complexity::Expert) {
        push({"complex-features"});
    }
    if (mentions_any(words, {"ui", "component"}) || unit.complexity == Complexity::Simple) {
        push({"simple-features", "ui"});
    }
    if (mentions_any(words, {"test", "quality"})) {
        push({"testing", "validation", "quality-assurance"});
    }
    return tags;
}

std::set<std::string> infer_layers(const UnitOfWork& unit, const TaskContext& context) {
    std::set<std::string> layers;
    auto words = split_words(combined_text(unit));
    const auto& files = context.affected_files;

    if (mentions_any(words, {"ui", "component", "view", "page", "frontend", "screen", "layout"}) ||
        any_path_contains(files, {"components/", "views/", "pages/"})) {
        layers.insert("presentation");
    }
    if (mentions_any(words, {"api", "endpoint", "route", "controller"}) ||
        any_path_contains(files, {"routes/", "controllers/"})) {
        layers.insert("api");
    }
    if (mentions_any(words, {"service", "logic", "workflow", "rule"}) ||
        any_path_contains(files, {"services/"})) {
        layers.insert("business");
    }
    if (mentions_any(words, {"database", "model", "migration", "schema", "query"}) ||
        any_path_contains(files, {"models/", "migrations/"})) {
        layers.insert("data");
    }
    return layers;
}

std::vector<std::string> title_keywords(const std::string& title) {
    static const std::unordered_set<std::string> generic = {
        "task", "feature", "implement", "create", "update", "fix"
    };
    std::vector<std::string> keywords;
    for (auto& word : split_words(to_lower(title))) {
        if (word.size() > 3 && !generic.count(word) &&
            std::find(keywords.begin(), keywords.end(), word) == keywords.end()) {
            keywords.push_back(std::move(word));
        }
    }
    return keywords;
}

std::string slugify(const std::string& text, std::size_t max_length) {
    std::string slug;
    for (char c : to_lower(text)) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            slug.push_back(c);
        } else if (!slug.empty() && slug.back() != '-') {
            slug.push_back('-');
        }
    }
    if (slug.size() > max_length) slug.resize(max_length);
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug;
}

} // namespace conflux
