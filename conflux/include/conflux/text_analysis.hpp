#ifndef CONFLUX_TEXT_ANALYSIS_HPP
#define CONFLUX_TEXT_ANALYSIS_HPP

#include <conflux/types.hpp>
#include <set>
#include <string>
#include <vector>

namespace conflux {

std::string to_lower(const std::string& text);

// Lower-cased "title description" of a unit.
std::string combined_text(const UnitOfWork& unit);

/**
 * Meaningful keywords of a text: split on whitespace, stripped to [a-z0-9],
 * words of length <= 2, pure numbers and stop-words removed. Unique, in order of
 * first appearance.
 */
std::vector<std::string> extract_meaningful_keywords(const std::string& text);

/**
 * Shared-keyword ratio of two units' title and description: |common| / |union|.
 * Zero when neither has keywords.
 */
double keyword_similarity(const UnitOfWork& a, const UnitOfWork& b);

std::vector<std::string> common_keywords(const UnitOfWork& a, const UnitOfWork& b);

/**
 * Named feature-area patterns shared by both units (e.g. "same_feature_area:auth",
 * "ui_component_overlap", "api_endpoint_overlap").
 */
std::vector<std::string> shared_conceptual_patterns(const UnitOfWork& a, const UnitOfWork& b);

/**
 * Requirement tags inferred from title, description and complexity, matched
 * against agent capability tags when reassigning work.
 */
std::vector<std::string> infer_requirement_tags(const UnitOfWork& unit);

/**
 * Architectural layers a unit touches: presentation, api, business, data.
 */
std::set<std::string> infer_layers(const UnitOfWork& unit, const TaskContext& context);

/**
 * Title keywords longer than three characters, minus generic task verbs.
 */
std::vector<std::string> title_keywords(const std::string& title);

// Lower-case, non-alphanumerics collapsed to single dashes, truncated.
std::string slugify(const std::string& text, std::size_t max_length);

} // namespace conflux

#endif // CONFLUX_TEXT_ANALYSIS_HPP
