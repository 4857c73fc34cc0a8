#ifndef CONFLUX_CONFIG_HPP
#define CONFLUX_CONFIG_HPP

#include <conflux/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conflux {

/**
 * Tunables for conflict detection, resolution and batch planning.
 */
struct SchedulerConfig {
    std::size_t max_parallel_group_size = 3;     // Cap on units per parallel batch
    std::uint32_t default_cleanup_minutes = 30;  // Reservation age considered stale
    double conceptual_overlap_threshold = 0.4;   // Keyword similarity that counts as overlap
    double merge_similarity_threshold = 0.7;     // Keyword similarity that allows a merge
    std::size_t resolution_history_limit = 50;   // Per repository
    std::size_t sequencing_overlap_limit = 1;    // Shared files still considered sequenceable
};

/**
 * Options for a single resolution request.
 */
struct ResolutionOptions {
    bool allow_split = true;
    bool allow_merge = true;
    bool auto_resolve = true;   // Batch overlap prevention only
};

/**
 * One agent type known to the scheduler.
 */
struct AgentProfile {
    AgentType name;
    std::vector<std::string> capabilities;  // Tags matched against inferred task requirements
    int rank = 1;                           // Capability hierarchy, higher is more capable
    std::uint32_t base_minutes = 20;        // Typical time to finish one unit

    bool has_capability(const std::string& tag) const;
};

/**
 * Closed table of agent types. Iteration order is declaration order.
 */
class AgentCatalog {
private:
    std::vector<AgentProfile> profiles_;

public:
    AgentCatalog() = default;
    explicit AgentCatalog(std::vector<AgentProfile> profiles);

    // product-manager, project-manager, tech-lead, senior-developer, junior-developer, qa-engineer
    static AgentCatalog default_catalog();

    void add(AgentProfile profile);

    const AgentProfile* find(const AgentType& name) const;
    const std::vector<AgentProfile>& profiles() const { return profiles_; }

    // Rank of an agent type; unknown types rank 1.
    int rank_of(const AgentType& name) const;

    // Base minutes of an agent type; unknown types take 20.
    std::uint32_t base_minutes_of(const AgentType& name) const;
};

} // namespace conflux

#endif // CONFLUX_CONFIG_HPP
