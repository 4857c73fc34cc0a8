#ifndef CONFLUX_REPOSITORY_STATE_HPP
#define CONFLUX_REPOSITORY_STATE_HPP

#include <conflux/types.hpp>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace conflux {

/**
 * Mutual-exclusion claim on a (repository, agent type) pair.
 */
struct Reservation {
    RepositoryId repo;
    AgentType agent_type;
    std::string branch_name;
    UnitOfWork unit;
    TaskContext context;
    TimePoint created_at;
};

/**
 * A unit currently holding a reservation, as seen by the compatibility checker.
 */
struct ActiveUnit {
    UnitOfWork unit;
    TaskContext context;
    AgentType agent_type;
    std::string branch_name;
    TimePoint reserved_at;
};

/**
 * Waiting entry in a per-agent-type FIFO queue. on_admit runs once, outside
 * the repository lock, when the entry is found compatible.
 */
struct QueuedTask {
    UnitOfWork unit;
    AgentType agent_type;
    std::function<void()> on_admit;
    TimePoint queued_at;
};

struct ResolutionRecord {
    UnitId unit_id;
    ConflictCategory category;
    ResolutionStrategy strategy;
    bool resolved;
    TimePoint recorded_at;
};

/**
 * Everything the scheduler mutates for one repository. Owned by one
 * ReservationManager shard and only touched while that shard's mutex is held.
 */
struct RepositoryState {
    RepositoryId repo;

    std::map<UnitId, ActiveUnit> active_units;
    std::map<std::string, std::set<UnitId>> file_usage;       // file -> units claiming it
    std::map<std::string, Reservation> reservations;          // branch -> reservation
    std::map<AgentType, std::string> branch_by_agent;         // at most one per agent type
    std::map<AgentType, std::deque<QueuedTask>> queues;
    std::deque<ResolutionRecord> history;

    explicit RepositoryState(RepositoryId id) : repo(std::move(id)) {}

    bool empty() const {
        return reservations.empty() && queues.empty();
    }

    std::size_t queued_count() const {
        std::size_t total = 0;
        for (const auto& [agent, queue] : queues) total += queue.size();
        return total;
    }
};

} // namespace conflux

#endif // CONFLUX_REPOSITORY_STATE_HPP
