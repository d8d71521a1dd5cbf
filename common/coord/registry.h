#pragma once

#include "message.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coord {

enum agent_status {
    AGENT_STATUS_AVAILABLE,
    AGENT_STATUS_BUSY,         // Every task slot taken
    AGENT_STATUS_UNREACHABLE,  // Missed too many heartbeats
    AGENT_STATUS_DRAINING      // Finishing current work, takes nothing new
};

const char * agent_status_to_string(agent_status status);

struct agent_capability {
    std::string tag;
    double confidence = 1.0;  // 0..1
};

struct agent_instance {
    std::string id;
    std::string name;
    std::vector<agent_capability> capabilities;
    agent_status status = AGENT_STATUS_AVAILABLE;
    double load = 0.0;        // 0..1, reported with heartbeats
    int capacity = 1;         // Concurrent task slots
    int active_tasks = 0;
    int64_t registered_at = 0;
    int64_t last_heartbeat = 0;
    int missed_heartbeats = 0;

    // 0 when the tag is not offered
    double confidence_for(const std::string & tag) const;
    bool has_capability(const std::string & tag) const;

    json to_json() const;
};

// Read-only copy of the registry table
struct registry_snapshot {
    uint64_t version = 0;
    int64_t taken_at = 0;
    std::vector<agent_instance> agents;  // Sorted by id

    const agent_instance * find(const std::string & agent_id) const;

    // Some reachable agent offers the tag
    bool has_capability(const std::string & tag) const;

    int count_with_status(agent_status status) const;
};

// Agent discovery query
struct agent_query {
    std::vector<std::string> capabilities;  // Required capabilities
    bool require_all_capabilities = true;   // AND vs OR
    bool include_unavailable = false;       // Also match busy/draining/unreachable
};

//
// Agent registry. The only writer of agent status; everyone else works on
// snapshots. Each mutation bumps the version so readers can tell a stale
// snapshot.
//

class agent_registry {
public:
    agent_registry(int64_t heartbeat_interval_ms = 1000, int heartbeat_miss_limit = 3);
    ~agent_registry();

    agent_registry(const agent_registry &) = delete;
    agent_registry & operator=(const agent_registry &) = delete;

    // False when the id is empty or already registered
    bool register_agent(const agent_instance & agent);

    bool unregister_agent(const std::string & agent_id);

    // Refresh liveness and load; an unreachable agent becomes reachable again
    bool heartbeat(const std::string & agent_id, double load, int64_t now_ms = 0);

    // Count missed intervals; returns ids that just became unreachable
    std::vector<std::string> sweep_heartbeats(int64_t now_ms = 0);

    bool mark_unreachable(const std::string & agent_id);

    // Draining agents keep their work but take nothing new
    bool set_draining(const std::string & agent_id, bool draining);

    // Task slot bookkeeping, drives available <-> busy
    bool acquire_slot(const std::string & agent_id);
    bool release_slot(const std::string & agent_id);

    std::optional<agent_instance> get_agent(const std::string & agent_id) const;

    std::vector<agent_instance> find_agents(const agent_query & query) const;

    registry_snapshot snapshot() const;

    uint64_t version() const;

    size_t size() const;

    struct registry_stats {
        int total_agents;
        int available_agents;
        int busy_agents;
        int unreachable_agents;
        int draining_agents;
        uint64_t version;

        json to_json() const;
    };
    registry_stats get_stats() const;

    json to_json() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
