#include "registry.h"
#include "../log.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace coord {

const char * agent_status_to_string(agent_status status) {
    switch (status) {
        case AGENT_STATUS_AVAILABLE:   return "available";
        case AGENT_STATUS_BUSY:        return "busy";
        case AGENT_STATUS_UNREACHABLE: return "unreachable";
        case AGENT_STATUS_DRAINING:    return "draining";
        default:                       return "unknown";
    }
}

double agent_instance::confidence_for(const std::string & tag) const {
    for (const auto & cap : capabilities) {
        if (cap.tag == tag) {
            return cap.confidence;
        }
    }
    return 0.0;
}

bool agent_instance::has_capability(const std::string & tag) const {
    return confidence_for(tag) > 0.0;
}

json agent_instance::to_json() const {
    json caps = json::array();
    for (const auto & cap : capabilities) {
        caps.push_back({{"tag", cap.tag}, {"confidence", cap.confidence}});
    }
    return json{
        {"id", id},
        {"name", name},
        {"capabilities", caps},
        {"status", agent_status_to_string(status)},
        {"load", load},
        {"capacity", capacity},
        {"active_tasks", active_tasks},
        {"registered_at", registered_at},
        {"last_heartbeat", last_heartbeat},
        {"missed_heartbeats", missed_heartbeats}
    };
}

const agent_instance * registry_snapshot::find(const std::string & agent_id) const {
    for (const auto & agent : agents) {
        if (agent.id == agent_id) {
            return &agent;
        }
    }
    return nullptr;
}

bool registry_snapshot::has_capability(const std::string & tag) const {
    for (const auto & agent : agents) {
        if (agent.status != AGENT_STATUS_UNREACHABLE && agent.has_capability(tag)) {
            return true;
        }
    }
    return false;
}

int registry_snapshot::count_with_status(agent_status status) const {
    return static_cast<int>(std::count_if(agents.begin(), agents.end(),
                                          [status](const agent_instance & a) { return a.status == status; }));
}

struct agent_registry::impl {
    std::map<std::string, agent_instance> agents;
    mutable std::shared_mutex mutex;
    uint64_t version = 0;
    int64_t heartbeat_interval_ms;
    int heartbeat_miss_limit;

    // Slot-driven status; unreachable and draining are left alone
    void refresh_status(agent_instance & agent) {
        if (agent.status == AGENT_STATUS_UNREACHABLE || agent.status == AGENT_STATUS_DRAINING) {
            return;
        }
        agent.status = agent.active_tasks >= agent.capacity ? AGENT_STATUS_BUSY : AGENT_STATUS_AVAILABLE;
    }
};

agent_registry::agent_registry(int64_t heartbeat_interval_ms, int heartbeat_miss_limit)
    : pimpl(std::make_unique<impl>()) {
    pimpl->heartbeat_interval_ms = heartbeat_interval_ms > 0 ? heartbeat_interval_ms : 1000;
    pimpl->heartbeat_miss_limit = heartbeat_miss_limit > 0 ? heartbeat_miss_limit : 3;
}

agent_registry::~agent_registry() = default;

bool agent_registry::register_agent(const agent_instance & agent) {
    if (agent.id.empty()) {
        LOG_WRN("registry: refusing agent with empty id\n");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    if (pimpl->agents.count(agent.id) > 0) {
        return false;
    }

    agent_instance entry = agent;
    int64_t now = get_timestamp_ms();
    entry.capacity = std::max(1, entry.capacity);
    entry.active_tasks = 0;
    entry.registered_at = now;
    entry.last_heartbeat = now;
    entry.missed_heartbeats = 0;
    entry.load = std::min(1.0, std::max(0.0, entry.load));
    if (entry.status != AGENT_STATUS_DRAINING) {
        entry.status = AGENT_STATUS_AVAILABLE;
    }

    pimpl->agents[entry.id] = entry;
    pimpl->version++;

    LOG_INF("registry: registered agent %s (%zu capabilities, capacity %d)\n",
            entry.id.c_str(), entry.capabilities.size(), entry.capacity);
    return true;
}

bool agent_registry::unregister_agent(const std::string & agent_id) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    if (pimpl->agents.erase(agent_id) == 0) {
        return false;
    }
    pimpl->version++;

    LOG_INF("registry: unregistered agent %s\n", agent_id.c_str());
    return true;
}

bool agent_registry::heartbeat(const std::string & agent_id, double load, int64_t now_ms) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return false;
    }

    auto & agent = it->second;
    agent.last_heartbeat = now_ms > 0 ? now_ms : get_timestamp_ms();
    agent.missed_heartbeats = 0;
    agent.load = std::min(1.0, std::max(0.0, load));

    if (agent.status == AGENT_STATUS_UNREACHABLE) {
        LOG_INF("registry: agent %s is reachable again\n", agent_id.c_str());
        agent.status = AGENT_STATUS_AVAILABLE;
    }
    pimpl->refresh_status(agent);
    pimpl->version++;
    return true;
}

std::vector<std::string> agent_registry::sweep_heartbeats(int64_t now_ms) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    int64_t now = now_ms > 0 ? now_ms : get_timestamp_ms();
    std::vector<std::string> lost;

    for (auto & [id, agent] : pimpl->agents) {
        if (agent.status == AGENT_STATUS_UNREACHABLE) {
            continue;
        }

        int64_t silent = now - agent.last_heartbeat;
        int missed = silent > 0 ? static_cast<int>(silent / pimpl->heartbeat_interval_ms) : 0;
        if (missed != agent.missed_heartbeats) {
            agent.missed_heartbeats = missed;
            pimpl->version++;
        }

        if (missed >= pimpl->heartbeat_miss_limit) {
            LOG_WRN("registry: agent %s missed %d heartbeats, marking unreachable\n", id.c_str(), missed);
            agent.status = AGENT_STATUS_UNREACHABLE;
            lost.push_back(id);
        }
    }

    return lost;
}

bool agent_registry::mark_unreachable(const std::string & agent_id) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end() || it->second.status == AGENT_STATUS_UNREACHABLE) {
        return false;
    }
    it->second.status = AGENT_STATUS_UNREACHABLE;
    pimpl->version++;

    LOG_WRN("registry: agent %s marked unreachable\n", agent_id.c_str());
    return true;
}

bool agent_registry::set_draining(const std::string & agent_id, bool draining) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end() || it->second.status == AGENT_STATUS_UNREACHABLE) {
        return false;
    }

    auto & agent = it->second;
    if (draining) {
        agent.status = AGENT_STATUS_DRAINING;
    } else if (agent.status == AGENT_STATUS_DRAINING) {
        agent.status = AGENT_STATUS_AVAILABLE;
        pimpl->refresh_status(agent);
    }
    pimpl->version++;
    return true;
}

bool agent_registry::acquire_slot(const std::string & agent_id) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return false;
    }

    auto & agent = it->second;
    if (agent.status != AGENT_STATUS_AVAILABLE || agent.active_tasks >= agent.capacity) {
        return false;
    }
    agent.active_tasks++;
    pimpl->refresh_status(agent);
    pimpl->version++;
    return true;
}

bool agent_registry::release_slot(const std::string & agent_id) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end() || it->second.active_tasks == 0) {
        return false;
    }

    auto & agent = it->second;
    agent.active_tasks--;
    pimpl->refresh_status(agent);
    pimpl->version++;
    return true;
}

std::optional<agent_instance> agent_registry::get_agent(const std::string & agent_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);

    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<agent_instance> agent_registry::find_agents(const agent_query & query) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);

    std::vector<agent_instance> result;
    for (const auto & [id, agent] : pimpl->agents) {
        if (!query.include_unavailable && agent.status != AGENT_STATUS_AVAILABLE) {
            continue;
        }

        bool match = query.require_all_capabilities;
        for (const auto & tag : query.capabilities) {
            bool has = agent.has_capability(tag);
            if (query.require_all_capabilities && !has) {
                match = false;
                break;
            }
            if (!query.require_all_capabilities && has) {
                match = true;
                break;
            }
        }
        if (query.capabilities.empty()) {
            match = true;
        }

        if (match) {
            result.push_back(agent);
        }
    }
    return result;
}

registry_snapshot agent_registry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);

    registry_snapshot snap;
    snap.version = pimpl->version;
    snap.taken_at = get_timestamp_ms();
    snap.agents.reserve(pimpl->agents.size());
    for (const auto & [id, agent] : pimpl->agents) {
        snap.agents.push_back(agent);
    }
    return snap;
}

uint64_t agent_registry::version() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->version;
}

size_t agent_registry::size() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->agents.size();
}

json agent_registry::registry_stats::to_json() const {
    return json{
        {"total_agents", total_agents},
        {"available_agents", available_agents},
        {"busy_agents", busy_agents},
        {"unreachable_agents", unreachable_agents},
        {"draining_agents", draining_agents},
        {"version", version}
    };
}

agent_registry::registry_stats agent_registry::get_stats() const {
    registry_snapshot snap = snapshot();

    registry_stats stats;
    stats.total_agents = static_cast<int>(snap.agents.size());
    stats.available_agents = snap.count_with_status(AGENT_STATUS_AVAILABLE);
    stats.busy_agents = snap.count_with_status(AGENT_STATUS_BUSY);
    stats.unreachable_agents = snap.count_with_status(AGENT_STATUS_UNREACHABLE);
    stats.draining_agents = snap.count_with_status(AGENT_STATUS_DRAINING);
    stats.version = snap.version;
    return stats;
}

json agent_registry::to_json() const {
    registry_snapshot snap = snapshot();

    json agents = json::array();
    for (const auto & agent : snap.agents) {
        agents.push_back(agent.to_json());
    }
    return json{
        {"version", snap.version},
        {"agents", agents}
    };
}

} // namespace coord
