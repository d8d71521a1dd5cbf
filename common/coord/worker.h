#pragma once

#include "bus.h"
#include "consensus.h"
#include "decision.h"
#include "registry.h"
#include "store.h"
#include "strategy.h"

#include <memory>
#include <string>
#include <vector>

namespace coord {

// Wire payload keys shared by the coordinator and workers
//
//   task request  (REQUEST):       {"task": task_unit, "deadline_ms", "reply_to"}
//   task result   (RESPONSE):      {"task_id", "plan_id", "agent_id", "success",
//                                   "error", "output", "report", "action",
//                                   "attempts", "backtracks"}
//   cancel        (COORDINATION):  {"control": "cancel", "task_id" | "plan_id"}
//   heartbeat     (HEARTBEAT):     {"load", "active_tasks"}
//
// Results correlate with the request message id.

json make_task_request(const task_unit & unit, int64_t deadline_ms, const std::string & reply_to);
json make_cancel_request(const std::string & task_id, const std::string & plan_id);

//
// In-process worker agent. Subscribes to the bus under its id, sends
// heartbeats to the coordinator, runs a sequential decision engine for every
// task it is handed (one thread per task) and votes in consensus rounds.
//

class worker_agent {
public:
    struct config {
        std::string id;
        std::string name;
        std::vector<agent_capability> capabilities;
        int capacity = 1;
        std::string coordinator_address = "coordinator";
        int64_t heartbeat_interval_ms = 1000;
        int64_t send_timeout_ms = 1000;
        int64_t task_timeout_ms = 30000;
    };

    worker_agent(const config & cfg,
                 message_bus & bus,
                 const strategy_catalog & catalog,
                 pattern_executor & executor,
                 knowledge_store * store = nullptr);
    ~worker_agent();

    worker_agent(const worker_agent &) = delete;
    worker_agent & operator=(const worker_agent &) = delete;

    // Subscribe and start heartbeating; false when the id is taken on the bus
    bool start();

    // Cancel running tasks, wait for them and leave the bus
    void stop();

    bool is_running() const;

    const std::string & id() const;

    // Registry entry describing this worker
    agent_instance describe() const;

    // Test hooks
    void pause_heartbeats(bool paused);
    void set_vote_policy(consensus_participant::vote_policy policy);
    void set_drop_votes(bool drop);

    int tasks_running() const;
    // Task threads started but not yet joined
    size_t retained_threads() const;
    int tasks_completed() const;
    int tasks_failed() const;

    const decision_log & decisions() const;

    consensus_participant & participant();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
