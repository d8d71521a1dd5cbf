#pragma once

#include "bus.h"
#include "conflict.h"
#include "consensus.h"
#include "distributor.h"
#include "failure.h"
#include "params.h"
#include "plan.h"
#include "planner.h"
#include "registry.h"
#include "store.h"
#include "strategy.h"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coord {

enum progress_kind {
    PROGRESS_PLAN_STARTED,
    PROGRESS_TASK_ASSIGNED,
    PROGRESS_TASK_COMPLETED,
    PROGRESS_TASK_FAILED,
    PROGRESS_TASK_SKIPPED,
    PROGRESS_TASK_REQUEUED,
    PROGRESS_CONTINGENCY,
    PROGRESS_CONFLICT_RESOLVED,
    PROGRESS_REPLANNED,
    PROGRESS_PLAN_FINISHED
};

const char * progress_kind_to_string(progress_kind kind);

struct progress_event {
    progress_kind kind = PROGRESS_PLAN_STARTED;
    std::string plan_id;
    std::string task_id;
    std::string agent_id;
    std::string message;
    int64_t timestamp = 0;

    json to_json() const;
};

//
// Caller's view of one running plan. Progress events go through a bounded
// channel: when the caller does not keep up, the oldest events are dropped
// and counted.
//

class execution_handle {
public:
    execution_handle(const std::string & plan_id, size_t capacity, const cancel_token & cancel);

    const std::string & plan_id() const { return id; }

    // Next progress event, waiting up to timeout_ms
    std::optional<progress_event> next_event(int64_t timeout_ms = 0);

    // True once the plan has finished (within timeout_ms)
    bool wait(int64_t timeout_ms);

    bool is_finished() const;

    // Set once finished
    std::optional<execution_result> result() const;

    void cancel();

    const cancel_token & token() const { return cancel_tok; }

    size_t dropped_events() const;

    // Producer side
    void publish(const progress_event & event);
    void finish(const execution_result & result);

private:
    std::string id;
    size_t capacity;
    cancel_token cancel_tok;

    std::deque<progress_event> events;
    size_t dropped = 0;
    std::optional<execution_result> final_result;

    mutable std::mutex mutex;
    std::condition_variable cv;
};

enum health_status {
    HEALTH_HEALTHY,
    HEALTH_DEGRADED,
    HEALTH_UNHEALTHY
};

const char * health_status_to_string(health_status status);

struct coordination_health {
    health_status status = HEALTH_UNHEALTHY;
    std::vector<std::string> reasons;  // Why not healthy
    int active_agents = 0;             // Available, busy or draining
    int unreachable_agents = 0;
    int active_plans = 0;
    int active_assignments = 0;
    std::map<std::string, size_t> queue_depths;
    std::map<std::string, circuit_state> circuit_states;
    size_t dead_letters = 0;
    int64_t timestamp = 0;

    json to_json() const;
};

//
// Coordination orchestrator. Owns every component and runs:
//   - the router thread: drains the coordinator mailbox (heartbeats, task
//     results, conflict reports) and expires silent agents
//   - one thread per plan in flight: dispatches ready units, collects
//     results, applies contingencies and replans
//
// Agents talk to it at params.coordinator_id.
//

class coordination_orchestrator {
public:
    coordination_orchestrator(const coord_params & params,
                              const strategy_catalog & catalog,
                              knowledge_store * store = nullptr);
    ~coordination_orchestrator();

    coordination_orchestrator(const coordination_orchestrator &) = delete;
    coordination_orchestrator & operator=(const coordination_orchestrator &) = delete;

    // Lifecycle
    void start();
    void stop();
    bool is_running() const;

    planning_result plan_objective(const objective & obj);

    std::shared_ptr<execution_handle> distribute_and_execute(const task_plan & plan,
                                                             priority_level priority = PRIORITY_NORMAL);

    // False when no plan with that id is running
    bool cancel_execution(const std::string & plan_id);

    coordination_health get_coordination_health() const;

    // Agent management
    bool register_agent(const agent_instance & agent);
    bool unregister_agent(const std::string & agent_id);
    bool drain_agent(const std::string & agent_id, bool draining = true);

    // Resolve a disagreement reported outside the plan loops
    resolution report_conflict(const std::string & domain, const std::vector<conflicting_value> & values);

    // Components
    const coord_params & params() const;
    const std::string & address() const;
    message_bus & bus();
    resilience_guard & guard();
    agent_registry & registry();
    task_distributor & distributor();
    consensus_coordinator & consensus();
    conflict_resolver & resolver();
    decision_planner & planner();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
