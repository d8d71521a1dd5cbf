#include "orchestrator.h"
#include "worker.h"
#include "../log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <iterator>
#include <mutex>
#include <set>
#include <thread>

namespace coord {

const char * progress_kind_to_string(progress_kind kind) {
    switch (kind) {
        case PROGRESS_PLAN_STARTED: return "plan_started";
        case PROGRESS_TASK_ASSIGNED: return "task_assigned";
        case PROGRESS_TASK_COMPLETED: return "task_completed";
        case PROGRESS_TASK_FAILED: return "task_failed";
        case PROGRESS_TASK_SKIPPED: return "task_skipped";
        case PROGRESS_TASK_REQUEUED: return "task_requeued";
        case PROGRESS_CONTINGENCY: return "contingency";
        case PROGRESS_CONFLICT_RESOLVED: return "conflict_resolved";
        case PROGRESS_REPLANNED: return "replanned";
        case PROGRESS_PLAN_FINISHED: return "plan_finished";
        default: return "unknown";
    }
}

json progress_event::to_json() const {
    return json{
        {"kind", progress_kind_to_string(kind)},
        {"plan_id", plan_id},
        {"task_id", task_id},
        {"agent_id", agent_id},
        {"message", message},
        {"timestamp", timestamp}
    };
}

// execution_handle
execution_handle::execution_handle(const std::string & plan_id, size_t capacity, const cancel_token & cancel)
    : id(plan_id), capacity(capacity > 0 ? capacity : 1), cancel_tok(cancel) {}

std::optional<progress_event> execution_handle::next_event(int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, std::chrono::milliseconds(std::max<int64_t>(0, timeout_ms)),
                [this]() { return !events.empty() || final_result.has_value(); });
    if (events.empty()) {
        return std::nullopt;
    }
    progress_event event = events.front();
    events.pop_front();
    return event;
}

bool execution_handle::wait(int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::milliseconds(std::max<int64_t>(0, timeout_ms)),
                       [this]() { return final_result.has_value(); });
}

bool execution_handle::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex);
    return final_result.has_value();
}

std::optional<execution_result> execution_handle::result() const {
    std::lock_guard<std::mutex> lock(mutex);
    return final_result;
}

void execution_handle::cancel() {
    cancel_tok.cancel();
    cv.notify_all();
}

size_t execution_handle::dropped_events() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dropped;
}

void execution_handle::publish(const progress_event & event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (events.size() >= capacity) {
            events.pop_front();
            dropped++;
        }
        events.push_back(event);
    }
    cv.notify_all();
}

void execution_handle::finish(const execution_result & result) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (final_result) {
            return;
        }
        final_result = result;
    }
    cv.notify_all();
}

const char * health_status_to_string(health_status status) {
    switch (status) {
        case HEALTH_HEALTHY: return "healthy";
        case HEALTH_DEGRADED: return "degraded";
        case HEALTH_UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

json coordination_health::to_json() const {
    json circuits = json::object();
    for (const auto & [site, state] : circuit_states) {
        circuits[site] = circuit_state_to_string(state);
    }
    return json{
        {"status", health_status_to_string(status)},
        {"reasons", reasons},
        {"active_agents", active_agents},
        {"unreachable_agents", unreachable_agents},
        {"active_plans", active_plans},
        {"active_assignments", active_assignments},
        {"queue_depths", queue_depths},
        {"circuit_states", circuits},
        {"dead_letters", dead_letters},
        {"timestamp", timestamp}
    };
}

static int message_priority(priority_level priority) {
    switch (priority) {
        case PRIORITY_LOW: return 2;
        case PRIORITY_HIGH: return 8;
        case PRIORITY_CRITICAL: return 10;
        default: return 5;
    }
}

// Some reachable agent offers every tag of the unit
static bool capable_agent_exists(const task_unit & unit, const registry_snapshot & snapshot) {
    for (const auto & agent : snapshot.agents) {
        if (agent.status == AGENT_STATUS_UNREACHABLE || agent.status == AGENT_STATUS_DRAINING) {
            continue;
        }
        bool all = std::all_of(unit.capabilities.begin(), unit.capabilities.end(),
                               [&agent](const std::string & tag) { return agent.has_capability(tag); });
        if (all) {
            return true;
        }
    }
    return false;
}

namespace {

struct inbox_item {
    enum item_kind {
        ITEM_RESULT,      // Task result message
        ITEM_AGENT_LOST   // Agent expired; its tasks were released
    };

    item_kind kind = ITEM_RESULT;
    agent_message msg;
    std::string agent_id;
    std::vector<std::string> tasks;
};

struct plan_run {
    std::string plan_id;  // Id the caller knows the run by
    task_plan plan;
    priority_level priority = PRIORITY_NORMAL;
    std::shared_ptr<execution_handle> handle;
    std::vector<std::string> aliases;  // Every plan id used, replans included

    std::deque<inbox_item> inbox;
    std::mutex mutex;
    std::condition_variable cv;
    std::thread thread;

    void push(inbox_item item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbox.push_back(std::move(item));
        }
        cv.notify_one();
    }

    void wake() {
        cv.notify_all();
    }

    std::vector<inbox_item> drain(int64_t timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
            return !inbox.empty() || handle->token().is_cancelled();
        });
        std::vector<inbox_item> items(std::make_move_iterator(inbox.begin()), std::make_move_iterator(inbox.end()));
        inbox.clear();
        return items;
    }
};

} // namespace

static resilience_guard::config make_guard_config(const coord_params & p) {
    resilience_guard::config cfg;
    cfg.failure_threshold = p.failure_threshold;
    cfg.monitoring_period_ms = p.monitoring_period_ms;
    cfg.open_timeout_ms = p.open_timeout_ms;
    cfg.history_limit = p.failure_history_limit;
    cfg.dead_letter_capacity = p.dead_letter_capacity;
    return cfg;
}

static message_bus::config make_bus_config(const coord_params & p) {
    message_bus::config cfg;
    cfg.max_queue_depth = p.max_queue_depth;
    cfg.max_delivery_attempts = p.max_delivery_attempts;
    cfg.dispatch_poll_ms = p.poll_interval_ms;
    return cfg;
}

struct coordination_orchestrator::impl {
    coord_params params;
    const strategy_catalog & catalog;
    knowledge_store * store;

    resilience_guard guard;
    message_bus bus;
    agent_registry registry;
    task_distributor distributor;
    consensus_coordinator consensus;
    conflict_resolver resolver;
    decision_planner planner;
    message_deduplicator dedup;

    std::atomic<bool> running{false};
    std::thread router_thread;

    // Conflicts reported over the bus, resolved off the router thread
    struct pending_conflict {
        std::string domain;
        std::vector<conflicting_value> values;
    };
    std::deque<pending_conflict> conflicts;
    std::mutex conflicts_mutex;
    std::condition_variable conflicts_cv;
    std::thread conflict_thread;
    cancel_token conflict_cancel;

    std::map<std::string, std::shared_ptr<plan_run>> routes;  // plan id (any alias) -> run
    std::vector<std::shared_ptr<plan_run>> runs;
    mutable std::mutex runs_mutex;

    impl(const coord_params & p, const strategy_catalog & catalog_, knowledge_store * store_)
        : params(p), catalog(catalog_), store(store_),
          guard(make_guard_config(p)),
          bus(make_bus_config(p), &guard.dead_letters()),
          registry(p.heartbeat_interval_ms, p.heartbeat_miss_limit),
          distributor(p.feasibility_ceiling),
          consensus(bus, guard, p.coordinator_id, p.consensus_phase_timeout_ms, p.retry),
          resolver(store_, &consensus),
          planner(catalog_, store_, p.risk_threshold) {}

    std::shared_ptr<plan_run> find_run(const std::string & plan_id) const {
        std::lock_guard<std::mutex> lock(runs_mutex);
        auto it = routes.find(plan_id);
        return it == routes.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<plan_run>> live_runs() const {
        std::lock_guard<std::mutex> lock(runs_mutex);
        std::vector<std::shared_ptr<plan_run>> result;
        for (const auto & run : runs) {
            if (!run->handle->is_finished()) {
                result.push_back(run);
            }
        }
        return result;
    }

    // Join finished plan threads; runs_mutex held
    void reap_locked() {
        for (auto it = runs.begin(); it != runs.end();) {
            auto run = *it;
            if (!run->handle->is_finished()) {
                ++it;
                continue;
            }
            if (run->thread.joinable()) {
                run->thread.join();
            }
            for (const auto & alias : run->aliases) {
                routes.erase(alias);
            }
            it = runs.erase(it);
        }
    }

    // Tell the agent to stop a task it no longer owns
    void send_cancel(const std::string & agent_id, const std::string & task_id, const std::string & plan_id) {
        agent_message msg = agent_message::make(MESSAGE_TYPE_COORDINATION, params.coordinator_id, agent_id,
                                                make_cancel_request(task_id, plan_id));
        error_type err = bus.send(agent_id, msg, 0);
        if (err != ERROR_TYPE_NONE) {
            LOG_DBG("orchestrator: cancel for %s not delivered to %s: %s\n",
                    task_id.empty() ? plan_id.c_str() : task_id.c_str(), agent_id.c_str(), error_type_to_string(err));
        }
    }

    void release_slot(const std::string & agent_id) {
        if (!registry.release_slot(agent_id)) {
            LOG_DBG("orchestrator: no slot to release on %s\n", agent_id.c_str());
        }
    }

    //
    // Router
    //

    void route(const agent_message & msg) {
        if (!dedup.first_seen(msg.message_id)) {
            return;
        }

        json payload = msg.payload_json();
        if (payload.is_discarded() || !payload.is_object()) {
            LOG_WRN("orchestrator: unreadable payload from %s (%s)\n", msg.from_agent.c_str(), msg.message_id.c_str());
            return;
        }

        try {
            switch (msg.type) {
                case MESSAGE_TYPE_HEARTBEAT:
                    if (!registry.heartbeat(msg.from_agent, payload.value("load", 0.0))) {
                        LOG_DBG("orchestrator: heartbeat from unknown agent %s\n", msg.from_agent.c_str());
                    }
                    break;
                case MESSAGE_TYPE_RESPONSE: {
                    std::string plan_id = payload.value("plan_id", "");
                    auto run = find_run(plan_id);
                    if (!run) {
                        LOG_DBG("orchestrator: result for inactive plan '%s' from %s\n", plan_id.c_str(), msg.from_agent.c_str());
                        break;
                    }
                    inbox_item item;
                    item.kind = inbox_item::ITEM_RESULT;
                    item.msg = msg;
                    run->push(std::move(item));
                    break;
                }
                case MESSAGE_TYPE_CONFLICT: {
                    std::vector<conflicting_value> values;
                    for (const auto & v : payload.at("values")) {
                        values.push_back({v.value("agent_id", msg.from_agent), v.value("value", json()),
                                          v.value("timestamp", msg.timestamp)});
                    }
                    {
                        std::lock_guard<std::mutex> lock(conflicts_mutex);
                        conflicts.push_back({payload.value("domain", "unknown"), std::move(values)});
                    }
                    conflicts_cv.notify_one();
                    break;
                }
                case MESSAGE_TYPE_STATUS:
                    LOG_DBG("orchestrator: status from %s: %s\n", msg.from_agent.c_str(), msg.payload.c_str());
                    break;
                default:
                    LOG_DBG("orchestrator: ignoring %s message from %s\n",
                            message_type_to_string(msg.type), msg.from_agent.c_str());
                    break;
            }
        } catch (const json::exception & e) {
            LOG_WRN("orchestrator: malformed %s message from %s: %s\n",
                    message_type_to_string(msg.type), msg.from_agent.c_str(), e.what());
        }
    }

    // Expire silent agents and hand their work back to the plans
    void sweep() {
        for (const auto & agent_id : registry.sweep_heartbeats()) {
            release_agent(agent_id, "missed heartbeats");
        }
    }

    void release_agent(const std::string & agent_id, const char * reason) {
        std::vector<std::string> requeued = distributor.release_agent(agent_id);
        LOG_WRN("orchestrator: agent %s released (%s), %zu task(s) requeued\n", agent_id.c_str(), reason, requeued.size());

        for (const auto & task_id : requeued) {
            release_slot(agent_id);
            send_cancel(agent_id, task_id, "");
        }
        if (requeued.empty()) {
            return;
        }
        for (auto & run : live_runs()) {
            inbox_item item;
            item.kind = inbox_item::ITEM_AGENT_LOST;
            item.agent_id = agent_id;
            item.tasks = requeued;
            run->push(std::move(item));
        }
    }

    void router_loop() {
        int64_t last_sweep = get_timestamp_ms();
        while (running) {
            for (const auto & msg : bus.receive(params.coordinator_id, 100, params.poll_interval_ms)) {
                route(msg);
            }
            int64_t now = get_timestamp_ms();
            if (now - last_sweep >= params.heartbeat_interval_ms) {
                sweep();
                last_sweep = now;
            }
        }
    }

    void conflict_loop() {
        while (true) {
            pending_conflict next;
            {
                std::unique_lock<std::mutex> lock(conflicts_mutex);
                conflicts_cv.wait(lock, [this]() { return !running || !conflicts.empty(); });
                if (!running) {
                    if (!conflicts.empty()) {
                        LOG_WRN("orchestrator: %zu conflict(s) left unresolved at shutdown\n", conflicts.size());
                        conflicts.clear();
                    }
                    return;
                }
                next = std::move(conflicts.front());
                conflicts.pop_front();
            }
            report_conflict(next.domain, next.values, &conflict_cancel);
        }
    }

    resolution report_conflict(const std::string & domain, const std::vector<conflicting_value> & values,
                               const cancel_token * cancel = nullptr) {
        conflict c = resolver.make_conflict(domain, values);
        LOG_INF("orchestrator: conflict %s on %s with %zu value(s), severity %s\n",
                c.id.c_str(), domain.c_str(), values.size(), conflict_severity_to_string(c.severity));
        return resolver.resolve(c, {}, cancel);
    }

    //
    // Plan execution
    //

    error_type dispatch(const plan_run & run, const task_unit & unit, const std::string & agent_id, const cancel_token & cancel) {
        agent_message msg = agent_message::make(MESSAGE_TYPE_REQUEST, params.coordinator_id, agent_id,
                                                make_task_request(unit, run.plan.deadline, params.coordinator_id));
        msg.requires_response = true;
        msg.priority = message_priority(run.priority);

        return guard.execute_with_retry("agent:" + agent_id, [&]() {
            return bus.send(agent_id, msg, params.send_timeout_ms);
        }, params.retry, &cancel);
    }

    void execute_plan(std::shared_ptr<plan_run> run) {
        execution_handle & handle = *run->handle;
        const cancel_token & cancel = handle.token();
        const int64_t started = get_timestamp_ms();

        execution_result result;
        result.plan_id = run->plan_id;

        std::set<std::string> completed;
        std::set<std::string> failed;
        std::set<std::string> skipped;

        struct flight {
            std::string agent_id;
            int64_t dispatched_at;
        };
        std::map<std::string, flight> in_flight;
        std::map<std::string, int> requeues;
        std::map<std::string, std::vector<conflicting_value>> reports;
        std::set<std::string> disputed;
        int64_t last_progress = started;

        error_type last_error = ERROR_TYPE_NONE;
        std::string last_message;

        auto publish = [&](progress_kind kind, const std::string & task_id, const std::string & agent_id, const std::string & message) {
            progress_event event;
            event.kind = kind;
            event.plan_id = run->plan.id;
            event.task_id = task_id;
            event.agent_id = agent_id;
            event.message = message;
            event.timestamp = get_timestamp_ms();
            handle.publish(event);
        };

        auto is_finished = [&](const std::string & id) {
            return completed.count(id) > 0 || failed.count(id) > 0 || skipped.count(id) > 0;
        };
        auto is_satisfied = [&](const std::string & id) {
            return completed.count(id) > 0 || skipped.count(id) > 0;
        };

        auto recall = [&](const std::string & task_id) {
            auto f = in_flight.find(task_id);
            if (f == in_flight.end()) {
                return;
            }
            send_cancel(f->second.agent_id, task_id, "");
            if (distributor.complete(task_id)) {
                release_slot(f->second.agent_id);
            }
            in_flight.erase(f);
        };

        auto recall_all = [&]() {
            std::vector<std::string> ids;
            for (const auto & entry : in_flight) {
                ids.push_back(entry.first);
            }
            for (const auto & id : ids) {
                recall(id);
            }
        };

        auto try_replan = [&](const std::string & task_id) {
            std::set<std::string> done = completed;
            done.insert(skipped.begin(), skipped.end());
            registry_snapshot snapshot = registry.snapshot();

            planning_result next = planner.replan(run->plan, done, {task_id}, snapshot);
            if (!next.ok()) {
                LOG_WRN("orchestrator: replan of %s failed: %s\n", run->plan.id.c_str(), next.message.c_str());
                return false;
            }

            std::vector<std::string> voters;
            for (const auto & agent : snapshot.agents) {
                if (agent.status != AGENT_STATUS_UNREACHABLE) {
                    voters.push_back(agent.id);
                }
            }
            if (!voters.empty()) {
                json value = {
                    {"replan", next.plan.id},
                    {"replaces", run->plan.id},
                    {"failed_task", task_id},
                    {"units", next.plan.units.size()}
                };
                consensus_result vote = consensus.propose(voters, value, &cancel);
                if (!vote.accepted()) {
                    LOG_WRN("orchestrator: replan of %s not ratified: %s\n", run->plan.id.c_str(), vote.reason.c_str());
                    last_error = vote.status == CONSENSUS_CANCELLED ? ERROR_TYPE_CANCELLED : ERROR_TYPE_CONSENSUS_REJECTED;
                    last_message = "replan not ratified: " + vote.reason;
                    return false;
                }
            }

            recall_all();
            distributor.clear_plan(run->plan.id);
            {
                std::lock_guard<std::mutex> lock(runs_mutex);
                routes[next.plan.id] = run;
                run->aliases.push_back(next.plan.id);
            }

            std::string previous = run->plan.id;
            run->plan = std::move(next.plan);
            result.replans++;
            LOG_INF("orchestrator: plan %s replaced by %s after %s failed\n",
                    previous.c_str(), run->plan.id.c_str(), task_id.c_str());
            publish(PROGRESS_REPLANNED, task_id, "", "replaced " + previous);
            return true;
        };

        auto on_failure = [&](const std::string & task_id, error_type err, const std::string & message) {
            publish(PROGRESS_TASK_FAILED, task_id, "", std::string(error_type_to_string(err)) + ": " + message);

            const contingency_plan * fallback = run->plan.find_contingency(task_id);
            if (fallback && (fallback->trigger == TRIGGER_FAILURE || err == ERROR_TYPE_TIMEOUT) &&
                run->plan.substitute_contingency(task_id)) {
                LOG_INF("orchestrator: %s replaced by its contingency\n", task_id.c_str());
                publish(PROGRESS_CONTINGENCY, task_id, "", "fallback substituted");
                return;
            }

            const task_unit * unit = run->plan.find_unit(task_id);
            if (unit && unit->optional) {
                skipped.insert(task_id);
                publish(PROGRESS_TASK_SKIPPED, task_id, "", "optional unit failed");
                return;
            }

            if (err != ERROR_TYPE_CANCELLED && result.replans < params.max_replans && try_replan(task_id)) {
                return;
            }

            failed.insert(task_id);
            if (last_error == ERROR_TYPE_NONE) {
                last_error = err;
                last_message = task_id + " failed: " + message;
            }
        };

        auto on_result = [&](const agent_message & msg) {
            json payload = msg.payload_json();
            std::string task_id = payload.value("task_id", "");
            std::string agent_id = payload.value("agent_id", msg.from_agent);
            bool success = payload.value("success", false);
            error_type err = error_type_from_string(payload.value("error", std::string(error_type_to_string(ERROR_TYPE_NONE))));
            std::string output = payload.value("output", "");

            if (!success && err == ERROR_TYPE_NONE) {
                err = ERROR_TYPE_TASK_FAILED;
            }

            json report = {
                {"status", success ? "completed" : "failed"},
                {"output", output}
            };
            reports[task_id].push_back({agent_id, report, msg.timestamp});

            auto f = in_flight.find(task_id);
            if (f == in_flight.end() || f->second.agent_id != agent_id) {
                // Late or repeated report for a unit someone else owns or finished
                const auto & seen = reports[task_id];
                bool disagree = std::any_of(seen.begin(), seen.end(), [&seen](const conflicting_value & v) {
                    return v.value != seen.front().value;
                });
                if (is_finished(task_id) && disagree && disputed.count(task_id) == 0) {
                    conflict c = resolver.make_conflict("task/" + task_id, seen);
                    resolution res = resolver.resolve(c, {}, &cancel);
                    disputed.insert(task_id);
                    result.conflicts++;
                    char buf[128];
                    snprintf(buf, sizeof(buf), "%s, confidence %.2f", resolution_strategy_to_string(res.strategy), res.confidence);
                    publish(PROGRESS_CONFLICT_RESOLVED, task_id, agent_id, buf);
                }
                return;
            }

            in_flight.erase(f);
            if (distributor.complete(task_id)) {
                release_slot(agent_id);
            }
            last_progress = get_timestamp_ms();

            if (success) {
                completed.insert(task_id);
                publish(PROGRESS_TASK_COMPLETED, task_id, agent_id, payload.value("action", ""));
                return;
            }

            if ((err == ERROR_TYPE_OVERLOAD || err == ERROR_TYPE_UNAVAILABLE) &&
                ++requeues[task_id] <= params.retry.max_attempts) {
                publish(PROGRESS_TASK_REQUEUED, task_id, agent_id, error_type_to_string(err));
                return;
            }

            on_failure(task_id, err, output);
        };

        LOG_INF("orchestrator: executing plan %s (%zu units)\n", run->plan.id.c_str(), run->plan.units.size());
        publish(PROGRESS_PLAN_STARTED, "", "", std::to_string(run->plan.units.size()) + " unit(s)");

        execution_status status = EXECUTION_RUNNING;
        while (status == EXECUTION_RUNNING) {
            if (cancel.is_cancelled()) {
                recall_all();
                status = EXECUTION_CANCELLED;
                last_error = ERROR_TYPE_CANCELLED;
                last_message = "cancelled";
                break;
            }

            // Dispatch every unit whose predecessors are done
            std::vector<task_unit> ready;
            for (const auto & unit : run->plan.units) {
                if (is_finished(unit.id) || in_flight.count(unit.id) > 0) {
                    continue;
                }
                auto preds = run->plan.predecessors(unit.id);
                if (std::all_of(preds.begin(), preds.end(), is_satisfied)) {
                    ready.push_back(unit);
                }
            }

            if (!ready.empty()) {
                registry_snapshot snapshot = registry.snapshot();
                for (const auto & unit : ready) {
                    if (!capable_agent_exists(unit, snapshot)) {
                        status = EXECUTION_FAILED;
                        last_error = ERROR_TYPE_NO_CAPABLE_AGENT;
                        last_message = "no reachable agent can run " + unit.id;
                        break;
                    }
                }
                if (status != EXECUTION_RUNNING) {
                    recall_all();
                    break;
                }

                distribution_result dist = distributor.distribute(ready, snapshot, run->priority);
                for (const auto & a : dist.assignments) {
                    const task_unit * unit = run->plan.find_unit(a.task_id);
                    if (!unit) {
                        distributor.complete(a.task_id);
                        continue;
                    }

                    error_type err = dispatch(*run, *unit, a.agent_id, cancel);
                    if (err == ERROR_TYPE_NONE) {
                        in_flight[a.task_id] = {a.agent_id, get_timestamp_ms()};
                        if (!registry.acquire_slot(a.agent_id)) {
                            LOG_DBG("orchestrator: %s has no free slot in the registry\n", a.agent_id.c_str());
                        }
                        last_progress = get_timestamp_ms();
                        publish(PROGRESS_TASK_ASSIGNED, a.task_id, a.agent_id, "");
                        continue;
                    }

                    distributor.complete(a.task_id);
                    if (err == ERROR_TYPE_CIRCUIT_OPEN) {
                        result.circuit_open = true;
                    }
                    if (err == ERROR_TYPE_CANCELLED) {
                        break;
                    }
                    LOG_WRN("orchestrator: dispatch of %s to %s failed: %s\n",
                            a.task_id.c_str(), a.agent_id.c_str(), error_type_to_string(err));
                    on_failure(a.task_id, err, "dispatch failed");
                }
            }

            if (!failed.empty()) {
                recall_all();
                status = EXECUTION_FAILED;
                break;
            }

            bool all_done = std::all_of(run->plan.units.begin(), run->plan.units.end(),
                                        [&](const task_unit & u) { return is_finished(u.id); });
            if (all_done) {
                status = EXECUTION_COMPLETED;
                break;
            }

            int64_t now = get_timestamp_ms();
            if (in_flight.empty() && now - last_progress > params.task_timeout_ms) {
                status = EXECUTION_FAILED;
                last_error = ERROR_TYPE_UNAVAILABLE;
                last_message = "no agent took the remaining units";
                break;
            }

            for (auto & item : run->drain(params.poll_interval_ms)) {
                if (item.kind == inbox_item::ITEM_RESULT) {
                    try {
                        on_result(item.msg);
                    } catch (const json::exception & e) {
                        LOG_WRN("orchestrator: malformed result from %s: %s\n", item.msg.from_agent.c_str(), e.what());
                    }
                    continue;
                }
                for (const auto & task_id : item.tasks) {
                    auto f = in_flight.find(task_id);
                    if (f != in_flight.end() && f->second.agent_id == item.agent_id) {
                        in_flight.erase(f);
                        publish(PROGRESS_TASK_REQUEUED, task_id, item.agent_id, "agent unreachable");
                    }
                }
            }

            // Units overdue on their agent
            int64_t limit = params.task_timeout_ms + params.round_trip_timeout_ms;
            std::vector<std::pair<std::string, std::string>> overdue;
            for (const auto & [task_id, f] : in_flight) {
                if (get_timestamp_ms() - f.dispatched_at > limit) {
                    overdue.emplace_back(task_id, f.agent_id);
                }
            }
            for (const auto & [task_id, agent_id] : overdue) {
                recall(task_id);
                failure_record record;
                record.site = "agent:" + agent_id;
                record.error = ERROR_TYPE_TIMEOUT;
                record.error_message = "no result for " + task_id;
                record.timestamp = get_timestamp_ms();
                guard.record_failure(record);
                on_failure(task_id, ERROR_TYPE_TIMEOUT, "no result within " + std::to_string(limit) + " ms");
            }
        }

        result.status = status;
        result.error = status == EXECUTION_COMPLETED ? ERROR_TYPE_NONE : last_error;
        if (status == EXECUTION_FAILED && result.error == ERROR_TYPE_NONE) {
            result.error = ERROR_TYPE_TASK_FAILED;
        }
        result.category = error_category_of(result.error);
        result.message = status == EXECUTION_COMPLETED ? "all units finished" : last_message;
        result.completed.assign(completed.begin(), completed.end());
        result.failed.assign(failed.begin(), failed.end());
        result.skipped.assign(skipped.begin(), skipped.end());
        result.duration_ms = get_timestamp_ms() - started;

        distributor.clear_plan(run->plan.id);
        if (store && !store->save_plan(run->plan)) {
            LOG_WRN("orchestrator: knowledge store did not take plan %s\n", run->plan.id.c_str());
        }

        LOG_INF("orchestrator: plan %s %s in %lld ms (%zu completed, %zu failed, %zu skipped, %d replan(s))\n",
                run->plan_id.c_str(), execution_status_to_string(status), static_cast<long long>(result.duration_ms),
                result.completed.size(), result.failed.size(), result.skipped.size(), result.replans);

        publish(PROGRESS_PLAN_FINISHED, "", "", execution_status_to_string(status));
        handle.finish(result);
    }
};

coordination_orchestrator::coordination_orchestrator(const coord_params & params,
                                                     const strategy_catalog & catalog,
                                                     knowledge_store * store)
    : pimpl(std::make_unique<impl>(params, catalog, store)) {
    if (!pimpl->bus.subscribe(params.coordinator_id)) {
        LOG_ERR("orchestrator: mailbox %s already exists\n", params.coordinator_id.c_str());
    }
}

coordination_orchestrator::~coordination_orchestrator() {
    stop();
}

void coordination_orchestrator::start() {
    if (pimpl->running.exchange(true)) {
        return;
    }
    pimpl->bus.start();
    pimpl->conflict_cancel = cancel_token();
    pimpl->router_thread = std::thread(&impl::router_loop, pimpl.get());
    pimpl->conflict_thread = std::thread(&impl::conflict_loop, pimpl.get());
    LOG_INF("orchestrator: %s started\n", pimpl->params.coordinator_id.c_str());
}

void coordination_orchestrator::stop() {
    if (!pimpl->running.exchange(false)) {
        return;
    }

    std::vector<std::shared_ptr<plan_run>> runs;
    {
        std::lock_guard<std::mutex> lock(pimpl->runs_mutex);
        runs = pimpl->runs;
    }
    for (auto & run : runs) {
        run->handle->cancel();
        run->wake();
    }
    for (auto & run : runs) {
        if (run->thread.joinable()) {
            run->thread.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(pimpl->runs_mutex);
        pimpl->reap_locked();
    }

    if (pimpl->router_thread.joinable()) {
        pimpl->router_thread.join();
    }

    pimpl->conflict_cancel.cancel();
    {
        // The waiter checks running under this mutex
        std::lock_guard<std::mutex> lock(pimpl->conflicts_mutex);
    }
    pimpl->conflicts_cv.notify_all();
    if (pimpl->conflict_thread.joinable()) {
        pimpl->conflict_thread.join();
    }
    pimpl->bus.stop();
    LOG_INF("orchestrator: %s stopped\n", pimpl->params.coordinator_id.c_str());
}

bool coordination_orchestrator::is_running() const {
    return pimpl->running;
}

planning_result coordination_orchestrator::plan_objective(const objective & obj) {
    return pimpl->planner.plan(obj, pimpl->registry.snapshot());
}

std::shared_ptr<execution_handle> coordination_orchestrator::distribute_and_execute(const task_plan & plan,
                                                                                   priority_level priority) {
    auto handle = std::make_shared<execution_handle>(plan.id, pimpl->params.progress_channel_capacity, cancel_token());

    auto reject = [&handle, &plan](error_type err, const std::string & message) {
        LOG_WRN("orchestrator: plan %s not started: %s\n", plan.id.c_str(), message.c_str());
        execution_result result;
        result.plan_id = plan.id;
        result.status = err == ERROR_TYPE_CANCELLED ? EXECUTION_CANCELLED : EXECUTION_FAILED;
        result.error = err;
        result.category = error_category_of(err);
        result.message = message;
        handle->finish(result);
        return handle;
    };

    if (!pimpl->running) {
        return reject(ERROR_TYPE_UNAVAILABLE, "orchestrator not running");
    }
    if (plan.id.empty() || plan.units.empty()) {
        return reject(ERROR_TYPE_INVALID_REQUEST, "plan has no units");
    }
    if (!plan.is_acyclic()) {
        return reject(ERROR_TYPE_INVALID_REQUEST, "plan dependencies contain a cycle");
    }

    std::lock_guard<std::mutex> lock(pimpl->runs_mutex);
    pimpl->reap_locked();
    if (pimpl->routes.count(plan.id) > 0) {
        return reject(ERROR_TYPE_INVALID_REQUEST, "plan " + plan.id + " is already executing");
    }

    auto run = std::make_shared<plan_run>();
    run->plan_id = plan.id;
    run->plan = plan;
    run->priority = priority;
    run->handle = handle;
    run->aliases.push_back(plan.id);

    pimpl->routes[plan.id] = run;
    pimpl->runs.push_back(run);
    run->thread = std::thread(&impl::execute_plan, pimpl.get(), run);
    return handle;
}

bool coordination_orchestrator::cancel_execution(const std::string & plan_id) {
    auto run = pimpl->find_run(plan_id);
    if (!run || run->handle->is_finished()) {
        return false;
    }
    LOG_INF("orchestrator: cancelling plan %s\n", plan_id.c_str());
    run->handle->cancel();
    run->wake();
    return true;
}

coordination_health coordination_orchestrator::get_coordination_health() const {
    coordination_health health;
    health.timestamp = get_timestamp_ms();

    auto stats = pimpl->registry.get_stats();
    health.active_agents = stats.available_agents + stats.busy_agents + stats.draining_agents;
    health.unreachable_agents = stats.unreachable_agents;
    health.active_plans = static_cast<int>(pimpl->live_runs().size());
    health.active_assignments = static_cast<int>(pimpl->distributor.active_assignments().size());
    health.queue_depths = pimpl->bus.queue_depths();
    health.circuit_states = pimpl->guard.circuit_states();
    health.dead_letters = pimpl->guard.dead_letters().size();

    if (!pimpl->running) {
        health.reasons.push_back("orchestrator not running");
    }
    if (health.active_agents == 0) {
        health.reasons.push_back("no reachable agents");
    }
    bool unhealthy = !health.reasons.empty();

    if (health.unreachable_agents > 0) {
        health.reasons.push_back(std::to_string(health.unreachable_agents) + " unreachable agent(s)");
    }
    for (const auto & [site, state] : health.circuit_states) {
        if (state != CIRCUIT_CLOSED) {
            health.reasons.push_back("circuit " + site + " " + circuit_state_to_string(state));
        }
    }
    size_t high_water = pimpl->params.max_queue_depth - pimpl->params.max_queue_depth / 5;
    for (const auto & [mailbox, depth] : health.queue_depths) {
        if (depth >= high_water) {
            health.reasons.push_back("mailbox " + mailbox + " near capacity");
        }
    }
    if (health.dead_letters > 0) {
        health.reasons.push_back(std::to_string(health.dead_letters) + " dead letter(s)");
    }

    if (unhealthy) {
        health.status = HEALTH_UNHEALTHY;
    } else if (!health.reasons.empty()) {
        health.status = HEALTH_DEGRADED;
    } else {
        health.status = HEALTH_HEALTHY;
    }
    return health;
}

bool coordination_orchestrator::register_agent(const agent_instance & agent) {
    if (!pimpl->registry.register_agent(agent)) {
        LOG_WRN("orchestrator: agent '%s' not registered\n", agent.id.c_str());
        return false;
    }
    LOG_INF("orchestrator: agent %s registered (%zu capabilities)\n", agent.id.c_str(), agent.capabilities.size());
    return true;
}

bool coordination_orchestrator::unregister_agent(const std::string & agent_id) {
    if (!pimpl->registry.get_agent(agent_id)) {
        return false;
    }
    pimpl->release_agent(agent_id, "unregistered");
    return pimpl->registry.unregister_agent(agent_id);
}

bool coordination_orchestrator::drain_agent(const std::string & agent_id, bool draining) {
    if (!pimpl->registry.set_draining(agent_id, draining)) {
        return false;
    }
    LOG_INF("orchestrator: agent %s %s\n", agent_id.c_str(), draining ? "draining" : "accepting work");
    return true;
}

resolution coordination_orchestrator::report_conflict(const std::string & domain, const std::vector<conflicting_value> & values) {
    return pimpl->report_conflict(domain, values);
}

const coord_params & coordination_orchestrator::params() const { return pimpl->params; }
const std::string & coordination_orchestrator::address() const { return pimpl->params.coordinator_id; }
message_bus & coordination_orchestrator::bus() { return pimpl->bus; }
resilience_guard & coordination_orchestrator::guard() { return pimpl->guard; }
agent_registry & coordination_orchestrator::registry() { return pimpl->registry; }
task_distributor & coordination_orchestrator::distributor() { return pimpl->distributor; }
consensus_coordinator & coordination_orchestrator::consensus() { return pimpl->consensus; }
conflict_resolver & coordination_orchestrator::resolver() { return pimpl->resolver; }
decision_planner & coordination_orchestrator::planner() { return pimpl->planner; }

} // namespace coord
