#include "worker.h"
#include "../log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace coord {

json make_task_request(const task_unit & unit, int64_t deadline_ms, const std::string & reply_to) {
    return json{
        {"task", unit.to_json()},
        {"deadline_ms", deadline_ms},
        {"reply_to", reply_to}
    };
}

json make_cancel_request(const std::string & task_id, const std::string & plan_id) {
    json j = {{"control", "cancel"}};
    if (!task_id.empty()) {
        j["task_id"] = task_id;
    }
    if (!plan_id.empty()) {
        j["plan_id"] = plan_id;
    }
    return j;
}

struct worker_agent::impl {
    config cfg;
    message_bus & bus;
    pattern_executor & executor;
    sequential_decision_engine engine;
    consensus_participant voter;
    message_deduplicator dedup;

    struct running_task {
        std::string plan_id;
        cancel_token cancel;
    };

    std::map<std::string, running_task> running;  // task id -> running task
    std::map<uint64_t, std::thread> task_threads;  // sequence -> thread
    std::vector<uint64_t> finished_threads;        // exited, not yet joined
    uint64_t next_thread = 0;
    mutable std::mutex mutex;

    std::atomic<bool> active{false};
    std::atomic<bool> heartbeats_paused{false};
    std::atomic<bool> drop_votes{false};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};

    std::thread heartbeat_thread;
    std::mutex heartbeat_mutex;
    std::condition_variable heartbeat_cv;

    impl(const config & cfg_, message_bus & bus_, const strategy_catalog & catalog,
         pattern_executor & executor_, knowledge_store * store)
        : cfg(cfg_), bus(bus_), executor(executor_),
          engine(catalog, executor_, store, cfg_.task_timeout_ms),
          voter(cfg_.id) {}

    double load() const {
        std::lock_guard<std::mutex> lock(mutex);
        int capacity = std::max(1, cfg.capacity);
        return std::min(1.0, static_cast<double>(running.size()) / capacity);
    }

    void send_to(const std::string & to, const agent_message & msg) {
        error_type err = bus.send(to, msg, cfg.send_timeout_ms);
        if (err != ERROR_TYPE_NONE) {
            LOG_WRN("worker %s: send to %s failed: %s\n", cfg.id.c_str(), to.c_str(), error_type_to_string(err));
        }
    }

    void send_heartbeat() {
        int active_tasks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            active_tasks = static_cast<int>(running.size());
        }
        json payload = {
            {"load", load()},
            {"active_tasks", active_tasks}
        };
        send_to(cfg.coordinator_address,
                agent_message::make(MESSAGE_TYPE_HEARTBEAT, cfg.id, cfg.coordinator_address, payload));
    }

    void heartbeat_loop() {
        while (active) {
            if (!heartbeats_paused) {
                send_heartbeat();
            }
            std::unique_lock<std::mutex> lock(heartbeat_mutex);
            heartbeat_cv.wait_for(lock, std::chrono::milliseconds(cfg.heartbeat_interval_ms),
                                  [this]() { return !active; });
        }
    }

    void reply_result(const agent_message & request,
                      const std::string & reply_to,
                      const task_unit & unit,
                      const engine_outcome & outcome) {
        json payload = {
            {"task_id", unit.id},
            {"plan_id", unit.plan_id},
            {"agent_id", cfg.id},
            {"success", outcome.succeeded()},
            {"error", error_type_to_string(outcome.error)},
            {"output", outcome.last.output},
            {"report", outcome.last.report},
            {"action", outcome.action},
            {"attempts", outcome.attempts},
            {"backtracks", outcome.backtracks}
        };
        agent_message msg = agent_message::make(MESSAGE_TYPE_RESPONSE, cfg.id, reply_to, payload);
        msg.correlation_id = request.message_id;
        send_to(reply_to, msg);
    }

    void reply_rejected(const agent_message & request, const std::string & reply_to,
                        const task_unit & unit, error_type err, const std::string & reason) {
        json payload = {
            {"task_id", unit.id},
            {"plan_id", unit.plan_id},
            {"agent_id", cfg.id},
            {"success", false},
            {"error", error_type_to_string(err)},
            {"output", reason}
        };
        agent_message msg = agent_message::make(MESSAGE_TYPE_RESPONSE, cfg.id, reply_to, payload);
        msg.correlation_id = request.message_id;
        send_to(reply_to, msg);
    }

    // Join task threads that have announced their exit
    void reap_finished() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (uint64_t seq : finished_threads) {
                auto it = task_threads.find(seq);
                if (it != task_threads.end()) {
                    done.push_back(std::move(it->second));
                    task_threads.erase(it);
                }
            }
            finished_threads.clear();
        }
        for (auto & t : done) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    void run_task(uint64_t seq, agent_message request, std::string reply_to, task_unit unit, int64_t deadline_ms, cancel_token cancel) {
        LOG_DBG("worker %s: running %s\n", cfg.id.c_str(), unit.id.c_str());

        engine_outcome outcome = engine.run(unit, cfg.capabilities, cancel, deadline_ms);

        {
            std::lock_guard<std::mutex> lock(mutex);
            running.erase(unit.id);
        }
        if (outcome.succeeded()) {
            completed++;
        } else {
            failed++;
        }

        LOG_INF("worker %s: task %s %s via %s\n", cfg.id.c_str(), unit.id.c_str(),
                decision_terminal_to_string(outcome.terminal), outcome.action.c_str());
        reply_result(request, reply_to, unit, outcome);

        std::lock_guard<std::mutex> lock(mutex);
        finished_threads.push_back(seq);
    }

    void handle_task(const agent_message & msg, const json & payload) {
        std::string reply_to = msg.from_agent;
        task_unit unit;
        int64_t deadline_ms = 0;
        try {
            reply_to = payload.value("reply_to", msg.from_agent);
            unit = task_unit::from_json(payload.at("task"));
            deadline_ms = payload.value("deadline_ms", static_cast<int64_t>(0));
        } catch (const json::exception & e) {
            LOG_WRN("worker %s: malformed task request %s: %s\n", cfg.id.c_str(), msg.message_id.c_str(), e.what());
            reply_rejected(msg, reply_to, unit, ERROR_TYPE_INVALID_REQUEST, e.what());
            return;
        }

        if (unit.id.empty()) {
            reply_rejected(msg, reply_to, unit, ERROR_TYPE_INVALID_REQUEST, "task without id");
            return;
        }

        reap_finished();

        std::lock_guard<std::mutex> lock(mutex);
        if (!active) {
            reply_rejected(msg, reply_to, unit, ERROR_TYPE_UNAVAILABLE, "worker stopping");
            return;
        }
        if (running.count(unit.id) > 0) {
            LOG_DBG("worker %s: %s already running\n", cfg.id.c_str(), unit.id.c_str());
            return;
        }
        if (static_cast<int>(running.size()) >= std::max(1, cfg.capacity)) {
            reply_rejected(msg, reply_to, unit, ERROR_TYPE_OVERLOAD, "no free task slot");
            return;
        }

        running_task task;
        task.plan_id = unit.plan_id;
        running[unit.id] = task;
        uint64_t seq = next_thread++;
        task_threads.emplace(seq, std::thread(&impl::run_task, this, seq, msg, reply_to, unit, deadline_ms, task.cancel));
    }

    void handle_cancel(const json & payload) {
        std::string task_id = payload.value("task_id", "");
        std::string plan_id = payload.value("plan_id", "");

        std::lock_guard<std::mutex> lock(mutex);
        for (auto & entry : running) {
            if ((!task_id.empty() && entry.first == task_id) ||
                (!plan_id.empty() && entry.second.plan_id == plan_id)) {
                entry.second.cancel.cancel();
                LOG_DBG("worker %s: cancelling %s\n", cfg.id.c_str(), entry.first.c_str());
            }
        }
    }

    bool on_message(const agent_message & msg) {
        if (!dedup.first_seen(msg.message_id)) {
            return true;
        }

        if (consensus_participant::is_consensus_message(msg)) {
            if (drop_votes) {
                return true;
            }
            auto reply = voter.handle(msg);
            if (reply && !reply->recipients.empty()) {
                send_to(reply->recipients.front(), *reply);
            }
            return true;
        }

        json payload = msg.payload_json();
        if (payload.is_discarded() || !payload.is_object()) {
            LOG_WRN("worker %s: unreadable payload in %s\n", cfg.id.c_str(), msg.message_id.c_str());
            return true;
        }

        switch (msg.type) {
            case MESSAGE_TYPE_REQUEST:
                handle_task(msg, payload);
                break;
            case MESSAGE_TYPE_COORDINATION:
                if (payload.value("control", "") == "cancel") {
                    handle_cancel(payload);
                }
                break;
            default:
                LOG_DBG("worker %s: ignoring %s message\n", cfg.id.c_str(), message_type_to_string(msg.type));
                break;
        }
        return true;
    }
};

worker_agent::worker_agent(const config & cfg,
                           message_bus & bus,
                           const strategy_catalog & catalog,
                           pattern_executor & executor,
                           knowledge_store * store)
    : pimpl(std::make_unique<impl>(cfg, bus, catalog, executor, store)) {}

worker_agent::~worker_agent() {
    stop();
}

bool worker_agent::start() {
    if (pimpl->active) {
        return true;
    }

    pimpl->active = true;
    if (!pimpl->bus.subscribe(pimpl->cfg.id, [this](const agent_message & msg) { return pimpl->on_message(msg); })) {
        pimpl->active = false;
        LOG_ERR("worker %s: mailbox already taken\n", pimpl->cfg.id.c_str());
        return false;
    }

    pimpl->heartbeat_thread = std::thread(&impl::heartbeat_loop, pimpl.get());
    LOG_INF("worker %s: started (%zu capabilities, capacity %d)\n",
            pimpl->cfg.id.c_str(), pimpl->cfg.capabilities.size(), pimpl->cfg.capacity);
    return true;
}

void worker_agent::stop() {
    if (!pimpl->active.exchange(false)) {
        return;
    }

    pimpl->heartbeat_cv.notify_all();
    if (pimpl->heartbeat_thread.joinable()) {
        pimpl->heartbeat_thread.join();
    }

    std::map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (auto & entry : pimpl->running) {
            entry.second.cancel.cancel();
        }
        threads.swap(pimpl->task_threads);
        pimpl->finished_threads.clear();
    }
    for (auto & entry : threads) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    if (!pimpl->bus.unsubscribe(pimpl->cfg.id)) {
        LOG_WRN("worker %s: mailbox already gone\n", pimpl->cfg.id.c_str());
    }
    LOG_INF("worker %s: stopped\n", pimpl->cfg.id.c_str());
}

bool worker_agent::is_running() const {
    return pimpl->active;
}

const std::string & worker_agent::id() const {
    return pimpl->cfg.id;
}

agent_instance worker_agent::describe() const {
    agent_instance agent;
    agent.id = pimpl->cfg.id;
    agent.name = pimpl->cfg.name.empty() ? pimpl->cfg.id : pimpl->cfg.name;
    agent.capabilities = pimpl->cfg.capabilities;
    agent.capacity = std::max(1, pimpl->cfg.capacity);
    agent.load = pimpl->load();
    return agent;
}

void worker_agent::pause_heartbeats(bool paused) {
    pimpl->heartbeats_paused = paused;
}

void worker_agent::set_vote_policy(consensus_participant::vote_policy policy) {
    pimpl->voter.set_vote_policy(std::move(policy));
}

void worker_agent::set_drop_votes(bool drop) {
    pimpl->drop_votes = drop;
}

int worker_agent::tasks_running() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return static_cast<int>(pimpl->running.size());
}

size_t worker_agent::retained_threads() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->task_threads.size();
}

int worker_agent::tasks_completed() const {
    return pimpl->completed;
}

int worker_agent::tasks_failed() const {
    return pimpl->failed;
}

const decision_log & worker_agent::decisions() const {
    return pimpl->engine.log();
}

consensus_participant & worker_agent::participant() {
    return pimpl->voter;
}

} // namespace coord
