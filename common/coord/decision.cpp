#include "decision.h"
#include "../log.h"

#include <algorithm>
#include <chrono>
#include <future>

namespace coord {

// decision_log
void decision_log::append(const decision & d) {
    std::lock_guard<std::mutex> lock(mutex);
    log.push_back(d);
}

std::vector<decision> decision_log::entries() const {
    std::lock_guard<std::mutex> lock(mutex);
    return log;
}

std::vector<decision> decision_log::for_task(const std::string & task_id) const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<decision> result;
    for (const auto & d : log) {
        if (d.task_id == task_id) {
            result.push_back(d);
        }
    }
    return result;
}

std::optional<decision> decision_log::last() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (log.empty()) {
        return std::nullopt;
    }
    return log.back();
}

size_t decision_log::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return log.size();
}

json decision_log::to_json() const {
    std::lock_guard<std::mutex> lock(mutex);

    json j = json::array();
    for (const auto & d : log) {
        j.push_back(d.to_json());
    }
    return j;
}

json engine_outcome::to_json() const {
    json decisions_json = json::array();
    for (const auto & d : decisions) {
        decisions_json.push_back(d.to_json());
    }
    return json{
        {"terminal", decision_terminal_to_string(terminal)},
        {"error", error_type_to_string(error)},
        {"message", message},
        {"action", action},
        {"last", last.to_json()},
        {"attempts", attempts},
        {"backtracks", backtracks},
        {"decisions", decisions_json}
    };
}

static std::string action_key(action_kind kind, const std::string & variant) {
    return std::string(action_kind_to_string(kind)) + "/" + variant;
}

sequential_decision_engine::sequential_decision_engine(const strategy_catalog & catalog,
                                                       pattern_executor & executor,
                                                       knowledge_store * store,
                                                       int64_t task_timeout_ms)
    : catalog(catalog), executor(executor), store(store),
      task_timeout_ms(task_timeout_ms > 0 ? task_timeout_ms : 30000) {}

double sequential_decision_engine::score_variant(const action_variant & variant,
                                                 action_kind kind,
                                                 const task_unit & task,
                                                 double match,
                                                 const std::vector<historical_pattern> & patterns,
                                                 int64_t deadline_ms) const {
    const auto & w = catalog.weights;
    std::string key = action_key(kind, variant.id);

    double p = variant.base_success;
    for (const auto & pattern : patterns) {
        if (pattern.action == key && pattern.samples() > 0) {
            p = (1.0 - w.history_bias) * p + w.history_bias * pattern.success_rate();
        }
    }
    p *= match;

    double cost_efficiency = 1.0 / std::max(0.1, variant.relative_cost);

    double deadline_fit = 1.0;
    if (deadline_ms > 0) {
        double expected = std::max(1.0, static_cast<double>(task.estimated_duration_ms) * variant.relative_cost);
        double remaining = static_cast<double>(deadline_ms - get_timestamp_ms());
        if (remaining < expected) {
            deadline_fit = std::max(w.deadline_fit_floor, remaining / expected);
        }
    }

    return p * cost_efficiency * deadline_fit;
}

engine_outcome sequential_decision_engine::run(const task_unit & task,
                                               const std::vector<agent_capability> & capabilities,
                                               const cancel_token & cancel,
                                               int64_t deadline_ms) {
    engine_outcome out;

    const std::string context = task.capabilities.empty() ? catalog.default_capability : task.capabilities.front();
    const int64_t budget_ms = task.timeout_ms > 0 ? std::min(task.timeout_ms, task_timeout_ms) : task_timeout_ms;
    const int64_t task_deadline = get_timestamp_ms() + budget_ms;

    auto offers = [&capabilities](const std::string & tag) {
        for (const auto & cap : capabilities) {
            if (cap.tag == tag) {
                return cap.confidence;
            }
        }
        return 0.0;
    };

    double match = 1.0;
    for (const auto & tag : task.capabilities) {
        match = std::min(match, offers(tag));
    }
    match = std::max(0.1, match);

    auto load_patterns = [this, &context]() {
        if (!store) {
            return std::vector<historical_pattern>();
        }
        return store->query_historical_patterns(context);
    };
    std::vector<historical_pattern> patterns = load_patterns();

    std::string parent;
    auto record = [&](decision d) {
        d.id = generate_uuid();
        d.task_id = task.id;
        d.parent_id = parent;
        d.context = context;
        d.timestamp = get_timestamp_ms();
        d.confidence = std::min(1.0, std::max(0.0, d.confidence));
        history.append(d);
        out.decisions.push_back(d);
        parent = d.id;
        return d;
    };

    auto finish = [&](decision_terminal terminal, error_type err, const std::string & msg) {
        decision d;
        d.type = terminal == TERMINAL_COMPLETED ? DECISION_OPERATIONAL : DECISION_REACTIVE;
        d.action = decision_terminal_to_string(terminal);
        d.terminal = terminal;
        d.confidence = terminal == TERMINAL_COMPLETED ? 1.0 : 0.0;
        d.rationale = msg;
        record(d);

        out.terminal = terminal;
        out.error = err;
        out.message = msg;
        LOG_DBG("engine: task %s %s after %d attempt(s): %s\n",
                task.id.c_str(), decision_terminal_to_string(terminal), out.attempts, msg.c_str());
        return out;
    };

    struct kind_option {
        action_kind kind;
        std::vector<action_variant> variants;
    };

    // Dispatch table bounded by what the agent offers
    std::vector<kind_option> kinds_left;
    for (const auto & entry : catalog.actions) {
        kind_option option{entry.kind, {}};
        for (const auto & variant : entry.variants) {
            bool eligible = std::all_of(variant.required_capabilities.begin(), variant.required_capabilities.end(),
                                        [&offers](const std::string & tag) { return offers(tag) > 0.0; });
            if (eligible) {
                option.variants.push_back(variant);
            }
        }
        if (!option.variants.empty()) {
            kinds_left.push_back(option);
        }
    }

    if (kinds_left.empty()) {
        return finish(TERMINAL_FAILED, ERROR_TYPE_NO_CAPABLE_AGENT, "no action variant fits the agent's capabilities");
    }

    auto variant_score = [&](action_kind kind, const action_variant & v) {
        return score_variant(v, kind, task, match, patterns, deadline_ms);
    };
    auto kind_score = [&](const kind_option & option) {
        double best = 0.0;
        for (const auto & v : option.variants) {
            best = std::max(best, variant_score(option.kind, v));
        }
        return best;
    };

    action_kind current_kind = kinds_left.front().kind;
    std::vector<action_variant> variants_left;
    std::string strategic_id;
    bool need_strategic = true;

    while (true) {
        if (cancel.is_cancelled()) {
            return finish(TERMINAL_CANCELLED, ERROR_TYPE_CANCELLED, "cancelled before dispatch");
        }
        if (get_timestamp_ms() >= task_deadline) {
            return finish(TERMINAL_FAILED, ERROR_TYPE_TIMEOUT, "task timed out");
        }

        if (need_strategic) {
            std::stable_sort(kinds_left.begin(), kinds_left.end(), [&](const kind_option & a, const kind_option & b) {
                return kind_score(a) > kind_score(b);
            });

            decision d;
            d.type = DECISION_STRATEGIC;
            d.action = action_kind_to_string(kinds_left.front().kind);
            d.confidence = kind_score(kinds_left.front());
            for (const auto & option : kinds_left) {
                d.alternatives.push_back({action_kind_to_string(option.kind), kind_score(option),
                                          std::to_string(option.variants.size()) + " variant(s)"});
                if (option.kind != kinds_left.front().kind) {
                    d.rejected.push_back(action_kind_to_string(option.kind));
                }
            }
            d.rationale = out.backtracks > 0 ? "re-scored remaining kinds after backtracking"
                                             : "best expected value among " + std::to_string(kinds_left.size()) + " kind(s)";
            strategic_id = record(d).id;

            current_kind = kinds_left.front().kind;
            variants_left = kinds_left.front().variants;
            kinds_left.erase(kinds_left.begin());
            need_strategic = false;
        }

        std::stable_sort(variants_left.begin(), variants_left.end(), [&](const action_variant & a, const action_variant & b) {
            return variant_score(current_kind, a) > variant_score(current_kind, b);
        });

        action_variant variant = variants_left.front();
        variants_left.erase(variants_left.begin());
        std::string key = action_key(current_kind, variant.id);

        decision tactical;
        tactical.type = DECISION_TACTICAL;
        tactical.action = key;
        tactical.confidence = variant_score(current_kind, variant);
        tactical.alternatives.push_back({key, tactical.confidence, "pattern " + variant.pattern_id});
        for (const auto & other : variants_left) {
            std::string other_key = action_key(current_kind, other.id);
            tactical.alternatives.push_back({other_key, variant_score(current_kind, other), "pattern " + other.pattern_id});
            tactical.rejected.push_back(other_key);
        }
        tactical.rationale = "highest scoring variant of " + std::string(action_kind_to_string(current_kind));
        tactical = record(tactical);

        // Dispatch and await the outcome
        out.attempts++;
        out.action = key;

        json ctx = {
            {"task_id", task.id},
            {"plan_id", task.plan_id},
            {"description", task.description},
            {"phase", task.phase},
            {"capabilities", task.capabilities},
            {"action_kind", action_kind_to_string(current_kind)},
            {"variant", variant.id},
            {"attempt", out.attempts}
        };

        cancel_token attempt = cancel.child();
        std::future<execution_outcome> pending = std::async(std::launch::async, [this, variant, ctx, attempt]() {
            return executor.execute_pattern(variant.pattern_id, ctx, attempt);
        });

        bool timed_out = false;
        while (pending.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
            if (cancel.is_cancelled()) {
                attempt.cancel();
                break;
            }
            if (get_timestamp_ms() >= task_deadline) {
                timed_out = true;
                attempt.cancel();
                break;
            }
        }

        execution_outcome result;
        try {
            result = pending.get();
        } catch (const std::exception & e) {
            LOG_ERR("engine: pattern %s threw: %s\n", variant.pattern_id.c_str(), e.what());
            result.success = false;
            result.error = ERROR_TYPE_INTERNAL_ERROR;
            result.output = e.what();
        }
        out.last = result;

        if (store && !store->save_decision_outcome(tactical, result)) {
            LOG_WRN("engine: outcome of %s for %s not stored\n", key.c_str(), task.id.c_str());
        }

        if (cancel.is_cancelled()) {
            return finish(TERMINAL_CANCELLED, ERROR_TYPE_CANCELLED, "cancelled while running " + key);
        }
        if (timed_out) {
            return finish(TERMINAL_FAILED, ERROR_TYPE_TIMEOUT, key + " exceeded the task timeout");
        }
        if (result.success) {
            return finish(TERMINAL_COMPLETED, ERROR_TYPE_NONE, key + " succeeded");
        }

        // Backtrack to the nearest decision with untried alternatives
        patterns = load_patterns();
        std::string failure = key + " failed (" + error_type_to_string(result.error) + ")";

        if (!variants_left.empty()) {
            decision d;
            d.type = DECISION_REACTIVE;
            d.action = "backtrack:" + strategic_id;
            d.rationale = failure + ", trying another " + action_kind_to_string(current_kind) + " variant";
            record(d);
            out.backtracks++;
            continue;
        }

        if (!kinds_left.empty()) {
            std::string target = out.decisions.front().id;
            decision d;
            d.type = DECISION_REACTIVE;
            d.action = "backtrack:" + target;
            d.rationale = failure + ", every " + std::string(action_kind_to_string(current_kind)) +
                          " variant exhausted, revisiting the strategy";
            record(d);
            out.backtracks++;
            need_strategic = true;
            continue;
        }

        error_type err = result.error != ERROR_TYPE_NONE ? result.error : ERROR_TYPE_TASK_FAILED;
        return finish(TERMINAL_FAILED, err, failure + ", no alternatives left");
    }
}

} // namespace coord
