// Tests for the sequential decision engine

#include "coord/decision.h"
#include "log.h"
#include "testing.h"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace coord;

// Outcomes scripted per pattern id; unscripted patterns succeed
class scripted_executor : public pattern_executor {
public:
    enum behavior {
        SUCCEED,
        FAIL,
        THROW,
        BLOCK   // Until cancelled
    };

    std::map<std::string, behavior> script;
    std::atomic<bool> saw_cancel{false};

    execution_outcome execute_pattern(const std::string & pattern_id,
                                      const json & context,
                                      const cancel_token & cancel) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(pattern_id);
            contexts.push_back(context);
        }

        behavior b = script.count(pattern_id) ? script[pattern_id] : SUCCEED;
        execution_outcome outcome;
        outcome.duration_ms = 5;
        switch (b) {
            case SUCCEED:
                outcome.success = true;
                outcome.output = "ok";
                break;
            case FAIL:
                outcome.success = false;
                outcome.output = "failed";
                break;
            case THROW:
                throw std::runtime_error("pattern crashed");
            case BLOCK:
                while (!cancel.is_cancelled()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                saw_cancel = true;
                outcome.success = false;
                outcome.error = ERROR_TYPE_CANCELLED;
                break;
        }
        return outcome;
    }

    std::vector<std::string> get_calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

    std::vector<json> get_contexts() {
        std::lock_guard<std::mutex> lock(mutex);
        return contexts;
    }

private:
    std::vector<std::string> calls;
    std::vector<json> contexts;
    std::mutex mutex;
};

static task_unit make_task(const std::string & id, const std::string & capability = "file-write") {
    task_unit unit;
    unit.id = id;
    unit.plan_id = "plan-1";
    unit.description = "write file " + id;
    unit.phase = "execute";
    unit.capabilities = {capability};
    unit.estimated_duration_ms = 1000;
    return unit;
}

static const std::vector<agent_capability> writer = {{"file-write", 0.9}};

static int count_terminals(const std::vector<decision> & decisions) {
    int n = 0;
    for (const auto & d : decisions) {
        if (d.terminal != TERMINAL_NONE) {
            n++;
        }
    }
    return n;
}

static bool test_first_choice_succeeds() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    sequential_decision_engine engine(catalog, executor);

    engine_outcome out = engine.run(make_task("t1"), writer, cancel_token());
    TEST_ASSERT(out.succeeded(), "completed");
    TEST_ASSERT(out.attempts == 1 && out.backtracks == 0, "one attempt");
    TEST_ASSERT(out.action == "parallel/fan-out", "cheapest likely variant first");
    TEST_ASSERT(executor.get_calls() == std::vector<std::string>{"parallel.fanout"}, "pattern dispatched");

    TEST_ASSERT(out.decisions.size() == 3, "strategic, tactical, terminal");
    TEST_ASSERT(out.decisions[0].type == DECISION_STRATEGIC && out.decisions[0].action == "parallel", "kind chosen");
    TEST_ASSERT(out.decisions[0].alternatives.size() == 3, "every kind scored");
    TEST_ASSERT(out.decisions[0].rejected.size() == 2, "other kinds rejected");
    TEST_ASSERT(out.decisions[1].type == DECISION_TACTICAL, "variant chosen");
    TEST_ASSERT(out.decisions[1].parent_id == out.decisions[0].id, "decisions chained");
    TEST_ASSERT(out.decisions[2].terminal == TERMINAL_COMPLETED, "terminal completion");
    TEST_ASSERT(count_terminals(out.decisions) == 1, "exactly one terminal decision");
    for (const auto & d : out.decisions) {
        TEST_ASSERT(d.context == "file-write", "context is the task capability");
        TEST_ASSERT(d.confidence >= 0.0 && d.confidence <= 1.0, "confidence in range");
    }

    TEST_ASSERT(engine.log().for_task("t1").size() == 3, "kept in the engine log");

    auto ctx = executor.get_contexts().front();
    TEST_ASSERT(ctx["task_id"] == "t1" && ctx["plan_id"] == "plan-1", "task identity handed over");
    TEST_ASSERT(ctx["variant"] == "fan-out" && ctx["attempt"] == 1, "attempt details handed over");
    return true;
}

static bool test_backtracking_order() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    executor.script["parallel.fanout"] = scripted_executor::FAIL;
    executor.script["parallel.batch"] = scripted_executor::FAIL;
    sequential_decision_engine engine(catalog, executor);

    engine_outcome out = engine.run(make_task("t2"), writer, cancel_token());
    TEST_ASSERT(out.succeeded(), "completed after backtracking");
    TEST_ASSERT(out.attempts == 3 && out.backtracks == 2, "two backtracks");
    TEST_ASSERT((executor.get_calls() == std::vector<std::string>{"parallel.fanout", "parallel.batch", "sequential.step"}),
                "variant first, then the next kind");
    TEST_ASSERT(out.action == "sequential/step-by-step", "winning action");

    std::vector<std::string> backtracks;
    int strategic = 0;
    for (const auto & d : out.decisions) {
        if (d.action.rfind("backtrack:", 0) == 0) {
            TEST_ASSERT(d.type == DECISION_REACTIVE, "backtracks are reactive");
            backtracks.push_back(d.action.substr(10));
        }
        if (d.type == DECISION_STRATEGIC) {
            strategic++;
        }
    }
    TEST_ASSERT(backtracks.size() == 2, "backtracks recorded");
    TEST_ASSERT(backtracks[0] == out.decisions[0].id, "variant backtrack returns to the strategic decision");
    TEST_ASSERT(backtracks[1] == out.decisions[0].id, "kind backtrack returns to the root");
    TEST_ASSERT(strategic == 2, "strategy revisited once");
    TEST_ASSERT(count_terminals(out.decisions) == 1, "exactly one terminal decision");
    return true;
}

static bool test_alternatives_exhausted() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    for (const auto & entry : catalog.actions) {
        for (const auto & v : entry.variants) {
            executor.script[v.pattern_id] = scripted_executor::FAIL;
        }
    }
    sequential_decision_engine engine(catalog, executor);

    engine_outcome out = engine.run(make_task("t3"), writer, cancel_token());
    TEST_ASSERT(out.terminal == TERMINAL_FAILED, "failed");
    TEST_ASSERT(out.error == ERROR_TYPE_TASK_FAILED, "plain failure reported as task failure");
    TEST_ASSERT(out.attempts == 6, "every variant tried once");
    TEST_ASSERT(executor.get_calls().size() == 6, "six dispatches");
    TEST_ASSERT(out.decisions.back().terminal == TERMINAL_FAILED, "terminal failure last");
    TEST_ASSERT(count_terminals(out.decisions) == 1, "exactly one terminal decision");
    return true;
}

static bool test_executor_exception() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    executor.script["parallel.fanout"] = scripted_executor::THROW;
    sequential_decision_engine engine(catalog, executor);

    engine_outcome out = engine.run(make_task("t4"), writer, cancel_token());
    TEST_ASSERT(out.succeeded(), "next variant recovers");
    TEST_ASSERT(out.attempts == 2, "crash counted as an attempt");
    return true;
}

static bool test_cancel_while_running() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    executor.script["parallel.fanout"] = scripted_executor::BLOCK;
    sequential_decision_engine engine(catalog, executor);

    cancel_token cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });

    int64_t start = get_timestamp_ms();
    engine_outcome out = engine.run(make_task("t5"), writer, cancel);
    canceller.join();

    TEST_ASSERT(out.terminal == TERMINAL_CANCELLED, "cancelled");
    TEST_ASSERT(out.error == ERROR_TYPE_CANCELLED, "cancel error");
    TEST_ASSERT(executor.saw_cancel, "executor told to stop");
    TEST_ASSERT(get_timestamp_ms() - start < 2000, "returned promptly");
    TEST_ASSERT(executor.get_calls().size() == 1, "no further attempts");
    TEST_ASSERT(count_terminals(out.decisions) == 1, "exactly one terminal decision");
    return true;
}

static bool test_cancel_before_dispatch() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    sequential_decision_engine engine(catalog, executor);

    cancel_token cancel;
    cancel.cancel();
    engine_outcome out = engine.run(make_task("t6"), writer, cancel);
    TEST_ASSERT(out.terminal == TERMINAL_CANCELLED, "cancelled");
    TEST_ASSERT(executor.get_calls().empty(), "nothing dispatched");
    return true;
}

static bool test_task_timeout() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    executor.script["parallel.fanout"] = scripted_executor::BLOCK;
    sequential_decision_engine engine(catalog, executor, nullptr, 100);

    int64_t start = get_timestamp_ms();
    engine_outcome out = engine.run(make_task("t7"), writer, cancel_token());
    int64_t elapsed = get_timestamp_ms() - start;

    TEST_ASSERT(out.terminal == TERMINAL_FAILED, "failed");
    TEST_ASSERT(out.error == ERROR_TYPE_TIMEOUT, "timeout error");
    TEST_ASSERT(executor.saw_cancel, "running attempt cancelled");
    TEST_ASSERT(elapsed >= 90 && elapsed < 2000, "stopped near the timeout");
    TEST_ASSERT(executor.get_calls().size() == 1, "no backtracking past the timeout");
    return true;
}

static bool test_unit_timeout_bounds_run() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    executor.script["parallel.fanout"] = scripted_executor::BLOCK;
    sequential_decision_engine engine(catalog, executor, nullptr, 30000);

    task_unit unit = make_task("t7b");
    unit.timeout_ms = 100;

    int64_t start = get_timestamp_ms();
    engine_outcome out = engine.run(unit, writer, cancel_token());
    int64_t elapsed = get_timestamp_ms() - start;

    TEST_ASSERT(out.error == ERROR_TYPE_TIMEOUT, "unit budget enforced");
    TEST_ASSERT(executor.saw_cancel, "running attempt cancelled");
    TEST_ASSERT(elapsed >= 90 && elapsed < 2000, "shorter unit budget wins over the engine default");
    return true;
}

static bool test_capability_bounded_variants() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    catalog.actions = {
        {ACTION_KIND_PARALLEL, {
            {"gpu-batch", "parallel.gpu", {"gpu"}, 0.99, 0.5},
            {"cpu-batch", "parallel.cpu", {},      0.80, 1.0},
        }},
    };
    scripted_executor executor;
    sequential_decision_engine engine(catalog, executor);

    engine_outcome out = engine.run(make_task("t8"), writer, cancel_token());
    TEST_ASSERT(out.succeeded(), "completed");
    TEST_ASSERT(executor.get_calls() == std::vector<std::string>{"parallel.cpu"}, "variant needing gpu never offered");

    std::vector<agent_capability> gpu_writer = {{"file-write", 0.9}, {"gpu", 1.0}};
    executor.script.clear();
    out = engine.run(make_task("t9"), gpu_writer, cancel_token());
    TEST_ASSERT(out.action == "parallel/gpu-batch", "offered once the agent has the capability");

    catalog.actions = {
        {ACTION_KIND_ADAPTIVE, {{"gpu-only", "adaptive.gpu", {"gpu"}, 0.9, 1.0}}},
    };
    out = engine.run(make_task("t10"), writer, cancel_token());
    TEST_ASSERT(out.terminal == TERMINAL_FAILED, "nothing fits");
    TEST_ASSERT(out.error == ERROR_TYPE_NO_CAPABLE_AGENT, "reported as no capable agent");
    TEST_ASSERT(count_terminals(out.decisions) == 1, "still one terminal decision");
    return true;
}

static bool test_history_steers_choice() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    memory_knowledge_store store;

    for (int i = 0; i < 5; i++) {
        decision d;
        d.id = "old-" + std::to_string(i);
        d.task_id = "old";
        d.context = "file-write";
        d.action = "parallel/fan-out";
        execution_outcome failure;
        failure.success = false;
        store.save_decision_outcome(d, failure);
    }

    scripted_executor executor;
    sequential_decision_engine engine(catalog, executor, &store);
    engine_outcome out = engine.run(make_task("t11"), writer, cancel_token());

    TEST_ASSERT(out.succeeded(), "completed");
    TEST_ASSERT(executor.get_calls() == std::vector<std::string>{"parallel.batch"}, "failing variant demoted");

    auto patterns = store.query_historical_patterns("file-write");
    bool recorded = false;
    for (const auto & p : patterns) {
        if (p.action == "parallel/batched" && p.successes == 1) {
            recorded = true;
        }
    }
    TEST_ASSERT(recorded, "outcome fed back into history");

    store.set_available(false);
    out = engine.run(make_task("t12"), writer, cancel_token());
    TEST_ASSERT(out.succeeded(), "a dead store does not stop decisions");
    return true;
}

static bool test_score_variant() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    scripted_executor executor;
    sequential_decision_engine engine(catalog, executor);

    action_variant v{"v", "p", {}, 0.8, 2.0};
    task_unit task = make_task("t");

    double base = engine.score_variant(v, ACTION_KIND_SEQUENTIAL, task, 1.0, {}, 0);
    TEST_ASSERT(std::abs(base - 0.4) < 1e-9, "success over cost");

    double weak = engine.score_variant(v, ACTION_KIND_SEQUENTIAL, task, 0.5, {}, 0);
    TEST_ASSERT(std::abs(weak - 0.2) < 1e-9, "capability match scales the score");

    historical_pattern good;
    good.action = "sequential/v";
    good.successes = 10;
    double biased = engine.score_variant(v, ACTION_KIND_SEQUENTIAL, task, 1.0, {good}, 0);
    TEST_ASSERT(std::abs(biased - (0.7 * 0.8 + 0.3) / 2.0) < 1e-9, "history pulls the probability");

    double roomy = engine.score_variant(v, ACTION_KIND_SEQUENTIAL, task, 1.0, {}, get_timestamp_ms() + 60000);
    TEST_ASSERT(std::abs(roomy - base) < 1e-9, "loose deadline costs nothing");

    double overdue = engine.score_variant(v, ACTION_KIND_SEQUENTIAL, task, 1.0, {}, get_timestamp_ms() - 1000);
    TEST_ASSERT(std::abs(overdue - base * 0.2) < 1e-9, "missed deadline hits the floor");
    return true;
}

int main() {
    std::cout << "=== Decision Engine Tests ===" << std::endl << std::endl;
    coord_log_set_verbosity(COORD_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_first_choice_succeeds);
    RUN_TEST(test_backtracking_order);
    RUN_TEST(test_alternatives_exhausted);
    RUN_TEST(test_executor_exception);
    RUN_TEST(test_cancel_while_running);
    RUN_TEST(test_cancel_before_dispatch);
    RUN_TEST(test_task_timeout);
    RUN_TEST(test_unit_timeout_bounds_run);
    RUN_TEST(test_capability_bounded_variants);
    RUN_TEST(test_history_steers_choice);
    RUN_TEST(test_score_variant);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
