#include "coord/orchestrator.h"
#include "coord/worker.h"
#include "log.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace coord;

// ============================================================================
// Simulated workflow patterns
// ============================================================================

// Sleeps for a scaled-down share of the task estimate and fails with a fixed
// probability per pattern.
class simulated_executor : public pattern_executor {
public:
    simulated_executor(unsigned seed, double failure_rate, double time_scale)
        : rng(seed), failure_rate(failure_rate), time_scale(time_scale) {}

    execution_outcome execute_pattern(const std::string & pattern_id,
                                      const json & context,
                                      const cancel_token & cancel) override {
        execution_outcome outcome;
        int64_t start = get_timestamp_ms();

        int64_t estimate = 1000;
        const std::string task_id = context.value("task_id", "");
        if (context.contains("phase") && context["phase"] == "validate") {
            estimate = 600;
        }
        int64_t work_ms = static_cast<int64_t>(estimate * time_scale);

        if (!sleep_with_cancel(work_ms, &cancel)) {
            outcome.success = false;
            outcome.error = ERROR_TYPE_CANCELLED;
            outcome.output = "cancelled";
            outcome.duration_ms = get_timestamp_ms() - start;
            return outcome;
        }

        double roll;
        {
            std::lock_guard<std::mutex> lock(mutex);
            roll = std::uniform_real_distribution<double>(0.0, 1.0)(rng);
        }

        outcome.success = roll >= failure_rate;
        outcome.error = outcome.success ? ERROR_TYPE_NONE : ERROR_TYPE_TASK_FAILED;
        outcome.output = pattern_id + (outcome.success ? " finished " : " failed on ") + task_id;
        outcome.report = {{"pattern", pattern_id}, {"roll", roll}};
        outcome.duration_ms = get_timestamp_ms() - start;
        return outcome;
    }

private:
    std::mt19937 rng;
    double failure_rate;
    double time_scale;
    std::mutex mutex;
};

// ============================================================================
// Command line
// ============================================================================

struct demo_args {
    std::string config_path;
    std::string catalog_path;
    std::string objective = "migrate 3 files with validation";
    unsigned seed = 42;
    double failure_rate = 0.1;
    double time_scale = 0.1;
    bool verbose = false;
};

static void print_usage(const char * argv0) {
    std::cout << "usage: " << argv0 << " [options] [objective text]\n"
              << "\n"
              << "options:\n"
              << "  --config PATH        coordination parameters (JSON)\n"
              << "  --catalog PATH       strategy catalog overrides (JSON)\n"
              << "  --seed N             seed for the simulated executors (default 42)\n"
              << "  --failure-rate F     probability a pattern attempt fails (default 0.1)\n"
              << "  --time-scale F       share of estimated durations actually slept (default 0.1)\n"
              << "  -v, --verbose        debug logging\n"
              << "  -h, --help           show this help\n";
}

static bool parse_args(int argc, char ** argv, demo_args & args) {
    std::vector<std::string> words;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string & out) {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--config") {
            if (!next(args.config_path)) return false;
        } else if (arg == "--catalog") {
            if (!next(args.catalog_path)) return false;
        } else if (arg == "--seed") {
            if (!next(value)) return false;
            args.seed = static_cast<unsigned>(std::strtoul(value.c_str(), nullptr, 10));
        } else if (arg == "--failure-rate") {
            if (!next(value)) return false;
            args.failure_rate = std::strtod(value.c_str(), nullptr);
        } else if (arg == "--time-scale") {
            if (!next(value)) return false;
            args.time_scale = std::strtod(value.c_str(), nullptr);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "error: unknown option " << arg << "\n";
            return false;
        } else {
            words.push_back(arg);
        }
    }

    if (!words.empty()) {
        std::ostringstream text;
        for (size_t i = 0; i < words.size(); i++) {
            text << (i > 0 ? " " : "") << words[i];
        }
        args.objective = text.str();
    }
    return true;
}

static bool load_catalog(const std::string & path, strategy_catalog & catalog) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERR("cannot open catalog %s\n", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        LOG_ERR("catalog %s is not valid JSON\n", path.c_str());
        return false;
    }

    std::string error;
    if (!catalog.apply_json(j, &error)) {
        LOG_ERR("catalog %s rejected: %s\n", path.c_str(), error.c_str());
        return false;
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char ** argv) {
    demo_args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    coord_params params = coord_default_params();
    if (!args.config_path.empty()) {
        std::string error;
        if (!load_params_file(args.config_path, params, &error)) {
            LOG_ERR("config: %s\n", error.c_str());
            return 1;
        }
    }
    if (args.verbose) {
        params.verbosity = COORD_LOG_LEVEL_DEBUG;
    }
    coord_log_set_verbosity(params.verbosity);
    if (!params.log_file.empty() && !coord_log_set_file(params.log_file)) {
        LOG_WRN("cannot write log file %s\n", params.log_file.c_str());
    }

    strategy_catalog catalog = strategy_catalog::default_catalog();
    if (!args.catalog_path.empty() && !load_catalog(args.catalog_path, catalog)) {
        return 1;
    }

    memory_knowledge_store store;
    coordination_orchestrator orchestrator(params, catalog, &store);
    simulated_executor executor(args.seed, args.failure_rate, args.time_scale);

    struct team_member {
        const char * id;
        std::vector<agent_capability> capabilities;
    };
    const std::vector<team_member> team = {
        {"writer-1",   {{"file-write", 0.9}}},
        {"writer-2",   {{"file-write", 0.8}}},
        {"validator",  {{"validate", 0.95}}},
        {"generalist", {{"general", 0.8}, {"analyze", 0.7}, {"deploy", 0.6}}},
    };

    std::vector<std::unique_ptr<worker_agent>> workers;
    for (const auto & member : team) {
        worker_agent::config cfg;
        cfg.id = member.id;
        cfg.capabilities = member.capabilities;
        cfg.coordinator_address = orchestrator.address();
        cfg.heartbeat_interval_ms = params.heartbeat_interval_ms;
        cfg.send_timeout_ms = params.send_timeout_ms;
        cfg.task_timeout_ms = params.task_timeout_ms;

        auto worker = std::make_unique<worker_agent>(cfg, orchestrator.bus(), catalog, executor, &store);
        if (!orchestrator.register_agent(worker->describe()) || !worker->start()) {
            LOG_ERR("could not bring up agent %s\n", member.id);
            return 1;
        }
        workers.push_back(std::move(worker));
    }

    orchestrator.start();

    objective obj;
    obj.description = args.objective;
    obj.criteria.push_back({"every unit completes", true});

    std::cout << "objective: " << obj.description << std::endl;

    planning_result planned = orchestrator.plan_objective(obj);
    if (!planned.ok()) {
        std::cout << planned.to_json().dump(2) << std::endl;
        orchestrator.stop();
        return 2;
    }
    std::cout << "plan:" << std::endl << planned.plan.to_json().dump(2) << std::endl;

    auto handle = orchestrator.distribute_and_execute(planned.plan);
    while (!handle->is_finished()) {
        while (auto event = handle->next_event(100)) {
            std::cout << "  [" << progress_kind_to_string(event->kind) << "] "
                      << event->task_id << (event->agent_id.empty() ? "" : " @ " + event->agent_id)
                      << (event->message.empty() ? "" : " - " + event->message) << std::endl;
        }
    }
    while (auto event = handle->next_event(0)) {
        std::cout << "  [" << progress_kind_to_string(event->kind) << "] " << event->message << std::endl;
    }

    std::optional<execution_result> result = handle->result();
    if (result) {
        std::cout << "result:" << std::endl << result->to_json().dump(2) << std::endl;
    }
    std::cout << "health:" << std::endl << orchestrator.get_coordination_health().to_json().dump(2) << std::endl;

    for (auto & worker : workers) {
        worker->stop();
    }
    orchestrator.stop();

    return result && result->status == EXECUTION_COMPLETED ? 0 : 3;
}
