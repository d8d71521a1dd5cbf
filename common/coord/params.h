// params.h
#pragma once

#include "failure.h"
#include "message.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace coord {

struct coord_params {
    // Identity
    std::string coordinator_id;

    // Timeouts per operation class (ms)
    int64_t send_timeout_ms;             // Mailbox back-pressure wait
    int64_t round_trip_timeout_ms;       // Request awaiting a response
    int64_t task_timeout_ms;             // One task unit on an agent
    int64_t consensus_phase_timeout_ms;  // Prepare or accept phase
    int64_t poll_interval_ms;            // Router / plan loop wake-up

    // Communication bus
    size_t max_queue_depth;
    int max_delivery_attempts;
    size_t progress_channel_capacity;

    // Liveness
    int64_t heartbeat_interval_ms;
    int heartbeat_miss_limit;

    // Resilience
    int failure_threshold;
    int64_t monitoring_period_ms;
    int64_t open_timeout_ms;
    retry_policy retry;
    size_t failure_history_limit;
    size_t dead_letter_capacity;

    // Planning and distribution
    double risk_threshold;               // Units above get a contingency
    double feasibility_ceiling;          // Assignment costs above are infeasible
    int max_replans;

    // Logging
    int verbosity;
    std::string log_file;
};

// Default parameters
inline coord_params coord_default_params() {
    coord_params params;

    params.coordinator_id = "coordinator";

    // Timeout defaults
    params.send_timeout_ms = 1000;
    params.round_trip_timeout_ms = 5000;
    params.task_timeout_ms = 30000;
    params.consensus_phase_timeout_ms = 2000;
    params.poll_interval_ms = 20;

    // Bus defaults
    params.max_queue_depth = 1000;
    params.max_delivery_attempts = 3;
    params.progress_channel_capacity = 256;

    // Liveness defaults
    params.heartbeat_interval_ms = 1000;
    params.heartbeat_miss_limit = 3;

    // Resilience defaults
    params.failure_threshold = 5;
    params.monitoring_period_ms = 60000;
    params.open_timeout_ms = 30000;
    params.retry = retry_policy::default_policy();
    params.failure_history_limit = 100;
    params.dead_letter_capacity = 1000;

    // Planning defaults
    params.risk_threshold = 0.6;
    params.feasibility_ceiling = 100.0;
    params.max_replans = 2;

    // Logging defaults
    params.verbosity = 2;
    params.log_file = "";

    return params;
}

json params_to_json(const coord_params & params);

// Fields absent from j keep their current value in params
bool params_from_json(const json & j, coord_params & params, std::string * error = nullptr);

bool load_params_file(const std::string & path, coord_params & params, std::string * error = nullptr);

// Check ranges; false with the first problem found
bool validate_params(const coord_params & params, std::string * error = nullptr);

} // namespace coord
