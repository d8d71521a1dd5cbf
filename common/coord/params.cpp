#include "params.h"

#include <fstream>
#include <sstream>

namespace coord {

json params_to_json(const coord_params & params) {
    return json{
        {"coordinator_id", params.coordinator_id},
        {"send_timeout_ms", params.send_timeout_ms},
        {"round_trip_timeout_ms", params.round_trip_timeout_ms},
        {"task_timeout_ms", params.task_timeout_ms},
        {"consensus_phase_timeout_ms", params.consensus_phase_timeout_ms},
        {"poll_interval_ms", params.poll_interval_ms},
        {"max_queue_depth", params.max_queue_depth},
        {"max_delivery_attempts", params.max_delivery_attempts},
        {"progress_channel_capacity", params.progress_channel_capacity},
        {"heartbeat_interval_ms", params.heartbeat_interval_ms},
        {"heartbeat_miss_limit", params.heartbeat_miss_limit},
        {"failure_threshold", params.failure_threshold},
        {"monitoring_period_ms", params.monitoring_period_ms},
        {"open_timeout_ms", params.open_timeout_ms},
        {"retry", params.retry.to_json()},
        {"failure_history_limit", params.failure_history_limit},
        {"dead_letter_capacity", params.dead_letter_capacity},
        {"risk_threshold", params.risk_threshold},
        {"feasibility_ceiling", params.feasibility_ceiling},
        {"max_replans", params.max_replans},
        {"verbosity", params.verbosity},
        {"log_file", params.log_file}
    };
}

bool params_from_json(const json & j, coord_params & params, std::string * error) {
    if (!j.is_object()) {
        if (error) *error = "params must be a JSON object";
        return false;
    }

    coord_params p = params;
    try {
        p.coordinator_id = j.value("coordinator_id", p.coordinator_id);
        p.send_timeout_ms = j.value("send_timeout_ms", p.send_timeout_ms);
        p.round_trip_timeout_ms = j.value("round_trip_timeout_ms", p.round_trip_timeout_ms);
        p.task_timeout_ms = j.value("task_timeout_ms", p.task_timeout_ms);
        p.consensus_phase_timeout_ms = j.value("consensus_phase_timeout_ms", p.consensus_phase_timeout_ms);
        p.poll_interval_ms = j.value("poll_interval_ms", p.poll_interval_ms);
        p.max_queue_depth = j.value("max_queue_depth", p.max_queue_depth);
        p.max_delivery_attempts = j.value("max_delivery_attempts", p.max_delivery_attempts);
        p.progress_channel_capacity = j.value("progress_channel_capacity", p.progress_channel_capacity);
        p.heartbeat_interval_ms = j.value("heartbeat_interval_ms", p.heartbeat_interval_ms);
        p.heartbeat_miss_limit = j.value("heartbeat_miss_limit", p.heartbeat_miss_limit);
        p.failure_threshold = j.value("failure_threshold", p.failure_threshold);
        p.monitoring_period_ms = j.value("monitoring_period_ms", p.monitoring_period_ms);
        p.open_timeout_ms = j.value("open_timeout_ms", p.open_timeout_ms);
        if (j.contains("retry")) {
            p.retry = retry_policy::from_json(j.at("retry"));
        }
        p.failure_history_limit = j.value("failure_history_limit", p.failure_history_limit);
        p.dead_letter_capacity = j.value("dead_letter_capacity", p.dead_letter_capacity);
        p.risk_threshold = j.value("risk_threshold", p.risk_threshold);
        p.feasibility_ceiling = j.value("feasibility_ceiling", p.feasibility_ceiling);
        p.max_replans = j.value("max_replans", p.max_replans);
        p.verbosity = j.value("verbosity", p.verbosity);
        p.log_file = j.value("log_file", p.log_file);
    } catch (const json::exception & e) {
        if (error) *error = std::string("invalid params: ") + e.what();
        return false;
    }

    if (!validate_params(p, error)) {
        return false;
    }

    params = p;
    return true;
}

bool load_params_file(const std::string & path, coord_params & params, std::string * error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "cannot open " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        if (error) *error = path + " is not valid JSON";
        return false;
    }

    return params_from_json(j, params, error);
}

bool validate_params(const coord_params & params, std::string * error) {
    auto fail = [error](const std::string & msg) {
        if (error) *error = msg;
        return false;
    };

    if (params.coordinator_id.empty())            return fail("coordinator_id must not be empty");
    if (params.send_timeout_ms < 0)               return fail("send_timeout_ms must be >= 0");
    if (params.round_trip_timeout_ms <= 0)        return fail("round_trip_timeout_ms must be > 0");
    if (params.task_timeout_ms <= 0)              return fail("task_timeout_ms must be > 0");
    if (params.consensus_phase_timeout_ms <= 0)   return fail("consensus_phase_timeout_ms must be > 0");
    if (params.poll_interval_ms <= 0)             return fail("poll_interval_ms must be > 0");
    if (params.max_queue_depth == 0)              return fail("max_queue_depth must be > 0");
    if (params.max_delivery_attempts < 1)         return fail("max_delivery_attempts must be >= 1");
    if (params.progress_channel_capacity == 0)    return fail("progress_channel_capacity must be > 0");
    if (params.heartbeat_interval_ms <= 0)        return fail("heartbeat_interval_ms must be > 0");
    if (params.heartbeat_miss_limit < 1)          return fail("heartbeat_miss_limit must be >= 1");
    if (params.failure_threshold < 1)             return fail("failure_threshold must be >= 1");
    if (params.monitoring_period_ms <= 0)         return fail("monitoring_period_ms must be > 0");
    if (params.open_timeout_ms < 0)               return fail("open_timeout_ms must be >= 0");
    if (params.retry.max_attempts < 1)            return fail("retry.max_attempts must be >= 1");
    if (params.risk_threshold < 0.0 || params.risk_threshold > 1.0) {
        return fail("risk_threshold must be within [0, 1]");
    }
    if (params.feasibility_ceiling < 1.0)         return fail("feasibility_ceiling must be >= 1");
    if (params.max_replans < 0)                   return fail("max_replans must be >= 0");

    return true;
}

} // namespace coord
