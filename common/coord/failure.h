#pragma once

#include "message.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace coord {

// Error types
enum error_type {
    ERROR_TYPE_NONE,
    ERROR_TYPE_TIMEOUT,
    ERROR_TYPE_CONNECTION,
    ERROR_TYPE_UNAVAILABLE,
    ERROR_TYPE_OVERLOAD,
    ERROR_TYPE_QUEUE_FULL,
    ERROR_TYPE_UNREACHABLE,
    ERROR_TYPE_CIRCUIT_OPEN,
    ERROR_TYPE_CONSENSUS_REJECTED,
    ERROR_TYPE_INVALID_REQUEST,
    ERROR_TYPE_INFEASIBLE,
    ERROR_TYPE_NO_CAPABLE_AGENT,
    ERROR_TYPE_AGENT_NOT_FOUND,
    ERROR_TYPE_TASK_FAILED,
    ERROR_TYPE_CANCELLED,
    ERROR_TYPE_INTERNAL_ERROR,
    ERROR_TYPE_UNKNOWN
};

// How a caller should treat an error
enum error_category {
    ERROR_CATEGORY_NONE,
    ERROR_CATEGORY_VALIDATION,   // Malformed input, never retried
    ERROR_CATEGORY_FEASIBILITY,  // Business rule cannot be met, not retried
    ERROR_CATEGORY_TRANSIENT,    // Retried through the guard
    ERROR_CATEGORY_DEGRADED,     // Circuit open, dependency currently failing
    ERROR_CATEGORY_CANCELLED,
    ERROR_CATEGORY_INTERNAL
};

const char * error_type_to_string(error_type type);
error_type error_type_from_string(const std::string & str);
const char * error_category_to_string(error_category category);
error_category error_category_of(error_type type);

// Retry configuration with exponential backoff
struct retry_policy {
    int max_attempts = 3;            // Total attempts including the first
    int64_t initial_delay_ms = 100;  // Delay before the second attempt
    float backoff_multiplier = 2.0f; // Exponential backoff factor
    int64_t max_delay_ms = 5000;     // Delay cap
    std::set<error_type> retryable;  // Only these are retried

    static retry_policy default_policy();
    static retry_policy aggressive_policy();
    static retry_policy conservative_policy();

    int64_t get_backoff(int attempt) const;
    bool is_retryable(error_type type) const;

    json to_json() const;
    static retry_policy from_json(const json & j);
};

// Failure record
struct failure_record {
    std::string site;            // Protected call site
    error_type error = ERROR_TYPE_NONE;
    std::string error_message;
    int64_t timestamp = 0;
    std::string message_id;      // Failed message (if any)
    int attempt = 0;

    json to_json() const;
};

// Circuit breaker state
enum circuit_state {
    CIRCUIT_CLOSED,   // Normal operation
    CIRCUIT_OPEN,     // Too many failures, reject requests
    CIRCUIT_HALF_OPEN // Single trial call in flight
};

const char * circuit_state_to_string(circuit_state state);

// Circuit breaker for one protected call site.
// Failures are counted in a rolling window of monitoring_period_ms; any
// success while closed clears the window.
class circuit_breaker {
public:
    circuit_breaker(const std::string & name = "",
                    int failure_threshold = 5,
                    int64_t monitoring_period_ms = 60000,
                    int64_t open_timeout_ms = 30000);
    ~circuit_breaker();

    // Check if a call may proceed. In half-open only one trial is admitted
    // until its outcome is recorded.
    bool allow_request();

    void record_success();
    void record_failure();

    circuit_state get_state() const;

    void reset();

    struct stats {
        circuit_state state;
        int failure_count;
        int64_t last_failure_time;
        int64_t last_state_change;
        int64_t times_opened;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// Dead letter queue for messages whose delivery was abandoned
class dead_letter_queue {
public:
    dead_letter_queue(size_t max_size = 1000);
    ~dead_letter_queue();

    struct dead_letter {
        agent_message message;
        std::string recipient;
        failure_record failure;
        int64_t queued_at;
    };

    // Returns false when the oldest letter had to be evicted to make room
    bool add(const agent_message & message, const std::string & recipient, const failure_record & failure);

    std::vector<dead_letter> get_messages(int limit = 100) const;

    // Remove a letter and hand it back for another delivery attempt
    bool take(const std::string & message_id, dead_letter & out);

    bool remove_message(const std::string & message_id);

    size_t size() const;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// Sleep in short slices; returns false if cancelled before the delay elapsed
bool sleep_with_cancel(int64_t delay_ms, const cancel_token * cancel);

// Run op until it succeeds, fails with a non-retryable error, attempts run
// out or the token is cancelled. op returns ERROR_TYPE_NONE on success.
template<typename Func>
error_type execute_with_retry(Func && op, const retry_policy & policy,
                              const cancel_token * cancel = nullptr,
                              int * out_attempts = nullptr) {
    error_type last = ERROR_TYPE_UNKNOWN;
    int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int attempt = 0; attempt < attempts; attempt++) {
        if (cancel && cancel->is_cancelled()) {
            last = ERROR_TYPE_CANCELLED;
            break;
        }
        if (out_attempts) {
            *out_attempts = attempt + 1;
        }

        last = op();
        if (last == ERROR_TYPE_NONE || !policy.is_retryable(last)) {
            return last;
        }
        if (attempt + 1 == attempts) {
            break;
        }
        if (!sleep_with_cancel(policy.get_backoff(attempt), cancel)) {
            return ERROR_TYPE_CANCELLED;
        }
    }

    return last;
}

// Circuit breakers per call site composed with retry, plus failure history
// and the dead letter queue.
class resilience_guard {
public:
    struct config {
        int failure_threshold = 5;
        int64_t monitoring_period_ms = 60000;
        int64_t open_timeout_ms = 30000;
        size_t history_limit = 100;      // Per site
        size_t dead_letter_capacity = 1000;
    };

    resilience_guard();
    explicit resilience_guard(const config & cfg);
    ~resilience_guard();

    resilience_guard(const resilience_guard &) = delete;
    resilience_guard & operator=(const resilience_guard &) = delete;

    // Run op through the site's breaker. Returns ERROR_TYPE_CIRCUIT_OPEN
    // without invoking op while the breaker rejects calls.
    error_type execute(const std::string & site, const std::function<error_type()> & op);

    // execute() wrapped in the retry policy
    error_type execute_with_retry(const std::string & site,
                                  const std::function<error_type()> & op,
                                  const retry_policy & policy,
                                  const cancel_token * cancel = nullptr);

    // Breaker for a site (created on first use)
    circuit_breaker & breaker(const std::string & site);

    std::map<std::string, circuit_state> circuit_states() const;

    bool any_open() const;

    void record_failure(const failure_record & record);

    // Most recent first
    std::vector<failure_record> get_history(const std::string & site, int limit = 100) const;

    dead_letter_queue & dead_letters();

    struct stats {
        int64_t total_calls;
        int64_t total_failures;
        int64_t rejected_calls;
        std::map<error_type, int64_t> failures_by_type;
        int dead_letters;
    };
    stats get_stats() const;

    json to_json() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
