#include "failure.h"
#include "../log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <mutex>
#include <thread>

namespace coord {

const char * error_type_to_string(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE: return "none";
        case ERROR_TYPE_TIMEOUT: return "timeout";
        case ERROR_TYPE_CONNECTION: return "connection";
        case ERROR_TYPE_UNAVAILABLE: return "unavailable";
        case ERROR_TYPE_OVERLOAD: return "overload";
        case ERROR_TYPE_QUEUE_FULL: return "queue_full";
        case ERROR_TYPE_UNREACHABLE: return "unreachable";
        case ERROR_TYPE_CIRCUIT_OPEN: return "circuit_open";
        case ERROR_TYPE_CONSENSUS_REJECTED: return "consensus_rejected";
        case ERROR_TYPE_INVALID_REQUEST: return "invalid_request";
        case ERROR_TYPE_INFEASIBLE: return "infeasible";
        case ERROR_TYPE_NO_CAPABLE_AGENT: return "no_capable_agent";
        case ERROR_TYPE_AGENT_NOT_FOUND: return "agent_not_found";
        case ERROR_TYPE_TASK_FAILED: return "task_failed";
        case ERROR_TYPE_CANCELLED: return "cancelled";
        case ERROR_TYPE_INTERNAL_ERROR: return "internal_error";
        case ERROR_TYPE_UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

error_type error_type_from_string(const std::string & str) {
    static const std::map<std::string, error_type> table = {
        {"none", ERROR_TYPE_NONE},
        {"timeout", ERROR_TYPE_TIMEOUT},
        {"connection", ERROR_TYPE_CONNECTION},
        {"unavailable", ERROR_TYPE_UNAVAILABLE},
        {"overload", ERROR_TYPE_OVERLOAD},
        {"queue_full", ERROR_TYPE_QUEUE_FULL},
        {"unreachable", ERROR_TYPE_UNREACHABLE},
        {"circuit_open", ERROR_TYPE_CIRCUIT_OPEN},
        {"consensus_rejected", ERROR_TYPE_CONSENSUS_REJECTED},
        {"invalid_request", ERROR_TYPE_INVALID_REQUEST},
        {"infeasible", ERROR_TYPE_INFEASIBLE},
        {"no_capable_agent", ERROR_TYPE_NO_CAPABLE_AGENT},
        {"agent_not_found", ERROR_TYPE_AGENT_NOT_FOUND},
        {"task_failed", ERROR_TYPE_TASK_FAILED},
        {"cancelled", ERROR_TYPE_CANCELLED},
        {"internal_error", ERROR_TYPE_INTERNAL_ERROR},
    };
    auto it = table.find(str);
    return it != table.end() ? it->second : ERROR_TYPE_UNKNOWN;
}

const char * error_category_to_string(error_category category) {
    switch (category) {
        case ERROR_CATEGORY_NONE:        return "none";
        case ERROR_CATEGORY_VALIDATION:  return "validation";
        case ERROR_CATEGORY_FEASIBILITY: return "feasibility";
        case ERROR_CATEGORY_TRANSIENT:   return "transient";
        case ERROR_CATEGORY_DEGRADED:    return "degraded";
        case ERROR_CATEGORY_CANCELLED:   return "cancelled";
        case ERROR_CATEGORY_INTERNAL:    return "internal";
        default:                         return "unknown";
    }
}

error_category error_category_of(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE:
            return ERROR_CATEGORY_NONE;
        case ERROR_TYPE_INVALID_REQUEST:
            return ERROR_CATEGORY_VALIDATION;
        case ERROR_TYPE_INFEASIBLE:
        case ERROR_TYPE_NO_CAPABLE_AGENT:
        case ERROR_TYPE_AGENT_NOT_FOUND:
        case ERROR_TYPE_TASK_FAILED:
            return ERROR_CATEGORY_FEASIBILITY;
        case ERROR_TYPE_TIMEOUT:
        case ERROR_TYPE_CONNECTION:
        case ERROR_TYPE_UNAVAILABLE:
        case ERROR_TYPE_OVERLOAD:
        case ERROR_TYPE_QUEUE_FULL:
        case ERROR_TYPE_UNREACHABLE:
        case ERROR_TYPE_CONSENSUS_REJECTED:
            return ERROR_CATEGORY_TRANSIENT;
        case ERROR_TYPE_CIRCUIT_OPEN:
            return ERROR_CATEGORY_DEGRADED;
        case ERROR_TYPE_CANCELLED:
            return ERROR_CATEGORY_CANCELLED;
        default:
            return ERROR_CATEGORY_INTERNAL;
    }
}

// retry_policy implementation
retry_policy retry_policy::default_policy() {
    retry_policy p;
    p.max_attempts = 3;
    p.initial_delay_ms = 100;
    p.backoff_multiplier = 2.0f;
    p.max_delay_ms = 5000;
    p.retryable = {
        ERROR_TYPE_TIMEOUT,
        ERROR_TYPE_CONNECTION,
        ERROR_TYPE_UNAVAILABLE,
        ERROR_TYPE_OVERLOAD,
        ERROR_TYPE_QUEUE_FULL,
    };
    return p;
}

retry_policy retry_policy::aggressive_policy() {
    retry_policy p = default_policy();
    p.max_attempts = 6;
    p.initial_delay_ms = 50;
    p.backoff_multiplier = 1.5f;
    p.max_delay_ms = 2000;
    p.retryable.insert(ERROR_TYPE_UNREACHABLE);
    return p;
}

retry_policy retry_policy::conservative_policy() {
    retry_policy p = default_policy();
    p.max_attempts = 2;
    p.initial_delay_ms = 500;
    p.backoff_multiplier = 2.0f;
    p.max_delay_ms = 10000;
    return p;
}

int64_t retry_policy::get_backoff(int attempt) const {
    double delay = (double) initial_delay_ms * std::pow((double) backoff_multiplier, attempt);
    if (delay > (double) max_delay_ms) {
        return max_delay_ms;
    }
    return static_cast<int64_t>(delay);
}

bool retry_policy::is_retryable(error_type type) const {
    return retryable.count(type) > 0;
}

json retry_policy::to_json() const {
    json r = json::array();
    for (auto t : retryable) {
        r.push_back(error_type_to_string(t));
    }
    return json{
        {"max_attempts", max_attempts},
        {"initial_delay_ms", initial_delay_ms},
        {"backoff_multiplier", backoff_multiplier},
        {"max_delay_ms", max_delay_ms},
        {"retryable", r},
    };
}

retry_policy retry_policy::from_json(const json & j) {
    retry_policy p = default_policy();
    p.max_attempts = j.value("max_attempts", p.max_attempts);
    p.initial_delay_ms = j.value("initial_delay_ms", p.initial_delay_ms);
    p.backoff_multiplier = j.value("backoff_multiplier", p.backoff_multiplier);
    p.max_delay_ms = j.value("max_delay_ms", p.max_delay_ms);
    if (j.contains("retryable") && j["retryable"].is_array()) {
        p.retryable.clear();
        for (const auto & item : j["retryable"]) {
            p.retryable.insert(error_type_from_string(item.get<std::string>()));
        }
    }
    return p;
}

// failure_record implementation
json failure_record::to_json() const {
    return json{
        {"site", site},
        {"error", error_type_to_string(error)},
        {"error_message", error_message},
        {"timestamp", timestamp},
        {"message_id", message_id},
        {"attempt", attempt},
    };
}

bool sleep_with_cancel(int64_t delay_ms, const cancel_token * cancel) {
    const int64_t slice_ms = 10;
    int64_t deadline = get_timestamp_ms() + delay_ms;

    while (true) {
        if (cancel && cancel->is_cancelled()) {
            return false;
        }
        int64_t remaining = deadline - get_timestamp_ms();
        if (remaining <= 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(remaining, slice_ms)));
    }
}

const char * circuit_state_to_string(circuit_state state) {
    switch (state) {
        case CIRCUIT_CLOSED:    return "closed";
        case CIRCUIT_OPEN:      return "open";
        case CIRCUIT_HALF_OPEN: return "half_open";
        default:                return "unknown";
    }
}

// circuit_breaker implementation
struct circuit_breaker::impl {
    std::string name;
    int failure_threshold;
    int64_t monitoring_period_ms;
    int64_t open_timeout_ms;
    circuit_state state;
    std::deque<int64_t> failures;   // Timestamps inside the monitoring window
    bool trial_in_flight;
    int64_t last_failure_time;
    int64_t last_state_change;
    int64_t times_opened;
    mutable std::mutex mutex;

    impl(const std::string & n, int threshold, int64_t period, int64_t timeout)
        : name(n),
          failure_threshold(threshold),
          monitoring_period_ms(period),
          open_timeout_ms(timeout),
          state(CIRCUIT_CLOSED),
          trial_in_flight(false),
          last_failure_time(0),
          last_state_change(get_timestamp_ms()),
          times_opened(0) {}

    void prune(int64_t now) {
        while (!failures.empty() && now - failures.front() > monitoring_period_ms) {
            failures.pop_front();
        }
    }

    void transition(circuit_state next, int64_t now) {
        if (state == next) {
            return;
        }
        LOG_DBG("circuit '%s': %s -> %s\n", name.c_str(),
                circuit_state_to_string(state), circuit_state_to_string(next));
        if (next == CIRCUIT_OPEN) {
            times_opened++;
            LOG_WRN("circuit '%s' opened after %d failures\n", name.c_str(), (int) failures.size());
        }
        state = next;
        last_state_change = now;
    }
};

circuit_breaker::circuit_breaker(const std::string & name, int failure_threshold,
                                 int64_t monitoring_period_ms, int64_t open_timeout_ms)
    : pimpl(std::make_unique<impl>(name, failure_threshold, monitoring_period_ms, open_timeout_ms)) {}

circuit_breaker::~circuit_breaker() = default;

bool circuit_breaker::allow_request() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    if (pimpl->state == CIRCUIT_CLOSED) {
        return true;
    }

    int64_t now = get_timestamp_ms();

    if (pimpl->state == CIRCUIT_OPEN) {
        if ((now - pimpl->last_state_change) >= pimpl->open_timeout_ms) {
            pimpl->transition(CIRCUIT_HALF_OPEN, now);
            pimpl->trial_in_flight = true;
            return true;
        }
        return false;
    }

    // CIRCUIT_HALF_OPEN: one trial at a time
    if (pimpl->trial_in_flight) {
        return false;
    }
    pimpl->trial_in_flight = true;
    return true;
}

void circuit_breaker::record_success() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->failures.clear();
    if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->trial_in_flight = false;
        pimpl->transition(CIRCUIT_CLOSED, get_timestamp_ms());
    }
}

void circuit_breaker::record_failure() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    int64_t now = get_timestamp_ms();
    pimpl->last_failure_time = now;

    if (pimpl->state == CIRCUIT_CLOSED) {
        pimpl->failures.push_back(now);
        pimpl->prune(now);
        if ((int) pimpl->failures.size() >= pimpl->failure_threshold) {
            pimpl->transition(CIRCUIT_OPEN, now);
        }
    } else if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->trial_in_flight = false;
        pimpl->transition(CIRCUIT_OPEN, now);
    }
}

circuit_state circuit_breaker::get_state() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->state;
}

void circuit_breaker::reset() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->transition(CIRCUIT_CLOSED, get_timestamp_ms());
    pimpl->failures.clear();
    pimpl->trial_in_flight = false;
}

circuit_breaker::stats circuit_breaker::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    stats s;
    s.state = pimpl->state;
    s.failure_count = static_cast<int>(pimpl->failures.size());
    s.last_failure_time = pimpl->last_failure_time;
    s.last_state_change = pimpl->last_state_change;
    s.times_opened = pimpl->times_opened;
    return s;
}

// dead_letter_queue implementation
struct dead_letter_queue::impl {
    std::deque<dead_letter> queue;
    size_t max_size;
    mutable std::mutex mutex;

    impl(size_t max) : max_size(max) {}
};

dead_letter_queue::dead_letter_queue(size_t max_size)
    : pimpl(std::make_unique<impl>(max_size)) {}

dead_letter_queue::~dead_letter_queue() = default;

bool dead_letter_queue::add(const agent_message & message,
                            const std::string & recipient,
                            const failure_record & failure) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    dead_letter letter;
    letter.message = message;
    letter.recipient = recipient;
    letter.failure = failure;
    letter.queued_at = get_timestamp_ms();

    pimpl->queue.push_back(letter);

    bool evicted = false;
    while (pimpl->queue.size() > pimpl->max_size) {
        LOG_ERR("dead letter queue full, evicting message %s\n",
                pimpl->queue.front().message.message_id.c_str());
        pimpl->queue.pop_front();
        evicted = true;
    }
    return !evicted;
}

std::vector<dead_letter_queue::dead_letter> dead_letter_queue::get_messages(int limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<dead_letter> messages;
    int count = 0;

    for (const auto & letter : pimpl->queue) {
        if (limit > 0 && count >= limit) break;
        messages.push_back(letter);
        count++;
    }

    return messages;
}

bool dead_letter_queue::take(const std::string & message_id, dead_letter & out) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = std::find_if(pimpl->queue.begin(), pimpl->queue.end(),
        [&message_id](const dead_letter & letter) {
            return letter.message.message_id == message_id;
        });

    if (it == pimpl->queue.end()) {
        return false;
    }

    out = *it;
    pimpl->queue.erase(it);
    return true;
}

bool dead_letter_queue::remove_message(const std::string & message_id) {
    dead_letter unused;
    return take(message_id, unused);
}

size_t dead_letter_queue::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->queue.size();
}

void dead_letter_queue::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->queue.clear();
}

// resilience_guard implementation
struct resilience_guard::impl {
    config cfg;
    std::map<std::string, std::unique_ptr<circuit_breaker>> breakers;
    std::map<std::string, std::deque<failure_record>> history;
    dead_letter_queue dlq;
    mutable std::mutex mutex;

    std::atomic<int64_t> total_calls{0};
    std::atomic<int64_t> total_failures{0};
    std::atomic<int64_t> rejected_calls{0};

    impl(const config & c) : cfg(c), dlq(c.dead_letter_capacity) {}
};

resilience_guard::resilience_guard() : pimpl(std::make_unique<impl>(config())) {}

resilience_guard::resilience_guard(const config & cfg) : pimpl(std::make_unique<impl>(cfg)) {}

resilience_guard::~resilience_guard() = default;

circuit_breaker & resilience_guard::breaker(const std::string & site) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->breakers.find(site);
    if (it == pimpl->breakers.end()) {
        it = pimpl->breakers.emplace(site, std::make_unique<circuit_breaker>(
            site,
            pimpl->cfg.failure_threshold,
            pimpl->cfg.monitoring_period_ms,
            pimpl->cfg.open_timeout_ms)).first;
    }
    return *it->second;
}

error_type resilience_guard::execute(const std::string & site, const std::function<error_type()> & op) {
    circuit_breaker & cb = breaker(site);
    pimpl->total_calls++;

    if (!cb.allow_request()) {
        pimpl->rejected_calls++;
        return ERROR_TYPE_CIRCUIT_OPEN;
    }

    error_type err = op();

    if (err == ERROR_TYPE_NONE) {
        cb.record_success();
    } else if (err == ERROR_TYPE_CANCELLED) {
        // A cancelled half-open trial counts as failed so the trial slot is released
        if (cb.get_state() == CIRCUIT_HALF_OPEN) {
            cb.record_failure();
        }
    } else {
        cb.record_failure();

        failure_record record;
        record.site = site;
        record.error = err;
        record.error_message = error_type_to_string(err);
        record.timestamp = get_timestamp_ms();
        record_failure(record);
    }

    return err;
}

error_type resilience_guard::execute_with_retry(const std::string & site,
                                                const std::function<error_type()> & op,
                                                const retry_policy & policy,
                                                const cancel_token * cancel) {
    int attempts = 0;
    error_type err = coord::execute_with_retry([&]() { return execute(site, op); },
                                               policy, cancel, &attempts);
    if (err != ERROR_TYPE_NONE && err != ERROR_TYPE_CIRCUIT_OPEN && attempts > 1) {
        LOG_DBG("%s: giving up after %d attempts (%s)\n", site.c_str(), attempts, error_type_to_string(err));
    }
    return err;
}

std::map<std::string, circuit_state> resilience_guard::circuit_states() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::map<std::string, circuit_state> states;
    for (const auto & [site, cb] : pimpl->breakers) {
        states[site] = cb->get_state();
    }
    return states;
}

bool resilience_guard::any_open() const {
    for (const auto & [site, state] : circuit_states()) {
        if (state != CIRCUIT_CLOSED) {
            return true;
        }
    }
    return false;
}

void resilience_guard::record_failure(const failure_record & record) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->total_failures++;

    auto & site_history = pimpl->history[record.site];
    site_history.push_back(record);
    while (site_history.size() > pimpl->cfg.history_limit) {
        site_history.pop_front();
    }
}

std::vector<failure_record> resilience_guard::get_history(const std::string & site, int limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->history.find(site);
    if (it == pimpl->history.end()) {
        return {};
    }

    std::vector<failure_record> records;
    int count = 0;

    for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
        if (limit > 0 && count >= limit) break;
        records.push_back(*rit);
        count++;
    }

    return records;
}

dead_letter_queue & resilience_guard::dead_letters() {
    return pimpl->dlq;
}

resilience_guard::stats resilience_guard::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    stats s;
    s.total_calls = pimpl->total_calls;
    s.total_failures = pimpl->total_failures;
    s.rejected_calls = pimpl->rejected_calls;
    s.dead_letters = static_cast<int>(pimpl->dlq.size());

    for (const auto & [site, records] : pimpl->history) {
        for (const auto & record : records) {
            s.failures_by_type[record.error]++;
        }
    }

    return s;
}

json resilience_guard::to_json() const {
    json circuits = json::object();
    for (const auto & [site, state] : circuit_states()) {
        circuits[site] = circuit_state_to_string(state);
    }

    auto s = get_stats();
    json by_type = json::object();
    for (const auto & [type, count] : s.failures_by_type) {
        by_type[error_type_to_string(type)] = count;
    }

    return json{
        {"circuits", circuits},
        {"total_calls", s.total_calls},
        {"total_failures", s.total_failures},
        {"rejected_calls", s.rejected_calls},
        {"failures_by_type", by_type},
        {"dead_letters", s.dead_letters},
    };
}

} // namespace coord
