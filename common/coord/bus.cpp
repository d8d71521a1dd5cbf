#include "bus.h"
#include "../log.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <unordered_map>

namespace coord {

struct mailbox {
    std::deque<agent_message> queue;
    message_bus::message_handler handler;
    bool dispatching = false;
    bool closing = false;              // unsubscribe pending, no new dispatch
    std::thread::id dispatcher;        // thread running the handler
};

struct message_bus::impl {
    config cfg;
    dead_letter_queue * dead_letters;
    std::unordered_map<std::string, mailbox> mailboxes;
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::condition_variable dispatch_done;
    bool closed = false;

    std::atomic<bool> dispatcher_running{false};
    std::thread dispatcher_thread;

    std::atomic<int64_t> sent{0};
    std::atomic<int64_t> delivered{0};
    std::atomic<int64_t> redelivered{0};
    std::atomic<int64_t> rejected_full{0};
    std::atomic<int64_t> dead_lettered{0};

    impl(const config & c, dead_letter_queue * dlq) : cfg(c), dead_letters(dlq) {}

    void dead_letter(const agent_message & msg, const std::string & recipient, error_type err) {
        dead_lettered++;
        if (!dead_letters) {
            LOG_ERR("bus: undeliverable message %s for %s (%s), no dead letter queue attached\n",
                    msg.message_id.c_str(), recipient.c_str(), error_type_to_string(err));
            return;
        }
        failure_record record;
        record.site = "bus:" + recipient;
        record.error = err;
        record.error_message = "delivery abandoned";
        record.timestamp = get_timestamp_ms();
        record.message_id = msg.message_id;
        record.attempt = msg.delivery_attempts;
        dead_letters->add(msg, recipient, record);
    }

    std::vector<agent_message> take(mailbox & box, size_t max_count) {
        std::vector<agent_message> result;
        size_t count = std::min(max_count, box.queue.size());
        result.reserve(count);
        for (size_t i = 0; i < count; i++) {
            result.push_back(std::move(box.queue.front()));
            box.queue.pop_front();
        }
        if (count > 0) {
            delivered += count;
            not_full.notify_all();
        }
        return result;
    }
};

message_bus::message_bus() : pimpl(std::make_unique<impl>(config(), nullptr)) {}

message_bus::message_bus(const config & cfg, dead_letter_queue * dead_letters)
    : pimpl(std::make_unique<impl>(cfg, dead_letters)) {}

message_bus::~message_bus() {
    stop();
    close();
}

bool message_bus::subscribe(const std::string & agent_id, message_handler handler) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->mailboxes.find(agent_id);
    if (it != pimpl->mailboxes.end()) {
        // Re-subscribing swaps the handler but keeps queued messages
        it->second.handler = handler;
        return false;
    }

    pimpl->mailboxes[agent_id].handler = handler;
    return true;
}

bool message_bus::unsubscribe(const std::string & agent_id) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->mailboxes.find(agent_id);
    if (it == pimpl->mailboxes.end()) {
        return false;
    }

    // Wait out a handler running on another thread; a handler may drop its own mailbox
    it->second.closing = true;
    if (it->second.dispatching && it->second.dispatcher != std::this_thread::get_id()) {
        pimpl->dispatch_done.wait(lock, [this, &agent_id] {
            auto box = pimpl->mailboxes.find(agent_id);
            return box == pimpl->mailboxes.end() || !box->second.dispatching;
        });
        it = pimpl->mailboxes.find(agent_id);
        if (it == pimpl->mailboxes.end()) {
            return false;
        }
    }

    for (const auto & msg : it->second.queue) {
        pimpl->dead_letter(msg, agent_id, ERROR_TYPE_AGENT_NOT_FOUND);
    }
    pimpl->mailboxes.erase(it);

    pimpl->not_full.notify_all();
    pimpl->not_empty.notify_all();
    return true;
}

bool message_bus::has_subscriber(const std::string & agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->mailboxes.find(agent_id) != pimpl->mailboxes.end();
}

error_type message_bus::send(const std::string & to, const agent_message & msg, int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0);

    while (true) {
        if (pimpl->closed) {
            return ERROR_TYPE_UNAVAILABLE;
        }

        auto it = pimpl->mailboxes.find(to);
        if (it == pimpl->mailboxes.end()) {
            return ERROR_TYPE_AGENT_NOT_FOUND;
        }

        if (it->second.queue.size() < pimpl->cfg.max_queue_depth) {
            agent_message copy = msg;
            copy.recipients = {to};
            if (copy.timestamp == 0) {
                copy.timestamp = get_timestamp_ms();
            }
            it->second.queue.push_back(std::move(copy));
            pimpl->sent++;
            pimpl->not_empty.notify_all();
            return ERROR_TYPE_NONE;
        }

        if (timeout_ms <= 0 || pimpl->not_full.wait_until(lock, deadline) == std::cv_status::timeout) {
            // One last look after the wait expired
            auto again = pimpl->mailboxes.find(to);
            if (again != pimpl->mailboxes.end() && !pimpl->closed &&
                again->second.queue.size() < pimpl->cfg.max_queue_depth && timeout_ms > 0) {
                continue;
            }
            pimpl->rejected_full++;
            LOG_DBG("bus: mailbox %s full (%zu), rejecting %s\n",
                    to.c_str(), pimpl->cfg.max_queue_depth, msg.message_id.c_str());
            return ERROR_TYPE_QUEUE_FULL;
        }
    }
}

message_bus::broadcast_result message_bus::broadcast(const std::string & from,
                                                     const agent_message & msg,
                                                     const std::vector<std::string> & recipients,
                                                     int64_t timeout_ms) {
    broadcast_result result;

    agent_message copy = msg;
    copy.from_agent = from;
    if (copy.message_id.empty()) {
        copy.message_id = generate_uuid();
    }

    for (const auto & recipient : recipients) {
        error_type err = send(recipient, copy, timeout_ms);
        if (err == ERROR_TYPE_NONE) {
            result.delivered++;
        } else {
            result.failed[recipient] = err;
        }
    }

    return result;
}

std::vector<agent_message> message_bus::receive(const std::string & agent_id,
                                                size_t max_count,
                                                int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    if (timeout_ms > 0) {
        pimpl->not_empty.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, &agent_id] {
            if (pimpl->closed) {
                return true;
            }
            auto it = pimpl->mailboxes.find(agent_id);
            return it == pimpl->mailboxes.end() || !it->second.queue.empty();
        });
    }

    auto it = pimpl->mailboxes.find(agent_id);
    if (it == pimpl->mailboxes.end()) {
        return {};
    }
    return pimpl->take(it->second, max_count);
}

size_t message_bus::dispatch(const std::string & agent_id) {
    size_t acked = 0;

    while (true) {
        agent_message msg;
        message_handler handler;
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            auto it = pimpl->mailboxes.find(agent_id);
            if (it == pimpl->mailboxes.end() || !it->second.handler || it->second.closing ||
                it->second.dispatching || it->second.queue.empty()) {
                return acked;
            }
            it->second.dispatching = true;
            it->second.dispatcher = std::this_thread::get_id();
            msg = std::move(it->second.queue.front());
            it->second.queue.pop_front();
            handler = it->second.handler;
            pimpl->not_full.notify_all();
        }

        msg.delivery_attempts++;

        bool ok = false;
        try {
            ok = handler(msg);
        } catch (const std::exception & e) {
            LOG_ERR("bus: handler for %s threw on %s: %s\n", agent_id.c_str(), msg.message_id.c_str(), e.what());
            ok = false;
        }

        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->mailboxes.find(agent_id);
        if (it != pimpl->mailboxes.end()) {
            it->second.dispatching = false;
            it->second.dispatcher = std::thread::id();
        }
        pimpl->dispatch_done.notify_all();

        if (ok) {
            pimpl->delivered++;
            acked++;
            continue;
        }

        if (it == pimpl->mailboxes.end()) {
            pimpl->dead_letter(msg, agent_id, ERROR_TYPE_AGENT_NOT_FOUND);
            return acked;
        }

        if (msg.delivery_attempts < pimpl->cfg.max_delivery_attempts) {
            // Back to the front so later messages from the same sender stay behind it
            pimpl->redelivered++;
            it->second.queue.push_front(std::move(msg));
            return acked;
        }

        LOG_WRN("bus: %s rejected message %s %d times, dead-lettering\n",
                agent_id.c_str(), msg.message_id.c_str(), msg.delivery_attempts);
        pimpl->dead_letter(msg, agent_id, ERROR_TYPE_TASK_FAILED);
    }
}

void message_bus::start() {
    if (pimpl->dispatcher_running.exchange(true)) {
        return;
    }

    pimpl->dispatcher_thread = std::thread([this]() {
        while (pimpl->dispatcher_running) {
            std::vector<std::string> ready;
            {
                std::unique_lock<std::mutex> lock(pimpl->mutex);
                pimpl->not_empty.wait_for(lock, std::chrono::milliseconds(pimpl->cfg.dispatch_poll_ms));
                for (const auto & [id, box] : pimpl->mailboxes) {
                    if (box.handler && !box.queue.empty() && !box.dispatching && !box.closing) {
                        ready.push_back(id);
                    }
                }
            }
            for (const auto & id : ready) {
                dispatch(id);
            }
        }
    });
}

void message_bus::stop() {
    if (!pimpl->dispatcher_running.exchange(false)) {
        return;
    }
    pimpl->not_empty.notify_all();
    if (pimpl->dispatcher_thread.joinable()) {
        pimpl->dispatcher_thread.join();
    }
}

void message_bus::close() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->closed = true;
    pimpl->not_empty.notify_all();
    pimpl->not_full.notify_all();
}

size_t message_bus::queue_depth(const std::string & agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->mailboxes.find(agent_id);
    if (it != pimpl->mailboxes.end()) {
        return it->second.queue.size();
    }
    return 0;
}

std::map<std::string, size_t> message_bus::queue_depths() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::map<std::string, size_t> depths;
    for (const auto & [id, box] : pimpl->mailboxes) {
        depths[id] = box.queue.size();
    }
    return depths;
}

message_bus::stats message_bus::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    stats s;
    s.sent = pimpl->sent;
    s.delivered = pimpl->delivered;
    s.redelivered = pimpl->redelivered;
    s.rejected_full = pimpl->rejected_full;
    s.dead_lettered = pimpl->dead_lettered;
    s.mailboxes = pimpl->mailboxes.size();
    return s;
}

// message_deduplicator
message_deduplicator::message_deduplicator(size_t capacity) : capacity(capacity) {}

bool message_deduplicator::first_seen(const std::string & message_id) {
    std::lock_guard<std::mutex> lock(mutex);

    if (seen.count(message_id) > 0) {
        return false;
    }

    seen.insert(message_id);
    order.push_back(message_id);
    while (order.size() > capacity) {
        seen.erase(order.front());
        order.pop_front();
    }
    return true;
}

size_t message_deduplicator::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return seen.size();
}

} // namespace coord
