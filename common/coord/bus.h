#pragma once

#include "failure.h"
#include "message.h"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace coord {

//
// Addressed message transport between the coordinator and agents.
//
// Every subscriber owns a bounded FIFO mailbox. A full mailbox makes the
// sender wait up to its timeout and then fail with ERROR_TYPE_QUEUE_FULL;
// messages are never dropped silently. Mailboxes subscribed with a handler
// are drained by the dispatcher thread, the others are read with receive().
// Delivery to handlers is at-least-once: a handler returning false gets the
// same message again (ahead of anything queued after it) until
// max_delivery_attempts, then the message goes to the dead letter queue.
//

class message_bus {
public:
    struct config {
        size_t max_queue_depth = 1000;     // Per recipient
        int max_delivery_attempts = 3;     // Handler redeliveries before dead-lettering
        int64_t dispatch_poll_ms = 20;     // Dispatcher idle wait
    };

    // Return true to acknowledge the message
    using message_handler = std::function<bool(const agent_message &)>;

    message_bus();
    explicit message_bus(const config & cfg, dead_letter_queue * dead_letters = nullptr);
    ~message_bus();

    message_bus(const message_bus &) = delete;
    message_bus & operator=(const message_bus &) = delete;

    // Create a mailbox; with a handler, the dispatcher delivers to it
    bool subscribe(const std::string & agent_id, message_handler handler = nullptr);

    // Remove the mailbox; queued messages are dead-lettered. Blocks until a
    // handler running on another thread for this mailbox has returned
    bool unsubscribe(const std::string & agent_id);

    bool has_subscriber(const std::string & agent_id) const;

    // Unicast. timeout_ms bounds the wait for mailbox space (0 = do not wait)
    error_type send(const std::string & to, const agent_message & msg, int64_t timeout_ms = 0);

    struct broadcast_result {
        int delivered = 0;
        std::map<std::string, error_type> failed;

        bool ok() const { return failed.empty(); }
    };

    // Send a copy to each recipient, stamped with the sender id
    broadcast_result broadcast(const std::string & from,
                               const agent_message & msg,
                               const std::vector<std::string> & recipients,
                               int64_t timeout_ms = 0);

    // Pull up to max_count messages, waiting up to timeout_ms for the first
    std::vector<agent_message> receive(const std::string & agent_id,
                                       size_t max_count = 100,
                                       int64_t timeout_ms = 0);

    // Deliver everything queued for one handler mailbox; returns acked count
    size_t dispatch(const std::string & agent_id);

    // Dispatcher thread for handler mailboxes
    void start();
    void stop();

    // Refuse further sends and wake all waiters
    void close();

    size_t queue_depth(const std::string & agent_id) const;
    std::map<std::string, size_t> queue_depths() const;

    struct stats {
        int64_t sent;
        int64_t delivered;
        int64_t redelivered;
        int64_t rejected_full;
        int64_t dead_lettered;
        size_t mailboxes;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// Receiver-side filter for at-least-once delivery. Remembers the last
// `capacity` message ids.
class message_deduplicator {
public:
    explicit message_deduplicator(size_t capacity = 4096);

    // True the first time an id is seen
    bool first_seen(const std::string & message_id);

    size_t size() const;

private:
    size_t capacity;
    std::deque<std::string> order;
    std::unordered_set<std::string> seen;
    mutable std::mutex mutex;
};

} // namespace coord
