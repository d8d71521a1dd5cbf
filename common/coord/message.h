#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace coord {

using json = nlohmann::ordered_json;

// Message types for coordinator <-> agent traffic
enum message_type {
    MESSAGE_TYPE_REQUEST,       // Work dispatch or query
    MESSAGE_TYPE_RESPONSE,      // Reply correlated with a request
    MESSAGE_TYPE_STATUS,        // Progress / status report
    MESSAGE_TYPE_COORDINATION,  // Consensus phases, cancellation, replanning
    MESSAGE_TYPE_CONFLICT,      // Disagreement report
    MESSAGE_TYPE_HEARTBEAT      // Liveness ping
};

const char * message_type_to_string(message_type type);
message_type message_type_from_string(const std::string & str);

// Agent message structure
struct agent_message {
    std::string message_id;               // UUID, receivers de-duplicate on it
    message_type type = MESSAGE_TYPE_REQUEST;
    std::string from_agent;               // Sender id
    std::vector<std::string> recipients;  // One or many destination ids
    std::string payload;                  // JSON payload
    std::string correlation_id;           // Request id this message answers
    int64_t timestamp = 0;                // Unix epoch ms
    int priority = 5;                     // 0-10, higher = more urgent
    bool requires_response = false;
    int delivery_attempts = 0;            // Bumped by the bus on redelivery
    std::map<std::string, std::string> metadata;

    // Serialize to JSON
    std::string to_json() const;

    // Deserialize from JSON
    static agent_message from_json(const std::string & json_str);

    // New message with a fresh id and timestamp
    static agent_message make(message_type type,
                              const std::string & from,
                              const std::string & to,
                              const json & payload);

    json payload_json() const;
};

// Shared cancellation flag handed to long-running operations.
// Copies observe the same flag; a child token is cancelled with its parent.
class cancel_token {
public:
    cancel_token();

    void cancel();
    bool is_cancelled() const;

    // Token cancelled either explicitly or when this token is cancelled
    cancel_token child() const;

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<state> parent;
    };
    std::shared_ptr<state> st;
};

// Generate UUID v4 string
std::string generate_uuid();

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

} // namespace coord
