#include "message.h"

#include <chrono>
#include <random>
#include <sstream>
#include <mutex>

namespace coord {

// Helper function to generate UUID v4
std::string generate_uuid() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char * hex = "0123456789abcdef";

    std::lock_guard<std::mutex> lock(mutex);

    std::stringstream ss;
    for (int i = 0; i < 8; i++) ss << hex[dis(gen)];
    ss << "-";
    for (int i = 0; i < 4; i++) ss << hex[dis(gen)];
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << hex[dis(gen)];
    ss << "-";
    ss << hex[(dis(gen) & 0x3) | 0x8];
    for (int i = 0; i < 3; i++) ss << hex[dis(gen)];
    ss << "-";
    for (int i = 0; i < 12; i++) ss << hex[dis(gen)];

    return ss.str();
}

int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

const char * message_type_to_string(message_type type) {
    switch (type) {
        case MESSAGE_TYPE_REQUEST:      return "request";
        case MESSAGE_TYPE_RESPONSE:     return "response";
        case MESSAGE_TYPE_STATUS:       return "status";
        case MESSAGE_TYPE_COORDINATION: return "coordination";
        case MESSAGE_TYPE_CONFLICT:     return "conflict";
        case MESSAGE_TYPE_HEARTBEAT:    return "heartbeat";
        default:                        return "unknown";
    }
}

message_type message_type_from_string(const std::string & str) {
    if (str == "response")     return MESSAGE_TYPE_RESPONSE;
    if (str == "status")       return MESSAGE_TYPE_STATUS;
    if (str == "coordination") return MESSAGE_TYPE_COORDINATION;
    if (str == "conflict")     return MESSAGE_TYPE_CONFLICT;
    if (str == "heartbeat")    return MESSAGE_TYPE_HEARTBEAT;
    return MESSAGE_TYPE_REQUEST;
}

// agent_message serialization
std::string agent_message::to_json() const {
    json j;
    j["message_id"] = message_id;
    j["type"] = message_type_to_string(type);
    j["from_agent"] = from_agent;
    j["recipients"] = recipients;
    j["payload"] = payload;
    j["correlation_id"] = correlation_id;
    j["timestamp"] = timestamp;
    j["priority"] = priority;
    j["requires_response"] = requires_response;
    j["delivery_attempts"] = delivery_attempts;
    j["metadata"] = metadata;
    return j.dump();
}

agent_message agent_message::from_json(const std::string & json_str) {
    json j = json::parse(json_str);
    agent_message msg;
    msg.message_id = j.value("message_id", "");
    msg.type = message_type_from_string(j.value("type", "request"));
    msg.from_agent = j.value("from_agent", "");
    msg.recipients = j.value("recipients", std::vector<std::string>());
    msg.payload = j.value("payload", "");
    msg.correlation_id = j.value("correlation_id", "");
    msg.timestamp = j.value("timestamp", get_timestamp_ms());
    msg.priority = j.value("priority", 5);
    msg.requires_response = j.value("requires_response", false);
    msg.delivery_attempts = j.value("delivery_attempts", 0);
    msg.metadata = j.value("metadata", std::map<std::string, std::string>());
    return msg;
}

agent_message agent_message::make(message_type type,
                                  const std::string & from,
                                  const std::string & to,
                                  const json & payload) {
    agent_message msg;
    msg.message_id = generate_uuid();
    msg.type = type;
    msg.from_agent = from;
    if (!to.empty()) {
        msg.recipients.push_back(to);
    }
    msg.payload = payload.dump();
    msg.timestamp = get_timestamp_ms();
    return msg;
}

json agent_message::payload_json() const {
    if (payload.empty()) {
        return json::object();
    }
    return json::parse(payload, nullptr, false);
}

// cancel_token
cancel_token::cancel_token() : st(std::make_shared<state>()) {}

void cancel_token::cancel() {
    st->cancelled = true;
}

bool cancel_token::is_cancelled() const {
    for (const state * s = st.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) {
            return true;
        }
    }
    return false;
}

cancel_token cancel_token::child() const {
    cancel_token c;
    c.st->parent = st;
    return c;
}

} // namespace coord
