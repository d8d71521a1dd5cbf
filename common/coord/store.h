#pragma once

#include "plan.h"

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coord {

// Aggregated outcomes of one action under one context
struct historical_pattern {
    std::string context;
    std::string action;
    int successes = 0;
    int failures = 0;
    double avg_duration_ms = 0.0;

    int samples() const { return successes + failures; }
    double success_rate() const {
        return samples() > 0 ? static_cast<double>(successes) / samples() : 0.0;
    }

    json to_json() const;
};

//
// Knowledge store contract. Callers treat every failure as "no history":
// a false return or an empty result never stops planning or execution.
//

class knowledge_store {
public:
    virtual ~knowledge_store() = default;

    virtual bool save_decision_outcome(const decision & d, const execution_outcome & outcome) = 0;

    virtual std::vector<historical_pattern> query_historical_patterns(const std::string & context) = 0;

    virtual bool save_plan(const task_plan & plan) = 0;

    virtual std::optional<task_plan> load_plan(const std::string & plan_id) = 0;

    virtual bool save_resolution(const resolution & res) = 0;
};

struct knowledge_entry {
    std::string key;
    std::string value;
    std::string contributor_id;
    int64_t timestamp = 0;
    int version = 0;
    std::vector<std::string> tags;

    json to_json() const;
};

// In-memory store of versioned, tagged entries
class memory_knowledge_store : public knowledge_store {
public:
    memory_knowledge_store() = default;

    // Store a new version of key
    void put(const std::string & key, const std::string & value,
             const std::string & contributor_id, const std::vector<std::string> & tags = {});

    // Retrieve latest version
    bool get(const std::string & key, knowledge_entry & entry) const;

    // All versions, oldest first
    std::vector<knowledge_entry> get_history(const std::string & key) const;

    // Latest versions carrying every tag
    std::vector<knowledge_entry> query(const std::vector<std::string> & tags) const;

    std::vector<std::string> get_all_keys() const;

    void clear();

    // Export/import for persistence
    json to_json() const;
    bool from_json(const json & j, std::string * error = nullptr);

    // While unavailable every contract call fails, as a dead backend would
    void set_available(bool available) { this->available = available; }

    bool save_decision_outcome(const decision & d, const execution_outcome & outcome) override;
    std::vector<historical_pattern> query_historical_patterns(const std::string & context) override;
    bool save_plan(const task_plan & plan) override;
    std::optional<task_plan> load_plan(const std::string & plan_id) override;
    bool save_resolution(const resolution & res) override;

private:
    std::unordered_map<std::string, std::vector<knowledge_entry>> entries;
    mutable std::shared_mutex mutex;
    std::atomic<bool> available{true};
};

} // namespace coord
