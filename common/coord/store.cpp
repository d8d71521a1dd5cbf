#include "store.h"
#include "../log.h"

#include <algorithm>
#include <map>
#include <mutex>

namespace coord {

json historical_pattern::to_json() const {
    return json{
        {"context", context},
        {"action", action},
        {"successes", successes},
        {"failures", failures},
        {"avg_duration_ms", avg_duration_ms}
    };
}

json knowledge_entry::to_json() const {
    return json{
        {"key", key},
        {"value", value},
        {"contributor_id", contributor_id},
        {"timestamp", timestamp},
        {"version", version},
        {"tags", tags}
    };
}

void memory_knowledge_store::put(const std::string & key, const std::string & value,
                                 const std::string & contributor_id,
                                 const std::vector<std::string> & tags) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    knowledge_entry entry;
    entry.key = key;
    entry.value = value;
    entry.contributor_id = contributor_id;
    entry.timestamp = get_timestamp_ms();
    entry.tags = tags;

    auto & versions = entries[key];
    entry.version = versions.empty() ? 1 : versions.back().version + 1;
    versions.push_back(entry);
}

bool memory_knowledge_store::get(const std::string & key, knowledge_entry & entry) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = entries.find(key);
    if (it != entries.end() && !it->second.empty()) {
        entry = it->second.back();
        return true;
    }
    return false;
}

std::vector<knowledge_entry> memory_knowledge_store::get_history(const std::string & key) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = entries.find(key);
    if (it != entries.end()) {
        return it->second;
    }
    return {};
}

std::vector<knowledge_entry> memory_knowledge_store::query(const std::vector<std::string> & tags) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<knowledge_entry> results;
    for (const auto & [key, versions] : entries) {
        if (versions.empty()) {
            continue;
        }
        const auto & latest = versions.back();
        bool has_all = std::all_of(tags.begin(), tags.end(), [&latest](const std::string & tag) {
            return std::find(latest.tags.begin(), latest.tags.end(), tag) != latest.tags.end();
        });
        if (has_all) {
            results.push_back(latest);
        }
    }

    std::sort(results.begin(), results.end(), [](const knowledge_entry & a, const knowledge_entry & b) {
        return a.key < b.key;
    });
    return results;
}

std::vector<std::string> memory_knowledge_store::get_all_keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (const auto & [key, _] : entries) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void memory_knowledge_store::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    entries.clear();
}

json memory_knowledge_store::to_json() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    json j = json::array();
    for (const auto & [key, versions] : entries) {
        for (const auto & entry : versions) {
            j.push_back(entry.to_json());
        }
    }
    return j;
}

bool memory_knowledge_store::from_json(const json & j, std::string * error) {
    if (!j.is_array()) {
        if (error) *error = "store export must be an array";
        return false;
    }

    std::unordered_map<std::string, std::vector<knowledge_entry>> loaded;
    try {
        for (const auto & item : j) {
            knowledge_entry entry;
            entry.key = item.at("key").get<std::string>();
            entry.value = item.value("value", "");
            entry.contributor_id = item.value("contributor_id", "");
            entry.timestamp = item.value("timestamp", static_cast<int64_t>(0));
            entry.version = item.value("version", 1);
            entry.tags = item.value("tags", std::vector<std::string>());
            loaded[entry.key].push_back(entry);
        }
    } catch (const json::exception & e) {
        if (error) *error = std::string("malformed store export: ") + e.what();
        return false;
    }

    for (auto & [key, versions] : loaded) {
        std::sort(versions.begin(), versions.end(), [](const knowledge_entry & a, const knowledge_entry & b) {
            return a.version < b.version;
        });
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    entries = std::move(loaded);
    return true;
}

// knowledge_store contract
bool memory_knowledge_store::save_decision_outcome(const decision & d, const execution_outcome & outcome) {
    if (!available) {
        return false;
    }

    json record = {
        {"decision", d.to_json()},
        {"outcome", outcome.to_json()}
    };
    put("outcome/" + d.id, record.dump(), d.task_id, {"outcome", "ctx:" + d.context});
    return true;
}

std::vector<historical_pattern> memory_knowledge_store::query_historical_patterns(const std::string & context) {
    if (!available) {
        return {};
    }

    std::map<std::string, historical_pattern> by_action;
    std::map<std::string, int64_t> total_duration;

    for (const auto & entry : query({"outcome", "ctx:" + context})) {
        json record = json::parse(entry.value, nullptr, false);
        if (record.is_discarded() || !record.contains("decision") || !record.contains("outcome")) {
            LOG_WRN("store: skipping unreadable outcome %s\n", entry.key.c_str());
            continue;
        }

        std::string action = record["decision"].value("action", "");
        auto & pattern = by_action[action];
        pattern.context = context;
        pattern.action = action;
        if (record["outcome"].value("success", false)) {
            pattern.successes++;
        } else {
            pattern.failures++;
        }
        total_duration[action] += record["outcome"].value("duration_ms", static_cast<int64_t>(0));
    }

    std::vector<historical_pattern> result;
    for (auto & [action, pattern] : by_action) {
        pattern.avg_duration_ms = static_cast<double>(total_duration[action]) / pattern.samples();
        result.push_back(pattern);
    }
    return result;
}

bool memory_knowledge_store::save_plan(const task_plan & plan) {
    if (!available) {
        return false;
    }
    put("plan/" + plan.id, plan.to_json().dump(), plan.objective_id, {"plan"});
    return true;
}

std::optional<task_plan> memory_knowledge_store::load_plan(const std::string & plan_id) {
    if (!available) {
        return std::nullopt;
    }

    knowledge_entry entry;
    if (!get("plan/" + plan_id, entry)) {
        return std::nullopt;
    }

    json j = json::parse(entry.value, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERR("store: plan %s is not valid JSON\n", plan_id.c_str());
        return std::nullopt;
    }

    task_plan plan;
    std::string error;
    if (!task_plan::from_json(j, plan, &error)) {
        LOG_ERR("store: cannot load plan %s: %s\n", plan_id.c_str(), error.c_str());
        return std::nullopt;
    }
    return plan;
}

bool memory_knowledge_store::save_resolution(const resolution & res) {
    if (!available) {
        return false;
    }
    put("resolution/" + res.conflict_id, res.to_json().dump(), "resolver",
        {"resolution", resolution_strategy_to_string(res.strategy)});
    return true;
}

} // namespace coord
