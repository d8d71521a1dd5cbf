#include "conflict.h"
#include "../log.h"

#include <algorithm>
#include <map>
#include <mutex>

namespace coord {

// Newest first, equal timestamps by lowest agent id
static std::vector<conflicting_value> writer_order(const std::vector<conflicting_value> & values) {
    std::vector<conflicting_value> ordered = values;
    std::stable_sort(ordered.begin(), ordered.end(), [](const conflicting_value & a, const conflicting_value & b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.agent_id < b.agent_id;
    });
    return ordered;
}

// Distinct values in writer order
static std::vector<json> candidate_values(const std::vector<conflicting_value> & values) {
    std::vector<json> candidates;
    for (const auto & v : writer_order(values)) {
        if (std::find(candidates.begin(), candidates.end(), v.value) == candidates.end()) {
            candidates.push_back(v.value);
        }
    }
    return candidates;
}

struct conflict_resolver::impl {
    knowledge_store * store;
    consensus_coordinator * consensus;
    std::set<std::string> critical_domains = {"plan", "objective", "replan"};

    std::vector<resolution> log;
    std::map<std::string, size_t> by_conflict;  // conflict id -> log index
    mutable std::mutex mutex;
    std::mutex resolve_mutex;                   // Serializes whole resolutions

    resolution last_writer_wins(const conflict & c) const {
        resolution res;
        res.conflict_id = c.id;
        res.strategy = RESOLUTION_LAST_WRITER_WINS;

        if (c.values.empty()) {
            res.value = json();
            res.confidence = 0.0;
            res.rationale = "no values reported";
            return res;
        }

        const conflicting_value winner = writer_order(c.values).front();
        int agreeing = 0;
        for (const auto & v : c.values) {
            if (v.value == winner.value) {
                agreeing++;
            }
        }

        res.value = winner.value;
        res.confidence = static_cast<double>(agreeing) / c.values.size();
        res.rationale = "latest report from " + winner.agent_id + " at " + std::to_string(winner.timestamp);
        return res;
    }

    // Try each candidate newest first; the first committed one wins
    std::optional<consensus_result> vote(const std::string & conflict_id,
                                         const std::string & field,
                                         const std::vector<json> & candidates,
                                         const std::vector<std::string> & voters,
                                         json & chosen,
                                         const cancel_token * cancel) {
        if (!consensus || voters.empty()) {
            return std::nullopt;
        }

        for (const auto & candidate : candidates) {
            json proposal = {
                {"conflict_id", conflict_id},
                {"field", field},
                {"value", candidate}
            };
            consensus_result r = consensus->propose(voters, proposal, cancel);
            if (r.accepted()) {
                chosen = candidate;
                return r;
            }
            if (r.status == CONSENSUS_CANCELLED) {
                break;
            }
        }
        return std::nullopt;
    }

    resolution merge(const conflict & c, const std::vector<std::string> & voters, const cancel_token * cancel) {
        for (const auto & v : c.values) {
            if (!v.value.is_object()) {
                resolution res = last_writer_wins(c);
                res.rationale = "values are not field maps, " + res.rationale;
                return res;
            }
        }

        // Field names in first-seen order
        std::vector<std::string> fields;
        for (const auto & v : c.values) {
            for (const auto & item : v.value.items()) {
                if (std::find(fields.begin(), fields.end(), item.key()) == fields.end()) {
                    fields.push_back(item.key());
                }
            }
        }

        resolution res;
        res.conflict_id = c.id;
        res.strategy = RESOLUTION_MERGE;
        res.value = json::object();

        int agreed = 0;
        for (const auto & field : fields) {
            std::vector<conflicting_value> reports;
            for (const auto & v : c.values) {
                if (v.value.contains(field)) {
                    reports.push_back({v.agent_id, v.value.at(field), v.timestamp});
                }
            }

            bool same = std::all_of(reports.begin(), reports.end(), [&reports](const conflicting_value & r) {
                return r.value == reports.front().value;
            });
            if (same) {
                res.value[field] = reports.front().value;
                agreed++;
                continue;
            }

            res.escalated_fields.push_back(field);

            json chosen;
            if (vote(c.id, field, candidate_values(reports), voters, chosen, cancel)) {
                res.value[field] = chosen;
            } else {
                res.value[field] = writer_order(reports).front().value;
            }
        }

        size_t total = fields.size();
        size_t escalated = res.escalated_fields.size();
        res.confidence = total == 0 ? 1.0 : (agreed + 0.5 * escalated) / total;

        std::string how = consensus && !voters.empty() ? "consensus" : "last-writer-wins";
        res.rationale = "merged " + std::to_string(agreed) + " agreeing field(s)";
        if (escalated > 0) {
            res.rationale += ", escalated " + std::to_string(escalated) + " overlapping field(s) via " + how;
        }
        return res;
    }

    resolution escalate(const conflict & c, const std::vector<std::string> & voters, const cancel_token * cancel) {
        json chosen;
        auto r = vote(c.id, c.domain, candidate_values(c.values), voters, chosen, cancel);
        if (r) {
            resolution res;
            res.conflict_id = c.id;
            res.strategy = RESOLUTION_CONSENSUS;
            res.value = chosen;
            res.confidence = static_cast<double>(r->acceptances) / voters.size();
            res.rationale = "committed by quorum at term " + std::to_string(r->term) +
                            " (" + std::to_string(r->acceptances) + "/" + std::to_string(voters.size()) + ")";
            return res;
        }

        resolution res = last_writer_wins(c);
        res.confidence *= 0.5;
        res.rationale = "no candidate reached quorum, " + res.rationale;
        return res;
    }
};

conflict_resolver::conflict_resolver(knowledge_store * store, consensus_coordinator * consensus)
    : pimpl(std::make_unique<impl>()) {
    pimpl->store = store;
    pimpl->consensus = consensus;
}

conflict_resolver::~conflict_resolver() = default;

void conflict_resolver::set_consensus(consensus_coordinator * consensus) {
    std::lock_guard<std::mutex> lock(pimpl->resolve_mutex);
    pimpl->consensus = consensus;
}

void conflict_resolver::set_critical_domains(const std::set<std::string> & domains) {
    std::lock_guard<std::mutex> lock(pimpl->resolve_mutex);
    pimpl->critical_domains = domains;
}

conflict_severity conflict_resolver::classify(const std::string & domain,
                                              const std::vector<conflicting_value> & values) const {
    if (values.size() < 2) {
        return CONFLICT_SEVERITY_LOW;
    }

    bool all_equal = std::all_of(values.begin(), values.end(), [&values](const conflicting_value & v) {
        return v.value == values.front().value;
    });
    if (all_equal) {
        return CONFLICT_SEVERITY_LOW;
    }

    if (pimpl->critical_domains.count(domain) > 0) {
        return CONFLICT_SEVERITY_HIGH;
    }

    bool structured = std::all_of(values.begin(), values.end(), [](const conflicting_value & v) {
        return v.value.is_object();
    });
    return structured ? CONFLICT_SEVERITY_MEDIUM : CONFLICT_SEVERITY_LOW;
}

conflict conflict_resolver::make_conflict(const std::string & domain, const std::vector<conflicting_value> & values) const {
    conflict c;
    c.id = generate_uuid();
    c.domain = domain;
    c.values = values;
    c.severity = classify(domain, values);
    c.timestamp = get_timestamp_ms();
    return c;
}

resolution conflict_resolver::resolve(const conflict & c,
                                      const std::vector<std::string> & voters,
                                      const cancel_token * cancel) {
    std::lock_guard<std::mutex> serial(pimpl->resolve_mutex);

    if (auto existing = get_resolution(c.id)) {
        return *existing;
    }

    std::vector<std::string> electorate = voters;
    if (electorate.empty()) {
        for (const auto & v : c.values) {
            if (std::find(electorate.begin(), electorate.end(), v.agent_id) == electorate.end()) {
                electorate.push_back(v.agent_id);
            }
        }
    }

    resolution res;
    switch (c.severity) {
        case CONFLICT_SEVERITY_LOW:
            res = pimpl->last_writer_wins(c);
            break;
        case CONFLICT_SEVERITY_MEDIUM:
            res = pimpl->merge(c, electorate, cancel);
            break;
        case CONFLICT_SEVERITY_HIGH:
            res = pimpl->escalate(c, electorate, cancel);
            break;
    }
    res.conflict_id = c.id;
    res.timestamp = get_timestamp_ms();

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->by_conflict[c.id] = pimpl->log.size();
        pimpl->log.push_back(res);
    }

    LOG_INF("resolver: conflict %s (%s, %s) resolved by %s, confidence %.2f\n",
            c.id.c_str(), c.domain.c_str(), conflict_severity_to_string(c.severity),
            resolution_strategy_to_string(res.strategy), res.confidence);

    if (pimpl->store && !pimpl->store->save_resolution(res)) {
        LOG_WRN("resolver: knowledge store did not take resolution of %s\n", c.id.c_str());
    }
    return res;
}

std::optional<resolution> conflict_resolver::get_resolution(const std::string & conflict_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->by_conflict.find(conflict_id);
    if (it == pimpl->by_conflict.end()) {
        return std::nullopt;
    }
    return pimpl->log[it->second];
}

std::vector<resolution> conflict_resolver::get_log() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->log;
}

} // namespace coord
