#include "consensus.h"
#include "../log.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>

namespace coord {

const char * consensus_status_to_string(consensus_status status) {
    switch (status) {
        case CONSENSUS_ACCEPTED:  return "accepted";
        case CONSENSUS_REJECTED:  return "rejected";
        case CONSENSUS_CANCELLED: return "cancelled";
        default:                  return "rejected";
    }
}

json consensus_proposal::to_json() const {
    return json{
        {"proposal_id", proposal_id},
        {"term", term},
        {"value", value},
        {"targets", targets}
    };
}

json consensus_result::to_json() const {
    return json{
        {"proposal_id", proposal_id},
        {"term", term},
        {"status", consensus_status_to_string(status)},
        {"reason", reason},
        {"promises", promises},
        {"acceptances", acceptances},
        {"quorum", quorum},
        {"value", value},
        {"decided_at", decided_at}
    };
}

int quorum_size(size_t n) {
    return static_cast<int>(n / 2 + 1);
}

struct consensus_coordinator::impl {
    message_bus & bus;
    resilience_guard & guard;
    std::string coordinator_id;
    std::string address;
    int64_t phase_timeout_ms;
    retry_policy policy;

    std::atomic<uint64_t> term{0};
    std::mutex round_mutex;  // One round at a time

    std::map<std::string, consensus_result> results;
    mutable std::mutex results_mutex;

    impl(message_bus & b, resilience_guard & g) : bus(b), guard(g) {}

    struct tally {
        std::set<std::string> yes;
        int no = 0;
        bool cancelled = false;
    };

    // Send one phase message to each target, returns who it reached
    std::vector<std::string> send_phase(const consensus_proposal & p,
                                        const std::string & phase,
                                        const std::vector<std::string> & targets,
                                        const cancel_token * cancel) {
        json payload = {
            {"consensus", phase},
            {"proposal_id", p.proposal_id},
            {"term", p.term},
            {"value", p.value},
            {"reply_to", address}
        };

        std::vector<std::string> reached;
        int64_t send_timeout = std::min<int64_t>(phase_timeout_ms, 500);
        for (const auto & target : targets) {
            agent_message msg = agent_message::make(MESSAGE_TYPE_COORDINATION, address, target, payload);
            msg.requires_response = phase != "commit";
            msg.priority = 8;

            error_type err = guard.execute_with_retry("agent:" + target, [&]() {
                return bus.send(target, msg, send_timeout);
            }, policy, cancel);

            if (err == ERROR_TYPE_NONE) {
                reached.push_back(target);
            } else {
                LOG_WRN("consensus: %s to %s failed: %s\n",
                        phase.c_str(), target.c_str(), error_type_to_string(err));
            }
        }
        return reached;
    }

    // Wait for votes of one phase until quorum, a hopeless tally, timeout or cancel
    tally collect(const consensus_proposal & p,
                  const std::string & reply_phase,
                  const std::vector<std::string> & eligible,
                  int quorum,
                  const cancel_token * cancel) {
        tally t;
        std::set<std::string> voters(eligible.begin(), eligible.end());
        std::set<std::string> voted;
        int64_t deadline = get_timestamp_ms() + phase_timeout_ms;

        while (static_cast<int>(t.yes.size()) < quorum) {
            if (cancel && cancel->is_cancelled()) {
                t.cancelled = true;
                break;
            }
            // Quorum out of reach
            if (t.no > static_cast<int>(voters.size()) - quorum) {
                break;
            }
            int64_t remaining = deadline - get_timestamp_ms();
            if (remaining <= 0) {
                break;
            }

            for (const auto & msg : bus.receive(address, 64, std::min<int64_t>(remaining, 20))) {
                json vote = msg.payload_json();
                if (vote.is_discarded() || !vote.is_object()) {
                    continue;
                }
                if (vote.value("consensus", "") != reply_phase ||
                    vote.value("proposal_id", "") != p.proposal_id ||
                    vote.value("term", static_cast<uint64_t>(0)) != p.term) {
                    LOG_DBG("consensus: ignoring stale vote from %s\n", msg.from_agent.c_str());
                    continue;
                }
                if (voters.count(msg.from_agent) == 0 || !voted.insert(msg.from_agent).second) {
                    continue;
                }
                if (vote.value("vote", false)) {
                    t.yes.insert(msg.from_agent);
                } else {
                    t.no++;
                }
            }
        }
        return t;
    }

    consensus_result finish(consensus_result result) {
        result.decided_at = get_timestamp_ms();

        std::lock_guard<std::mutex> lock(results_mutex);
        auto inserted = results.emplace(result.proposal_id, result);
        return inserted.first->second;
    }
};

consensus_coordinator::consensus_coordinator(message_bus & bus,
                                             resilience_guard & guard,
                                             const std::string & coordinator_id,
                                             int64_t phase_timeout_ms,
                                             const retry_policy & policy)
    : pimpl(std::make_unique<impl>(bus, guard)) {
    pimpl->coordinator_id = coordinator_id;
    pimpl->address = coordinator_id + "/consensus";
    pimpl->phase_timeout_ms = phase_timeout_ms > 0 ? phase_timeout_ms : 2000;
    pimpl->policy = policy;

    pimpl->bus.subscribe(pimpl->address);
}

consensus_coordinator::~consensus_coordinator() {
    pimpl->bus.unsubscribe(pimpl->address);
}

consensus_result consensus_coordinator::propose(const std::vector<std::string> & agent_ids,
                                                const json & value,
                                                const cancel_token * cancel) {
    std::lock_guard<std::mutex> round(pimpl->round_mutex);

    consensus_proposal p;
    p.proposal_id = generate_uuid();
    p.term = ++pimpl->term;
    p.value = value;
    for (const auto & id : agent_ids) {
        if (std::find(p.targets.begin(), p.targets.end(), id) == p.targets.end()) {
            p.targets.push_back(id);
        }
    }

    consensus_result result;
    result.proposal_id = p.proposal_id;
    result.term = p.term;
    result.quorum = quorum_size(p.targets.size());

    if (p.targets.empty()) {
        result.reason = "no participants";
        return pimpl->finish(result);
    }

    // Votes left over from earlier rounds
    while (!pimpl->bus.receive(pimpl->address, 256, 0).empty()) {
    }

    LOG_DBG("consensus: term %llu, proposal %s over %zu agent(s), quorum %d\n",
            static_cast<unsigned long long>(p.term), p.proposal_id.c_str(), p.targets.size(), result.quorum);

    // Prepare
    std::vector<std::string> reached = pimpl->send_phase(p, "prepare", p.targets, cancel);
    impl::tally promises = pimpl->collect(p, "promise", reached, result.quorum, cancel);
    result.promises = static_cast<int>(promises.yes.size());

    if (promises.cancelled || (cancel && cancel->is_cancelled())) {
        result.status = CONSENSUS_CANCELLED;
        result.reason = "cancelled during prepare";
        return pimpl->finish(result);
    }
    if (result.promises < result.quorum) {
        result.reason = "prepare: " + std::to_string(result.promises) + " of " +
                        std::to_string(result.quorum) + " promises";
        LOG_INF("consensus: proposal %s rejected (%s)\n", p.proposal_id.c_str(), result.reason.c_str());
        return pimpl->finish(result);
    }

    // Accept
    std::vector<std::string> promisers(promises.yes.begin(), promises.yes.end());
    reached = pimpl->send_phase(p, "accept", promisers, cancel);
    impl::tally accepts = pimpl->collect(p, "accepted", reached, result.quorum, cancel);
    result.acceptances = static_cast<int>(accepts.yes.size());

    if (accepts.cancelled || (cancel && cancel->is_cancelled())) {
        result.status = CONSENSUS_CANCELLED;
        result.reason = "cancelled during accept";
        return pimpl->finish(result);
    }
    if (result.acceptances < result.quorum) {
        result.reason = "accept: " + std::to_string(result.acceptances) + " of " +
                        std::to_string(result.quorum) + " acceptances";
        LOG_INF("consensus: proposal %s rejected (%s)\n", p.proposal_id.c_str(), result.reason.c_str());
        return pimpl->finish(result);
    }

    // Commit
    result.status = CONSENSUS_ACCEPTED;
    result.value = p.value;
    result = pimpl->finish(result);

    pimpl->send_phase(p, "commit", p.targets, nullptr);

    LOG_INF("consensus: proposal %s committed at term %llu (%d/%zu)\n",
            p.proposal_id.c_str(), static_cast<unsigned long long>(p.term),
            result.acceptances, p.targets.size());
    return result;
}

std::optional<consensus_result> consensus_coordinator::get_result(const std::string & proposal_id) const {
    std::lock_guard<std::mutex> lock(pimpl->results_mutex);

    auto it = pimpl->results.find(proposal_id);
    if (it == pimpl->results.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<consensus_result> consensus_coordinator::results() const {
    std::lock_guard<std::mutex> lock(pimpl->results_mutex);

    std::vector<consensus_result> all;
    for (const auto & [id, result] : pimpl->results) {
        all.push_back(result);
    }
    std::sort(all.begin(), all.end(), [](const consensus_result & a, const consensus_result & b) {
        return a.term < b.term;
    });
    return all;
}

const std::string & consensus_coordinator::address() const {
    return pimpl->address;
}

uint64_t consensus_coordinator::current_term() const {
    return pimpl->term;
}

// consensus_participant
consensus_participant::consensus_participant(const std::string & agent_id) : agent_id(agent_id) {}

void consensus_participant::set_vote_policy(vote_policy policy) {
    std::lock_guard<std::mutex> lock(mutex);
    this->policy = policy;
}

bool consensus_participant::is_consensus_message(const agent_message & msg) {
    if (msg.type != MESSAGE_TYPE_COORDINATION) {
        return false;
    }
    json payload = msg.payload_json();
    return payload.is_object() && payload.contains("consensus");
}

std::optional<agent_message> consensus_participant::handle(const agent_message & msg) {
    json payload = msg.payload_json();
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }

    std::string phase = payload.value("consensus", "");
    std::string proposal_id = payload.value("proposal_id", "");
    uint64_t term = payload.value("term", static_cast<uint64_t>(0));
    std::string reply_to = payload.value("reply_to", msg.from_agent);
    json value = payload.value("value", json());

    std::lock_guard<std::mutex> lock(mutex);

    std::string reply_phase;
    bool vote = false;

    if (phase == "prepare") {
        reply_phase = "promise";
        if (term > promised && (!policy || policy(value))) {
            promised = term;
            promised_proposal = proposal_id;
            vote = true;
        }
    } else if (phase == "accept") {
        reply_phase = "accepted";
        vote = term == promised && proposal_id == promised_proposal;
    } else if (phase == "commit") {
        if (term >= promised) {
            commits.push_back(value);
        }
        return std::nullopt;
    } else {
        return std::nullopt;
    }

    json reply = {
        {"consensus", reply_phase},
        {"proposal_id", proposal_id},
        {"term", term},
        {"vote", vote}
    };
    agent_message out = agent_message::make(MESSAGE_TYPE_COORDINATION, agent_id, reply_to, reply);
    out.correlation_id = msg.message_id;
    return out;
}

uint64_t consensus_participant::promised_term() const {
    std::lock_guard<std::mutex> lock(mutex);
    return promised;
}

std::vector<json> consensus_participant::committed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return commits;
}

} // namespace coord
