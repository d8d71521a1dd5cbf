#pragma once

#include "bus.h"
#include "failure.h"
#include "message.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coord {

enum consensus_status {
    CONSENSUS_ACCEPTED,
    CONSENSUS_REJECTED,
    CONSENSUS_CANCELLED
};

const char * consensus_status_to_string(consensus_status status);

struct consensus_proposal {
    std::string proposal_id;
    uint64_t term = 0;
    json value;
    std::vector<std::string> targets;

    json to_json() const;
};

struct consensus_result {
    std::string proposal_id;
    uint64_t term = 0;
    consensus_status status = CONSENSUS_REJECTED;
    std::string reason;
    int promises = 0;
    int acceptances = 0;
    int quorum = 0;
    json value;           // Committed value when accepted
    int64_t decided_at = 0;

    bool accepted() const { return status == CONSENSUS_ACCEPTED; }

    json to_json() const;
};

// floor(n/2)+1
int quorum_size(size_t n);

//
// Coordinator side of the prepare / accept / commit protocol.
//
// Votes come back to the coordinator's own mailbox, "<id>/consensus". One
// round runs at a time; terms only grow. Votes carrying another proposal
// id or term, votes from agents outside the round and repeated votes are
// ignored. Results are recorded once and never change.
//

class consensus_coordinator {
public:
    consensus_coordinator(message_bus & bus,
                          resilience_guard & guard,
                          const std::string & coordinator_id,
                          int64_t phase_timeout_ms = 2000,
                          const retry_policy & policy = retry_policy::default_policy());
    ~consensus_coordinator();

    consensus_coordinator(const consensus_coordinator &) = delete;
    consensus_coordinator & operator=(const consensus_coordinator &) = delete;

    consensus_result propose(const std::vector<std::string> & agent_ids,
                             const json & value,
                             const cancel_token * cancel = nullptr);

    std::optional<consensus_result> get_result(const std::string & proposal_id) const;

    std::vector<consensus_result> results() const;

    const std::string & address() const;

    uint64_t current_term() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

//
// Agent side: promise only above any promised term, accept only the
// promised term, remember commits.
//

class consensus_participant {
public:
    // Return false to vote against a value
    using vote_policy = std::function<bool(const json & value)>;

    explicit consensus_participant(const std::string & agent_id);

    void set_vote_policy(vote_policy policy);

    // Handle a coordination message; the reply, if any, is addressed to the
    // round's coordinator
    std::optional<agent_message> handle(const agent_message & msg);

    // True for prepare / accept / commit payloads
    static bool is_consensus_message(const agent_message & msg);

    uint64_t promised_term() const;

    std::vector<json> committed() const;

private:
    std::string agent_id;
    uint64_t promised = 0;
    std::string promised_proposal;
    std::vector<json> commits;
    vote_policy policy;
    mutable std::mutex mutex;
};

} // namespace coord
