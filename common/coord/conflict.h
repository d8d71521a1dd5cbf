#pragma once

#include "consensus.h"
#include "plan.h"
#include "store.h"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace coord {

//
// Conflict resolver.
//
//   low    -> last writer wins (newest timestamp, ties to the lowest agent id)
//   medium -> merge: fields only one side reports or all sides agree on are
//             kept, the overlapping disagreeing fields are escalated
//   high   -> consensus over the candidate values, newest first
//
// Every conflict id is resolved once; asking again returns the recorded
// resolution.
//

class conflict_resolver {
public:
    explicit conflict_resolver(knowledge_store * store = nullptr,
                               consensus_coordinator * consensus = nullptr);
    ~conflict_resolver();

    conflict_resolver(const conflict_resolver &) = delete;
    conflict_resolver & operator=(const conflict_resolver &) = delete;

    void set_consensus(consensus_coordinator * consensus);

    // Domains whose disagreements always go to consensus
    void set_critical_domains(const std::set<std::string> & domains);

    conflict_severity classify(const std::string & domain,
                               const std::vector<conflicting_value> & values) const;

    // Build a conflict with a fresh id and a classified severity
    conflict make_conflict(const std::string & domain, const std::vector<conflicting_value> & values) const;

    // voters defaults to the agents that reported the values
    resolution resolve(const conflict & c,
                       const std::vector<std::string> & voters = {},
                       const cancel_token * cancel = nullptr);

    std::optional<resolution> get_resolution(const std::string & conflict_id) const;

    // Append-only, oldest first
    std::vector<resolution> get_log() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
