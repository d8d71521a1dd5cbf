#pragma once

#include "plan.h"
#include "registry.h"
#include "store.h"
#include "strategy.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coord {

// Runs one workflow pattern. Implementations must return soon after the
// token is cancelled.
class pattern_executor {
public:
    virtual ~pattern_executor() = default;

    virtual execution_outcome execute_pattern(const std::string & pattern_id,
                                              const json & context,
                                              const cancel_token & cancel) = 0;
};

// Append-only decision history
class decision_log {
public:
    void append(const decision & d);

    std::vector<decision> entries() const;
    std::vector<decision> for_task(const std::string & task_id) const;
    std::optional<decision> last() const;
    size_t size() const;

    json to_json() const;

private:
    std::vector<decision> log;
    mutable std::mutex mutex;
};

struct engine_outcome {
    decision_terminal terminal = TERMINAL_NONE;
    error_type error = ERROR_TYPE_NONE;
    std::string message;
    std::string action;                  // "<kind>/<variant>" of the last attempt
    execution_outcome last;
    int attempts = 0;
    int backtracks = 0;
    std::vector<decision> decisions;     // This run only, in append order

    bool succeeded() const { return terminal == TERMINAL_COMPLETED; }

    json to_json() const;
};

//
// Sequential decision engine: drives one task unit on one agent.
//
// A strategic decision picks the action kind, a tactical one picks a variant
// of it. Candidates are scored as success probability x cost efficiency x
// deadline fit. A failed attempt backtracks to the nearest decision with an
// untried alternative (the variant first, then the kind), re-scoring what is
// left with the refreshed history. The run ends with exactly one terminal
// decision.
//

class sequential_decision_engine {
public:
    sequential_decision_engine(const strategy_catalog & catalog,
                               pattern_executor & executor,
                               knowledge_store * store = nullptr,
                               int64_t task_timeout_ms = 30000);

    engine_outcome run(const task_unit & task,
                       const std::vector<agent_capability> & capabilities,
                       const cancel_token & cancel,
                       int64_t deadline_ms = 0);

    const decision_log & log() const { return history; }

    // Score of one variant for a task; exposed for tuning and tests
    double score_variant(const action_variant & variant,
                         action_kind kind,
                         const task_unit & task,
                         double match,
                         const std::vector<historical_pattern> & patterns,
                         int64_t deadline_ms) const;

private:
    const strategy_catalog & catalog;
    pattern_executor & executor;
    knowledge_store * store;
    int64_t task_timeout_ms;
    decision_log history;
};

} // namespace coord
