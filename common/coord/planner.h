#pragma once

#include "plan.h"
#include "registry.h"
#include "store.h"
#include "strategy.h"

#include <set>
#include <string>
#include <vector>

namespace coord {

enum planning_error {
    PLANNING_OK,
    PLANNING_INVALID,     // Malformed objective, never retried
    PLANNING_INFEASIBLE   // No decomposition meets the mandatory constraints
};

const char * planning_error_to_string(planning_error err);

struct planning_result {
    planning_error error = PLANNING_OK;
    std::string message;
    std::vector<std::string> violations;  // Mandatory constraints not met
    task_plan plan;

    bool ok() const { return error == PLANNING_OK; }

    json to_json() const;
};

//
// Decision planner: objective -> dependency-aware task plan.
//
// The complexity class picks a phase template from the catalog; the fan-out
// phase is split into one unit per quantity named in the description, and
// each sub-objective is planned recursively and hung off the fan-out phase.
// Candidates are tried from the classified class down to the simplest one,
// first with and then without fan-out; the first one meeting every mandatory
// constraint is returned.
//

class decision_planner {
public:
    decision_planner(const strategy_catalog & catalog,
                     knowledge_store * store = nullptr,
                     double risk_threshold = 0.6);

    planning_result plan(const objective & obj, const registry_snapshot & snapshot);

    // Plan for the unfinished part of a plan; the result replaces previous
    planning_result replan(const task_plan & previous,
                           const std::set<std::string> & completed,
                           const std::set<std::string> & failed,
                           const registry_snapshot & snapshot);

    bool validate(const objective & obj, std::string * error = nullptr) const;

    double complexity_score(const objective & obj) const;
    complexity_class classify(const objective & obj) const;

private:
    const strategy_catalog & catalog;
    knowledge_store * store;
    double risk_threshold;

    struct subtree {
        std::vector<std::string> entries;
        std::vector<std::string> exits;
    };

    subtree expand(const objective & obj,
                   complexity_class cls,
                   bool fan_out,
                   task_plan & plan,
                   int & counter,
                   std::map<std::string, int64_t> & duration_cache);

    std::vector<std::string> check_constraints(const objective & obj,
                                               const task_plan & plan,
                                               const registry_snapshot & snapshot,
                                               bool mandatory) const;

    void assess_risk(task_plan & plan,
                     double complexity,
                     double violation_ratio,
                     int soft_violations,
                     const registry_snapshot & snapshot) const;

    // Fallback for every unit riskier than the threshold
    void build_contingencies(task_plan & plan) const;

    int64_t estimate_duration(const std::string & phase,
                              const std::string & capability,
                              std::map<std::string, int64_t> & cache);
};

// Numbers written in a description, in order of appearance
std::vector<int> extract_quantities(const std::string & text);

} // namespace coord
