#pragma once

#include "plan.h"
#include "registry.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coord {

// Solve a square min-cost assignment; returns the column for every row
std::vector<int> hungarian_solve(const std::vector<std::vector<double>> & cost);

struct distribution_result {
    std::vector<task_assignment> assignments;
    std::vector<std::string> queued;  // Units with no feasible slot this round
};

//
// Task distributor. Sole owner of the assignment table: at most one active
// assignment per unit, and no agent above its declared capacity.
//
// Rows of the cost matrix are units, columns are free agent slots. A slot's
// cost for a unit is 1 / (match * (1 - load) * availability) where match is
// the agent's lowest confidence over the unit's required tags.
//

class task_distributor {
public:
    explicit task_distributor(double feasibility_ceiling = 100.0);
    ~task_distributor();

    task_distributor(const task_distributor &) = delete;
    task_distributor & operator=(const task_distributor &) = delete;

    // Assign what can be assigned; units already assigned are skipped
    distribution_result distribute(const std::vector<task_unit> & units,
                                   const registry_snapshot & snapshot,
                                   priority_level priority = PRIORITY_NORMAL);

    // Cost of running unit on agent, nullopt when infeasible
    std::optional<double> assignment_cost(const task_unit & unit, const agent_instance & agent) const;

    // Retire the active assignment of a finished unit
    bool complete(const std::string & task_id);

    // Drop every assignment of an agent; returns the task ids to run again
    std::vector<std::string> release_agent(const std::string & agent_id);

    std::vector<task_assignment> active_assignments() const;
    std::optional<task_assignment> get_assignment(const std::string & task_id) const;
    bool is_assigned(const std::string & task_id) const;
    int active_count(const std::string & agent_id) const;

    // Units left over from the most recent rounds and not assigned since
    std::vector<std::string> queued() const;

    // Forget queued ids of a plan (finished or cancelled)
    void clear_plan(const std::string & plan_id);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace coord
