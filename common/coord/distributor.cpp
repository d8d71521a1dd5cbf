#include "distributor.h"
#include "../log.h"

#include <algorithm>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <tuple>

namespace coord {

// Per-row and per-column nudges that make equal costs resolve the same way
// every time: earlier units first, then lower load, then lower agent id.
static constexpr double TIE_EPSILON = 1e-6;

std::vector<int> hungarian_solve(const std::vector<std::vector<double>> & cost) {
    const int n = static_cast<int>(cost.size());
    if (n == 0) {
        return {};
    }

    const double INF = std::numeric_limits<double>::infinity();

    // Potentials and matching, 1-based with column 0 as the virtual root
    std::vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
    std::vector<int> p(n + 1, 0), way(n + 1, 0);

    for (int i = 1; i <= n; i++) {
        p[0] = i;
        int j0 = 0;
        std::vector<double> minv(n + 1, INF);
        std::vector<char> used(n + 1, false);

        do {
            used[j0] = true;
            int i0 = p[j0];
            int j1 = 0;
            double delta = INF;

            for (int j = 1; j <= n; j++) {
                if (used[j]) {
                    continue;
                }
                double cur = cost[i0 - 1][j - 1] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            for (int j = 0; j <= n; j++) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // Augment along the alternating path
        do {
            int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<int> row_to_col(n, -1);
    for (int j = 1; j <= n; j++) {
        if (p[j] != 0) {
            row_to_col[p[j] - 1] = j - 1;
        }
    }
    return row_to_col;
}

struct task_distributor::impl {
    double feasibility_ceiling;
    std::map<std::string, task_assignment> active;   // task id -> assignment
    std::map<std::string, int> per_agent;            // agent id -> active count
    std::map<std::string, std::string> queued;       // task id -> plan id
    mutable std::mutex mutex;

    void retire(const std::string & task_id) {
        auto it = active.find(task_id);
        if (it == active.end()) {
            return;
        }
        auto count = per_agent.find(it->second.agent_id);
        if (count != per_agent.end() && --count->second <= 0) {
            per_agent.erase(count);
        }
        active.erase(it);
    }
};

task_distributor::task_distributor(double feasibility_ceiling) : pimpl(std::make_unique<impl>()) {
    pimpl->feasibility_ceiling = feasibility_ceiling;
}

task_distributor::~task_distributor() = default;

std::optional<double> task_distributor::assignment_cost(const task_unit & unit, const agent_instance & agent) const {
    double match = 1.0;
    for (const auto & tag : unit.capabilities) {
        match = std::min(match, agent.confidence_for(tag));
    }
    if (match <= 0.0) {
        return std::nullopt;
    }

    double headroom = 1.0 - agent.load;
    if (headroom <= 0.0) {
        return std::nullopt;
    }

    double availability = 1.0 / (1.0 + agent.missed_heartbeats);
    double cost = 1.0 / (match * headroom * availability);
    if (cost > pimpl->feasibility_ceiling) {
        return std::nullopt;
    }
    return cost;
}

distribution_result task_distributor::distribute(const std::vector<task_unit> & units,
                                                 const registry_snapshot & snapshot,
                                                 priority_level priority) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    distribution_result result;

    // Rows: units not already running, first occurrence of each id
    std::vector<const task_unit *> rows;
    std::set<std::string> seen;
    for (const auto & unit : units) {
        if (pimpl->active.count(unit.id) > 0 || !seen.insert(unit.id).second) {
            continue;
        }
        rows.push_back(&unit);
    }
    if (rows.empty()) {
        return result;
    }

    // Columns: one per free slot of an available agent
    struct slot {
        const agent_instance * agent;
        int index;
    };
    std::vector<slot> cols;
    for (const auto & agent : snapshot.agents) {
        if (agent.status != AGENT_STATUS_AVAILABLE) {
            continue;
        }
        auto it = pimpl->per_agent.find(agent.id);
        int used = it != pimpl->per_agent.end() ? it->second : 0;
        for (int s = used; s < agent.capacity; s++) {
            cols.push_back({&agent, s});
        }
    }

    std::sort(cols.begin(), cols.end(), [](const slot & a, const slot & b) {
        return std::make_tuple(a.agent->load, a.agent->id, a.index) <
               std::make_tuple(b.agent->load, b.agent->id, b.index);
    });

    const size_t n = std::max(rows.size(), cols.size());
    const double infeasible = std::max(1e6, pimpl->feasibility_ceiling * static_cast<double>(n) * 10.0);

    std::vector<std::vector<double>> matrix(n, std::vector<double>(n, 0.0));
    std::vector<std::vector<bool>> feasible(n, std::vector<bool>(n, false));

    for (size_t r = 0; r < rows.size(); r++) {
        for (size_t c = 0; c < cols.size(); c++) {
            auto cost = assignment_cost(*rows[r], *cols[c].agent);
            if (cost) {
                matrix[r][c] = *cost + TIE_EPSILON * static_cast<double>(r) + TIE_EPSILON * static_cast<double>(c);
                feasible[r][c] = true;
            } else {
                matrix[r][c] = infeasible;
            }
        }
    }

    std::vector<int> row_to_col = hungarian_solve(matrix);

    int64_t now = get_timestamp_ms();
    for (size_t r = 0; r < rows.size(); r++) {
        const task_unit & unit = *rows[r];
        int c = row_to_col[r];

        if (c < 0 || static_cast<size_t>(c) >= cols.size() || !feasible[r][c]) {
            pimpl->queued[unit.id] = unit.plan_id;
            result.queued.push_back(unit.id);
            continue;
        }

        task_assignment assignment;
        assignment.task_id = unit.id;
        assignment.agent_id = cols[c].agent->id;
        assignment.plan_id = unit.plan_id;
        assignment.priority = priority;
        assignment.estimated_duration_ms = unit.estimated_duration_ms;
        assignment.assigned_at = now;

        pimpl->active[unit.id] = assignment;
        pimpl->per_agent[assignment.agent_id]++;
        pimpl->queued.erase(unit.id);
        result.assignments.push_back(assignment);

        LOG_DBG("distributor: %s -> %s\n", unit.id.c_str(), assignment.agent_id.c_str());
    }

    if (!result.queued.empty()) {
        LOG_DBG("distributor: %zu unit(s) queued, %zu free slot(s)\n", result.queued.size(), cols.size());
    }

    return result;
}

bool task_distributor::complete(const std::string & task_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    if (pimpl->active.count(task_id) == 0) {
        return false;
    }
    pimpl->retire(task_id);
    return true;
}

std::vector<std::string> task_distributor::release_agent(const std::string & agent_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<std::string> requeued;
    for (const auto & [task_id, assignment] : pimpl->active) {
        if (assignment.agent_id == agent_id) {
            requeued.push_back(task_id);
        }
    }
    for (const auto & task_id : requeued) {
        pimpl->queued[task_id] = pimpl->active[task_id].plan_id;
        pimpl->retire(task_id);
    }

    if (!requeued.empty()) {
        LOG_INF("distributor: released %zu assignment(s) of %s\n", requeued.size(), agent_id.c_str());
    }
    return requeued;
}

std::vector<task_assignment> task_distributor::active_assignments() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<task_assignment> result;
    result.reserve(pimpl->active.size());
    for (const auto & [task_id, assignment] : pimpl->active) {
        result.push_back(assignment);
    }
    return result;
}

std::optional<task_assignment> task_distributor::get_assignment(const std::string & task_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->active.find(task_id);
    if (it == pimpl->active.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool task_distributor::is_assigned(const std::string & task_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->active.count(task_id) > 0;
}

int task_distributor::active_count(const std::string & agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->per_agent.find(agent_id);
    return it != pimpl->per_agent.end() ? it->second : 0;
}

std::vector<std::string> task_distributor::queued() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<std::string> result;
    for (const auto & [task_id, plan_id] : pimpl->queued) {
        result.push_back(task_id);
    }
    return result;
}

void task_distributor::clear_plan(const std::string & plan_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    for (auto it = pimpl->queued.begin(); it != pimpl->queued.end();) {
        if (it->second == plan_id) {
            it = pimpl->queued.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<std::string> stale;
    for (const auto & [task_id, assignment] : pimpl->active) {
        if (assignment.plan_id == plan_id) {
            stale.push_back(task_id);
        }
    }
    for (const auto & task_id : stale) {
        pimpl->retire(task_id);
    }
}

} // namespace coord
