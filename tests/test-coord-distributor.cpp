// Tests for the task distributor

#include "coord/distributor.h"
#include "log.h"
#include "testing.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <set>

using namespace coord;

static agent_instance make_agent(const std::string & id,
                                 std::vector<agent_capability> caps,
                                 int capacity = 1,
                                 double load = 0.0) {
    agent_instance agent;
    agent.id = id;
    agent.capabilities = std::move(caps);
    agent.capacity = capacity;
    agent.load = load;
    return agent;
}

static task_unit make_unit(const std::string & id, std::vector<std::string> caps) {
    task_unit unit;
    unit.id = id;
    unit.plan_id = "plan-1";
    unit.capabilities = std::move(caps);
    unit.estimated_duration_ms = 1000;
    return unit;
}

static registry_snapshot make_snapshot(std::vector<agent_instance> agents) {
    registry_snapshot snap;
    snap.version = 1;
    snap.agents = std::move(agents);
    std::sort(snap.agents.begin(), snap.agents.end(),
              [](const agent_instance & a, const agent_instance & b) { return a.id < b.id; });
    return snap;
}

static bool test_hungarian_small() {
    std::vector<std::vector<double>> cost = {
        {4, 1, 3},
        {2, 0, 5},
        {3, 2, 2},
    };
    auto cols = hungarian_solve(cost);
    TEST_ASSERT(cols.size() == 3, "one column per row");
    TEST_ASSERT(cols[0] == 1 && cols[1] == 0 && cols[2] == 2, "minimum total cost");
    TEST_ASSERT(hungarian_solve({}).empty(), "empty matrix");
    return true;
}

static bool test_cost_model() {
    task_distributor distributor(100.0);
    task_unit unit = make_unit("u", {"file-write", "validate"});

    auto both = make_agent("a", {{"file-write", 0.9}, {"validate", 0.5}});
    auto cost = distributor.assignment_cost(unit, both);
    TEST_ASSERT(cost.has_value(), "capable agent feasible");
    TEST_ASSERT(std::abs(*cost - 2.0) < 1e-9, "weakest capability decides the match");

    auto half_loaded = both;
    half_loaded.load = 0.5;
    TEST_ASSERT(std::abs(*distributor.assignment_cost(unit, half_loaded) - 4.0) < 1e-9, "load raises the cost");

    auto lagging = both;
    lagging.missed_heartbeats = 1;
    TEST_ASSERT(std::abs(*distributor.assignment_cost(unit, lagging) - 4.0) < 1e-9, "missed heartbeats raise the cost");

    auto writer_only = make_agent("w", {{"file-write", 0.9}});
    TEST_ASSERT(!distributor.assignment_cost(unit, writer_only), "missing capability infeasible");

    auto saturated = both;
    saturated.load = 1.0;
    TEST_ASSERT(!distributor.assignment_cost(unit, saturated), "fully loaded agent infeasible");

    task_distributor strict(1.5);
    TEST_ASSERT(!strict.assignment_cost(unit, both), "cost above the ceiling infeasible");
    return true;
}

// Three parallel writes and a validation over two writers and one validator
static bool test_migrate_scenario() {
    task_distributor distributor;
    auto snap = make_snapshot({
        make_agent("writer-1", {{"file-write", 0.9}}),
        make_agent("writer-2", {{"file-write", 0.8}}),
        make_agent("validator", {{"validate", 0.95}}),
    });

    std::vector<task_unit> writes = {
        make_unit("write-1", {"file-write"}),
        make_unit("write-2", {"file-write"}),
        make_unit("write-3", {"file-write"}),
    };

    auto round1 = distributor.distribute(writes, snap);
    TEST_ASSERT(round1.assignments.size() == 2, "two writers busy");
    TEST_ASSERT(round1.queued.size() == 1 && round1.queued[0] == "write-3", "last write waits");
    std::set<std::string> agents;
    for (const auto & a : round1.assignments) {
        TEST_ASSERT(a.agent_id == "writer-1" || a.agent_id == "writer-2", "writes go to writers");
        TEST_ASSERT(a.plan_id == "plan-1", "plan id carried");
        agents.insert(a.agent_id);
    }
    TEST_ASSERT(agents.size() == 2, "one unit per writer");
    TEST_ASSERT(distributor.queued() == std::vector<std::string>{"write-3"}, "queue remembered");

    auto again = distributor.distribute(writes, snap);
    TEST_ASSERT(again.assignments.empty(), "running units not assigned twice");

    std::string freed = distributor.get_assignment("write-1")->agent_id;
    TEST_ASSERT(distributor.complete("write-1"), "first write done");
    TEST_ASSERT(!distributor.complete("write-1"), "completion only once");

    auto round2 = distributor.distribute({writes[2]}, snap);
    TEST_ASSERT(round2.assignments.size() == 1, "queued write picked up");
    TEST_ASSERT(round2.assignments[0].task_id == "write-3", "the waiting unit");
    TEST_ASSERT(round2.assignments[0].agent_id == freed, "on the freed writer");
    TEST_ASSERT(distributor.queued().empty(), "queue drained");

    auto round3 = distributor.distribute({make_unit("validate", {"validate"})}, snap);
    TEST_ASSERT(round3.assignments.size() == 1 && round3.assignments[0].agent_id == "validator", "validation to validator");
    return true;
}

// A greedy pass would give the only x-capable slot away to the wrong unit
static bool test_global_optimum() {
    task_distributor distributor;
    auto snap = make_snapshot({
        make_agent("p", {{"x", 0.9}, {"y", 0.9}}),
        make_agent("q", {{"x", 0.5}}),
    });

    auto result = distributor.distribute({make_unit("a", {"x"}), make_unit("b", {"y"})}, snap);
    TEST_ASSERT(result.assignments.size() == 2, "both units placed");
    TEST_ASSERT(distributor.get_assignment("a")->agent_id == "q", "a yields the versatile agent");
    TEST_ASSERT(distributor.get_assignment("b")->agent_id == "p", "b gets the only y agent");
    return true;
}

static bool test_capacity_and_status() {
    task_distributor distributor;
    auto wide = make_agent("wide", {{"general", 1.0}}, 3);
    auto busy = make_agent("busy", {{"general", 1.0}});
    busy.status = AGENT_STATUS_BUSY;
    auto draining = make_agent("draining", {{"general", 1.0}});
    draining.status = AGENT_STATUS_DRAINING;
    auto snap = make_snapshot({wide, busy, draining});

    std::vector<task_unit> units;
    for (int i = 0; i < 5; i++) {
        units.push_back(make_unit("u" + std::to_string(i), {"general"}));
    }

    auto result = distributor.distribute(units, snap);
    TEST_ASSERT(result.assignments.size() == 3, "capacity of the only available agent");
    TEST_ASSERT(distributor.active_count("wide") == 3, "three slots in use");
    TEST_ASSERT(distributor.active_count("busy") == 0, "busy agent skipped");
    TEST_ASSERT(distributor.active_count("draining") == 0, "draining agent skipped");
    TEST_ASSERT(result.queued.size() == 2, "rest queued");
    return true;
}

static bool test_release_and_clear() {
    task_distributor distributor;
    auto snap = make_snapshot({
        make_agent("a", {{"general", 1.0}}, 2),
        make_agent("b", {{"general", 0.5}}, 2),
    });

    std::vector<task_unit> units;
    for (int i = 0; i < 4; i++) {
        units.push_back(make_unit("u" + std::to_string(i), {"general"}));
    }
    distributor.distribute(units, snap);
    TEST_ASSERT(distributor.active_assignments().size() == 4, "all placed");

    auto requeued = distributor.release_agent("a");
    TEST_ASSERT(requeued.size() == 2, "a had two units");
    TEST_ASSERT(distributor.active_count("a") == 0, "a holds nothing");
    for (const auto & id : requeued) {
        TEST_ASSERT(!distributor.is_assigned(id), "released unit unassigned");
    }
    TEST_ASSERT(distributor.queued().size() == 2, "released units queued");
    TEST_ASSERT(distributor.release_agent("a").empty(), "nothing more to release");

    distributor.clear_plan("plan-1");
    TEST_ASSERT(distributor.queued().empty(), "queue cleared");
    TEST_ASSERT(distributor.active_assignments().empty(), "assignments cleared");
    return true;
}

static bool test_no_capable_agent() {
    task_distributor distributor;
    auto snap = make_snapshot({make_agent("a", {{"general", 1.0}})});

    auto result = distributor.distribute({make_unit("deploy", {"deploy"})}, snap);
    TEST_ASSERT(result.assignments.empty(), "nothing placed");
    TEST_ASSERT(result.queued.size() == 1, "unit queued");
    TEST_ASSERT(distributor.active_count("a") == 0, "agent untouched");
    return true;
}

static bool test_randomized_invariants() {
    std::mt19937 rng(1234);
    const std::vector<std::string> tags = {"file-write", "validate", "analyze", "deploy"};

    for (int round = 0; round < 50; round++) {
        std::uniform_int_distribution<int> agent_count(1, 6);
        std::uniform_int_distribution<int> unit_count(1, 10);
        std::uniform_int_distribution<int> capacity(1, 3);
        std::uniform_real_distribution<double> conf(0.0, 1.0);

        std::vector<agent_instance> agents;
        int n_agents = agent_count(rng);
        for (int a = 0; a < n_agents; a++) {
            std::vector<agent_capability> caps;
            for (const auto & tag : tags) {
                if (conf(rng) < 0.5) {
                    caps.push_back({tag, 0.1 + 0.9 * conf(rng)});
                }
            }
            agents.push_back(make_agent("agent-" + std::to_string(a), caps, capacity(rng), 0.8 * conf(rng)));
        }
        auto snap = make_snapshot(agents);

        std::vector<task_unit> units;
        int n_units = unit_count(rng);
        for (int u = 0; u < n_units; u++) {
            units.push_back(make_unit("unit-" + std::to_string(u), {tags[rng() % tags.size()]}));
        }

        task_distributor distributor;
        auto result = distributor.distribute(units, snap);

        TEST_ASSERT(result.assignments.size() + result.queued.size() == units.size(), "every unit accounted for");

        std::map<std::string, int> per_agent;
        std::set<std::string> assigned;
        for (const auto & a : result.assignments) {
            TEST_ASSERT(assigned.insert(a.task_id).second, "one assignment per unit");
            per_agent[a.agent_id]++;

            const agent_instance * agent = snap.find(a.agent_id);
            const task_unit * unit = nullptr;
            for (const auto & u : units) {
                if (u.id == a.task_id) {
                    unit = &u;
                }
            }
            TEST_ASSERT(agent && unit, "known agent and unit");
            TEST_ASSERT(distributor.assignment_cost(*unit, *agent).has_value(), "assignment is feasible");
        }
        for (const auto & [agent_id, count] : per_agent) {
            TEST_ASSERT(count <= snap.find(agent_id)->capacity, "capacity respected");
        }

        // A queued unit must not have a feasible agent with a spare slot
        for (const auto & id : result.queued) {
            const task_unit * unit = nullptr;
            for (const auto & u : units) {
                if (u.id == id) {
                    unit = &u;
                }
            }
            for (const auto & agent : snap.agents) {
                bool spare = per_agent[agent.id] < agent.capacity;
                TEST_ASSERT(!(spare && distributor.assignment_cost(*unit, agent)), "no idle capable slot left behind");
            }
        }
    }
    return true;
}

int main() {
    std::cout << "=== Task Distributor Tests ===" << std::endl << std::endl;
    coord_log_set_verbosity(COORD_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_hungarian_small);
    RUN_TEST(test_cost_model);
    RUN_TEST(test_migrate_scenario);
    RUN_TEST(test_global_optimum);
    RUN_TEST(test_capacity_and_status);
    RUN_TEST(test_release_and_clear);
    RUN_TEST(test_no_capable_agent);
    RUN_TEST(test_randomized_invariants);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
