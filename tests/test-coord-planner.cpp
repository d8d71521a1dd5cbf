// Tests for objective decomposition and replanning

#include "coord/planner.h"
#include "log.h"
#include "testing.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <set>

using namespace coord;

static registry_snapshot migrate_agents() {
    agent_registry registry;
    auto add = [&registry](const std::string & id, std::vector<agent_capability> caps) {
        agent_instance agent;
        agent.id = id;
        agent.capabilities = std::move(caps);
        registry.register_agent(agent);
    };
    add("writer-1", {{"file-write", 0.9}});
    add("writer-2", {{"file-write", 0.8}});
    add("validator", {{"validate", 0.95}});
    return registry.snapshot();
}

static objective make_objective(const std::string & description) {
    objective obj;
    obj.description = description;
    return obj;
}

static std::vector<const task_unit *> units_in_phase(const task_plan & plan, const std::string & phase) {
    std::vector<const task_unit *> result;
    for (const auto & unit : plan.units) {
        if (unit.phase == phase) {
            result.push_back(&unit);
        }
    }
    return result;
}

static bool test_extract_quantities() {
    auto q = extract_quantities("migrate 3 files to v2 in 10 steps");
    TEST_ASSERT(q.size() == 2 && q[0] == 3 && q[1] == 10, "standalone numbers only");
    TEST_ASSERT(extract_quantities("utf8 cleanup").empty(), "digits glued to letters ignored");
    TEST_ASSERT(extract_quantities("").empty(), "empty text");
    return true;
}

static bool test_classify() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);

    TEST_ASSERT(planner.classify(make_objective("list files")) == COMPLEXITY_SIMPLE, "plain request");
    TEST_ASSERT(planner.classify(make_objective("migrate 3 files with validation")) == COMPLEXITY_MODERATE,
                "migration with validation");

    objective big = make_objective("coordinate a distributed secure deployment, refactor and optimize the 4 services");
    big.sub_objectives.push_back(make_objective("analyze service 1"));
    big.sub_objectives.push_back(make_objective("analyze service 2"));
    TEST_ASSERT(planner.classify(big) == COMPLEXITY_VERY_COMPLEX, "many signals");

    objective plain = make_objective("list files");
    double before = planner.complexity_score(plain);
    plain.constraints.push_back({CONSTRAINT_CUSTOM, "be quiet", 0.0, false});
    TEST_ASSERT(planner.complexity_score(plain) > before, "constraints add complexity");
    return true;
}

static bool test_migrate_plan() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);

    planning_result result = planner.plan(make_objective("migrate 3 files with validation"), migrate_agents());
    TEST_ASSERT(result.ok(), "planned");

    const task_plan & plan = result.plan;
    TEST_ASSERT(!plan.id.empty() && !plan.objective_id.empty(), "ids assigned");
    TEST_ASSERT(plan.complexity == COMPLEXITY_MODERATE, "moderate template");
    TEST_ASSERT(plan.units.size() == 4, "three writes and one validation");
    TEST_ASSERT(plan.is_acyclic(), "acyclic");

    auto writes = units_in_phase(plan, "execute");
    auto checks = units_in_phase(plan, "validate");
    TEST_ASSERT(writes.size() == 3 && checks.size() == 1, "phases");
    for (const auto * w : writes) {
        TEST_ASSERT(w->capabilities == std::vector<std::string>{"file-write"}, "writes need file-write");
        TEST_ASSERT(w->plan_id == plan.id, "unit carries plan id");
        TEST_ASSERT(plan.predecessors(w->id).empty(), "writes start immediately");
    }
    TEST_ASSERT(checks[0]->capabilities == std::vector<std::string>{"validate"}, "validation needs validate");

    auto preds = plan.predecessors(checks[0]->id);
    TEST_ASSERT(preds.size() == 3, "validation waits for every write");

    auto order = plan.topological_order();
    TEST_ASSERT(order.size() == 4 && order.back() == checks[0]->id, "validation last");
    TEST_ASSERT(plan.estimated_duration_ms == 4500, "critical path write then validate");
    TEST_ASSERT(plan.risk.overall > 0.0 && plan.risk.overall < 1.0, "risk assessed");
    TEST_ASSERT(plan.risk.unit_risk.size() == 4, "risk per unit");
    return true;
}

static bool test_invalid_objectives() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);
    auto snap = migrate_agents();

    planning_result r = planner.plan(make_objective("   "), snap);
    TEST_ASSERT(r.error == PLANNING_INVALID, "blank description");

    objective negative = make_objective("copy files");
    negative.constraints.push_back({CONSTRAINT_MAX_TASKS, "", -1.0, true});
    TEST_ASSERT(planner.plan(negative, snap).error == PLANNING_INVALID, "non-positive limit");

    objective nameless = make_objective("copy files");
    nameless.constraints.push_back({CONSTRAINT_REQUIRED_CAPABILITY, "", 0.0, true});
    TEST_ASSERT(planner.plan(nameless, snap).error == PLANNING_INVALID, "capability constraint without a tag");

    objective dup = make_objective("copy files");
    dup.id = "same";
    objective child = make_objective("validate copies");
    child.id = "same";
    dup.sub_objectives.push_back(child);
    r = planner.plan(dup, snap);
    TEST_ASSERT(r.error == PLANNING_INVALID, "duplicate ids");
    TEST_ASSERT(r.message.find("same") != std::string::npos, "message names the id");

    objective bad_child = make_objective("copy files");
    bad_child.sub_objectives.push_back(make_objective(""));
    TEST_ASSERT(planner.plan(bad_child, snap).error == PLANNING_INVALID, "nested objective checked");
    return true;
}

static bool test_infeasible_objectives() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);
    auto snap = migrate_agents();

    objective needs_deploy = make_objective("migrate 3 files");
    needs_deploy.constraints.push_back({CONSTRAINT_REQUIRED_CAPABILITY, "deploy", 0.0, true});
    planning_result r = planner.plan(needs_deploy, snap);
    TEST_ASSERT(r.error == PLANNING_INFEASIBLE, "missing capability");
    TEST_ASSERT(!r.violations.empty(), "violation listed");

    objective soft_deploy = needs_deploy;
    soft_deploy.constraints[0].mandatory = false;
    r = planner.plan(soft_deploy, snap);
    TEST_ASSERT(r.ok(), "soft constraints do not block");
    TEST_ASSERT(r.plan.risk.constraint_violations == 1, "soft violation counted in risk");

    objective self_excluding = make_objective("migrate 3 files");
    self_excluding.constraints.push_back({CONSTRAINT_EXCLUDED_CAPABILITY, "file-write", 0.0, true});
    TEST_ASSERT(planner.plan(self_excluding, snap).error == PLANNING_INFEASIBLE, "objective excludes its own capability");

    objective too_fast = make_objective("migrate 3 files");
    too_fast.constraints.push_back({CONSTRAINT_MAX_DURATION, "", 1000.0, true});
    TEST_ASSERT(planner.plan(too_fast, snap).error == PLANNING_INFEASIBLE, "no decomposition is fast enough");

    objective overdue = make_objective("migrate 3 files");
    overdue.deadline = get_timestamp_ms() - 1000;
    TEST_ASSERT(planner.plan(overdue, snap).error == PLANNING_INFEASIBLE, "deadline already passed");
    return true;
}

static bool test_fallback_to_smaller_plan() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);
    auto snap = migrate_agents();

    objective capped = make_objective("migrate 3 files with validation");
    capped.constraints.push_back({CONSTRAINT_MAX_TASKS, "", 2.0, true});
    planning_result r = planner.plan(capped, snap);
    TEST_ASSERT(r.ok(), "planned within the cap");
    TEST_ASSERT(r.plan.units.size() == 2, "fan-out dropped");
    TEST_ASSERT(r.plan.complexity == COMPLEXITY_MODERATE, "same template");

    capped.constraints[0].number = 1.0;
    r = planner.plan(capped, snap);
    TEST_ASSERT(r.ok(), "planned within the tighter cap");
    TEST_ASSERT(r.plan.units.size() == 1, "single unit");
    TEST_ASSERT(r.plan.complexity == COMPLEXITY_SIMPLE, "simpler template");
    return true;
}

static bool test_sub_objectives() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);

    objective parent = make_objective("copy 2 archives");
    parent.sub_objectives.push_back(make_objective("check archive integrity"));
    parent.sub_objectives.push_back(make_objective("analyze archive contents"));

    registry_snapshot snap = migrate_agents();
    planning_result r = planner.plan(parent, snap);
    TEST_ASSERT(r.ok(), "planned");
    TEST_ASSERT(r.plan.is_acyclic(), "acyclic");

    auto fan = units_in_phase(r.plan, "execute");
    std::set<std::string> parent_fan;
    for (const auto * unit : fan) {
        if (unit->description.find("copy 2 archives") != std::string::npos) {
            parent_fan.insert(unit->id);
        }
    }
    TEST_ASSERT(parent_fan.size() == 2, "parent fans out");

    int child_units = 0;
    for (const auto & unit : r.plan.units) {
        if (unit.description.find("archive integrity") != std::string::npos ||
            unit.description.find("archive contents") != std::string::npos) {
            child_units++;
            auto preds = r.plan.predecessors(unit.id);
            TEST_ASSERT(std::set<std::string>(preds.begin(), preds.end()) == parent_fan,
                        "sub-objective units hang off the fan-out");
        }
    }
    TEST_ASSERT(child_units == 2, "sub-objectives planned");

    auto checks = units_in_phase(r.plan, "validate");
    TEST_ASSERT(checks.size() == 1, "one validation");
    TEST_ASSERT(r.plan.predecessors(checks[0]->id).size() == 4, "validation joins fan-out and sub-objectives");

    std::set<std::string> ids;
    for (const auto & unit : r.plan.units) {
        TEST_ASSERT(ids.insert(unit.id).second, "unit ids unique");
    }
    for (const auto & e : r.plan.edges) {
        TEST_ASSERT(ids.count(e.from) && ids.count(e.to), "edges reference units");
    }
    return true;
}

static bool test_contingencies() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog, nullptr, 0.3);

    // Nobody registered: every capability is scarce
    planning_result r = planner.plan(make_objective("migrate 3 files with validation"), registry_snapshot());
    TEST_ASSERT(r.ok(), "planned");
    TEST_ASSERT(r.plan.contingencies.size() == r.plan.units.size(), "fallback for every risky unit");

    for (const auto & cp : r.plan.contingencies) {
        const task_unit * unit = r.plan.find_unit(cp.task_id);
        TEST_ASSERT(unit != nullptr, "contingency names a unit");
        TEST_ASSERT(cp.trigger == TRIGGER_FAILURE, "triggered by failure");
        TEST_ASSERT(cp.fallback.id == unit->id, "fallback keeps the unit id");
        TEST_ASSERT(cp.fallback.estimated_duration_ms == unit->estimated_duration_ms * 3 / 2, "fallback is slower");
        TEST_ASSERT(std::abs(cp.fallback.risk - unit->risk / 2.0) < 1e-9, "fallback is safer");
    }

    decision_planner relaxed(catalog, nullptr, 0.99);
    r = relaxed.plan(make_objective("migrate 3 files with validation"), migrate_agents());
    TEST_ASSERT(r.ok() && r.plan.contingencies.empty(), "no fallbacks under a high threshold");
    return true;
}

static bool test_history_shapes_estimates() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    memory_knowledge_store store;

    for (int i = 0; i < 4; i++) {
        decision d;
        d.id = "d" + std::to_string(i);
        d.task_id = "t" + std::to_string(i);
        d.context = "file-write";
        d.action = "parallel/fan-out";
        execution_outcome outcome;
        outcome.success = true;
        outcome.duration_ms = 1000;
        TEST_ASSERT(store.save_decision_outcome(d, outcome), "history saved");
    }

    decision_planner planner(catalog, &store);
    planning_result r = planner.plan(make_objective("migrate 3 files with validation"), migrate_agents());
    TEST_ASSERT(r.ok(), "planned");
    for (const auto * w : units_in_phase(r.plan, "execute")) {
        TEST_ASSERT(w->estimated_duration_ms == 2000, "observed durations pull the estimate");
    }
    for (const auto * v : units_in_phase(r.plan, "validate")) {
        TEST_ASSERT(v->estimated_duration_ms == 1500, "no history keeps the catalog estimate");
    }

    store.set_available(false);
    r = planner.plan(make_objective("migrate 3 files with validation"), migrate_agents());
    TEST_ASSERT(r.ok(), "a dead store does not stop planning");
    TEST_ASSERT(r.plan.estimated_duration_ms == 4500, "catalog estimates used");
    return true;
}

static bool test_store_round_trip() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    memory_knowledge_store store;
    decision_planner planner(catalog, &store, 0.1);

    planning_result r = planner.plan(make_objective("migrate 3 files with validation"), migrate_agents());
    TEST_ASSERT(r.ok(), "planned");
    TEST_ASSERT(store.save_plan(r.plan), "saved");

    auto loaded = store.load_plan(r.plan.id);
    TEST_ASSERT(loaded.has_value(), "loaded");
    TEST_ASSERT(loaded->units.size() == r.plan.units.size(), "units");
    TEST_ASSERT(loaded->edges == r.plan.edges, "edges");
    TEST_ASSERT(loaded->contingencies.size() == r.plan.contingencies.size(), "contingencies");
    TEST_ASSERT(loaded->estimated_duration_ms == r.plan.estimated_duration_ms, "estimate");
    TEST_ASSERT(loaded->topological_order() == r.plan.topological_order(), "same order");
    TEST_ASSERT(!store.load_plan("missing").has_value(), "unknown plan");
    return true;
}

static bool test_replan() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);
    auto snap = migrate_agents();

    planning_result first = planner.plan(make_objective("migrate 3 files with validation"), snap);
    TEST_ASSERT(first.ok(), "planned");
    auto writes = units_in_phase(first.plan, "execute");
    std::string done = writes[0]->id;
    std::string broken = writes[1]->id;

    planning_result next = planner.replan(first.plan, {done}, {broken}, snap);
    TEST_ASSERT(next.ok(), "replanned");
    const task_plan & plan = next.plan;
    TEST_ASSERT(plan.id != first.plan.id, "new plan id");
    TEST_ASSERT(plan.replaces_plan_id == first.plan.id, "links the old plan");
    TEST_ASSERT(plan.units.size() == 3, "completed unit dropped");
    for (const auto & unit : plan.units) {
        TEST_ASSERT(unit.id.rfind(plan.id + "/", 0) == 0, "units renamed into the new plan");
        TEST_ASSERT(unit.plan_id == plan.id, "plan id updated");
    }
    TEST_ASSERT(plan.is_acyclic(), "acyclic");

    auto checks = units_in_phase(plan, "validate");
    TEST_ASSERT(checks.size() == 1 && plan.predecessors(checks[0]->id).size() == 2, "edges remapped");

    int retries = 0;
    for (const auto & unit : plan.units) {
        if (unit.description.rfind("retry: ", 0) == 0) {
            retries++;
            TEST_ASSERT(unit.risk >= 0.25, "failed unit carries extra risk");
        }
    }
    TEST_ASSERT(retries == 1, "failed unit marked");

    std::set<std::string> all;
    for (const auto & unit : first.plan.units) {
        all.insert(unit.id);
    }
    TEST_ASSERT(planner.replan(first.plan, all, {}, snap).error == PLANNING_INVALID, "nothing left to replan");

    agent_registry empty;
    TEST_ASSERT(planner.replan(first.plan, {done}, {}, empty.snapshot()).error == PLANNING_INFEASIBLE,
                "no agents to staff the replacement");
    return true;
}

// Structural checks every plan must pass
static bool check_plan_shape(const task_plan & plan) {
    TEST_ASSERT(plan.is_acyclic(), "acyclic");
    TEST_ASSERT(plan.topological_order().size() == plan.units.size(), "every unit ordered");

    std::set<std::string> ids;
    for (const auto & unit : plan.units) {
        TEST_ASSERT(ids.insert(unit.id).second, "unit ids unique");
        TEST_ASSERT(unit.plan_id == plan.id, "unit belongs to the plan");
    }
    for (const auto & e : plan.edges) {
        TEST_ASSERT(ids.count(e.from) && ids.count(e.to), "edges reference units");
        TEST_ASSERT(e.from != e.to, "no self edge");
    }
    TEST_ASSERT(plan.estimated_duration_ms == plan.critical_path_ms(), "estimate is the critical path");
    return true;
}

static objective random_objective(std::mt19937 & rng, int depth) {
    static const std::vector<std::string> verbs = {
        "migrate", "copy", "validate", "analyze", "deploy", "list", "refactor", "optimize", "inspect", "write", "check",
    };
    static const std::vector<std::string> nouns = {"files", "services", "archives", "tables", "caches"};
    static const std::vector<std::string> tags = {"file-write", "validate", "analyze", "deploy", "general"};

    auto pick = [&rng](size_t n) { return std::uniform_int_distribution<size_t>(0, n - 1)(rng); };
    auto chance = [&rng](double p) { return std::uniform_real_distribution<double>(0.0, 1.0)(rng) < p; };

    objective obj;
    obj.description = verbs[pick(verbs.size())];
    if (chance(0.6)) {
        obj.description += " " + std::to_string(1 + pick(6));
    }
    obj.description += " " + nouns[pick(nouns.size())];
    if (chance(0.3)) {
        obj.description += " and " + verbs[pick(verbs.size())] + " them";
    }
    if (chance(0.2)) {
        obj.deadline = get_timestamp_ms() + 24 * 3600 * 1000LL;
    }

    size_t n_constraints = pick(4);
    for (size_t i = 0; i < n_constraints; i++) {
        constraint c;
        c.kind = static_cast<constraint_kind>(pick(5));
        c.mandatory = chance(0.2);
        if (c.is_numeric()) {
            c.number = c.kind == CONSTRAINT_MAX_TASKS ? 1.0 + pick(20) : 1000.0 * (1 + pick(30));
        } else {
            c.text = tags[pick(tags.size())];
        }
        obj.constraints.push_back(c);
    }

    if (depth < 2) {
        size_t n_subs = pick(4);
        for (size_t i = 0; i < n_subs; i++) {
            obj.sub_objectives.push_back(random_objective(rng, depth + 1));
        }
    }
    return obj;
}

static bool test_random_objectives_stay_acyclic() {
    strategy_catalog catalog = strategy_catalog::default_catalog();
    decision_planner planner(catalog);

    agent_registry registry;
    auto add = [&registry](const std::string & id, std::vector<agent_capability> caps) {
        agent_instance agent;
        agent.id = id;
        agent.capabilities = std::move(caps);
        registry.register_agent(agent);
    };
    add("writer", {{"file-write", 0.9}});
    add("validator", {{"validate", 0.95}});
    add("analyst", {{"analyze", 0.8}});
    add("deployer", {{"deploy", 0.85}});
    add("generalist", {{"general", 0.7}});
    registry_snapshot snap = registry.snapshot();

    std::mt19937 rng(20261018);
    int planned = 0;
    int replanned = 0;
    for (int i = 0; i < 200; i++) {
        objective obj = random_objective(rng, 0);
        planning_result r = planner.plan(obj, snap);
        TEST_ASSERT(r.error != PLANNING_INVALID, "generated objectives are well formed");
        if (!r.ok()) {
            TEST_ASSERT(!r.violations.empty(), "infeasible plans name their violations");
            continue;
        }
        planned++;
        if (!check_plan_shape(r.plan)) {
            return false;
        }
        TEST_ASSERT(r.plan.deadline == obj.deadline, "plan carries the objective deadline");
        for (const auto & unit : r.plan.units) {
            TEST_ASSERT(unit.timeout_ms >= unit.estimated_duration_ms, "unit budget covers its estimate");
        }

        // Replan with a random prefix done and one unit failed
        std::vector<std::string> order = r.plan.topological_order();
        size_t n_done = std::uniform_int_distribution<size_t>(0, order.size() - 1)(rng);
        std::set<std::string> done(order.begin(), order.begin() + n_done);
        planning_result next = planner.replan(r.plan, done, {order[n_done]}, snap);
        TEST_ASSERT(next.ok(), "replacement planned");
        replanned++;
        if (!check_plan_shape(next.plan)) {
            return false;
        }
        TEST_ASSERT(next.plan.units.size() == order.size() - n_done, "only unfinished units carried over");
        TEST_ASSERT(next.plan.deadline == r.plan.deadline, "replacement keeps the deadline");
    }
    TEST_ASSERT(planned >= 100, "most generated objectives planned");
    TEST_ASSERT(replanned == planned, "every plan replanned");
    return true;
}

int main() {
    std::cout << "=== Decision Planner Tests ===" << std::endl << std::endl;
    coord_log_set_verbosity(COORD_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_extract_quantities);
    RUN_TEST(test_classify);
    RUN_TEST(test_migrate_plan);
    RUN_TEST(test_invalid_objectives);
    RUN_TEST(test_infeasible_objectives);
    RUN_TEST(test_fallback_to_smaller_plan);
    RUN_TEST(test_sub_objectives);
    RUN_TEST(test_contingencies);
    RUN_TEST(test_history_shapes_estimates);
    RUN_TEST(test_store_round_trip);
    RUN_TEST(test_replan);
    RUN_TEST(test_random_objectives_stay_acyclic);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
