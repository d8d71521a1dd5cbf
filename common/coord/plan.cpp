#include "plan.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <unordered_map>

namespace coord {

const char * priority_to_string(priority_level priority) {
    switch (priority) {
        case PRIORITY_LOW:      return "low";
        case PRIORITY_NORMAL:   return "normal";
        case PRIORITY_HIGH:     return "high";
        case PRIORITY_CRITICAL: return "critical";
        default:                return "normal";
    }
}

bool priority_from_string(const std::string & str, priority_level & out) {
    if (str == "low")      { out = PRIORITY_LOW;      return true; }
    if (str == "normal")   { out = PRIORITY_NORMAL;   return true; }
    if (str == "high")     { out = PRIORITY_HIGH;     return true; }
    if (str == "critical") { out = PRIORITY_CRITICAL; return true; }
    return false;
}

const char * constraint_kind_to_string(constraint_kind kind) {
    switch (kind) {
        case CONSTRAINT_MAX_DURATION:        return "max_duration";
        case CONSTRAINT_MAX_TASKS:           return "max_tasks";
        case CONSTRAINT_REQUIRED_CAPABILITY: return "required_capability";
        case CONSTRAINT_EXCLUDED_CAPABILITY: return "excluded_capability";
        case CONSTRAINT_CUSTOM:              return "custom";
        default:                             return "custom";
    }
}

bool constraint_kind_from_string(const std::string & str, constraint_kind & out) {
    if (str == "max_duration")        { out = CONSTRAINT_MAX_DURATION;        return true; }
    if (str == "max_tasks")           { out = CONSTRAINT_MAX_TASKS;           return true; }
    if (str == "required_capability") { out = CONSTRAINT_REQUIRED_CAPABILITY; return true; }
    if (str == "excluded_capability") { out = CONSTRAINT_EXCLUDED_CAPABILITY; return true; }
    if (str == "custom")              { out = CONSTRAINT_CUSTOM;              return true; }
    return false;
}

const char * complexity_to_string(complexity_class cls) {
    switch (cls) {
        case COMPLEXITY_SIMPLE:       return "simple";
        case COMPLEXITY_MODERATE:     return "moderate";
        case COMPLEXITY_COMPLEX:      return "complex";
        case COMPLEXITY_VERY_COMPLEX: return "very_complex";
        default:                      return "simple";
    }
}

bool complexity_from_string(const std::string & str, complexity_class & out) {
    if (str == "simple")       { out = COMPLEXITY_SIMPLE;       return true; }
    if (str == "moderate")     { out = COMPLEXITY_MODERATE;     return true; }
    if (str == "complex")      { out = COMPLEXITY_COMPLEX;      return true; }
    if (str == "very_complex") { out = COMPLEXITY_VERY_COMPLEX; return true; }
    return false;
}

const char * edge_kind_to_string(edge_kind kind) {
    switch (kind) {
        case EDGE_SEQUENTIAL:    return "sequential";
        case EDGE_PARALLEL_SAFE: return "parallel_safe";
        case EDGE_CONDITIONAL:   return "conditional";
        default:                 return "sequential";
    }
}

bool edge_kind_from_string(const std::string & str, edge_kind & out) {
    if (str == "sequential")    { out = EDGE_SEQUENTIAL;    return true; }
    if (str == "parallel_safe") { out = EDGE_PARALLEL_SAFE; return true; }
    if (str == "conditional")   { out = EDGE_CONDITIONAL;   return true; }
    return false;
}

const char * contingency_trigger_to_string(contingency_trigger trigger) {
    switch (trigger) {
        case TRIGGER_FAILURE: return "failure";
        case TRIGGER_TIMEOUT: return "timeout";
        default:              return "failure";
    }
}

const char * decision_type_to_string(decision_type type) {
    switch (type) {
        case DECISION_STRATEGIC:   return "strategic";
        case DECISION_TACTICAL:    return "tactical";
        case DECISION_OPERATIONAL: return "operational";
        case DECISION_REACTIVE:    return "reactive";
        default:                   return "operational";
    }
}

const char * decision_terminal_to_string(decision_terminal terminal) {
    switch (terminal) {
        case TERMINAL_NONE:      return "none";
        case TERMINAL_COMPLETED: return "completed";
        case TERMINAL_FAILED:    return "failed";
        case TERMINAL_CANCELLED: return "cancelled";
        default:                 return "none";
    }
}

const char * execution_status_to_string(execution_status status) {
    switch (status) {
        case EXECUTION_RUNNING:   return "running";
        case EXECUTION_COMPLETED: return "completed";
        case EXECUTION_FAILED:    return "failed";
        case EXECUTION_CANCELLED: return "cancelled";
        default:                  return "running";
    }
}

const char * conflict_severity_to_string(conflict_severity severity) {
    switch (severity) {
        case CONFLICT_SEVERITY_LOW:    return "low";
        case CONFLICT_SEVERITY_MEDIUM: return "medium";
        case CONFLICT_SEVERITY_HIGH:   return "high";
        default:                       return "low";
    }
}

const char * resolution_strategy_to_string(resolution_strategy strategy) {
    switch (strategy) {
        case RESOLUTION_LAST_WRITER_WINS: return "last_writer_wins";
        case RESOLUTION_MERGE:            return "merge";
        case RESOLUTION_CONSENSUS:        return "consensus";
        default:                          return "last_writer_wins";
    }
}

// success_criterion / constraint / objective
json success_criterion::to_json() const {
    return json{
        {"description", description},
        {"required", required}
    };
}

std::string constraint::describe() const {
    std::ostringstream ss;
    ss << constraint_kind_to_string(kind) << "=";
    if (is_numeric()) {
        ss << static_cast<int64_t>(number);
    } else {
        ss << text;
    }
    if (!mandatory) {
        ss << " (soft)";
    }
    return ss.str();
}

json constraint::to_json() const {
    json j;
    j["kind"] = constraint_kind_to_string(kind);
    if (is_numeric()) {
        j["value"] = number;
    } else {
        j["value"] = text;
    }
    j["mandatory"] = mandatory;
    return j;
}

json objective::to_json() const {
    json j;
    j["id"] = id;
    j["description"] = description;
    j["priority"] = priority_to_string(priority);
    j["deadline"] = deadline;

    j["criteria"] = json::array();
    for (const auto & c : criteria) {
        j["criteria"].push_back(c.to_json());
    }
    j["constraints"] = json::array();
    for (const auto & c : constraints) {
        j["constraints"].push_back(c.to_json());
    }
    j["sub_objectives"] = json::array();
    for (const auto & sub : sub_objectives) {
        j["sub_objectives"].push_back(sub.to_json());
    }
    return j;
}

static bool fail_with(std::string * error, const std::string & msg) {
    if (error) {
        *error = msg;
    }
    return false;
}

bool objective::from_json(const json & j, objective & out, std::string * error) {
    if (!j.is_object()) {
        return fail_with(error, "objective must be an object");
    }

    try {
        objective obj;
        obj.id = j.value("id", "");
        obj.description = j.value("description", "");
        obj.deadline = j.value("deadline", static_cast<int64_t>(0));

        std::string prio = j.value("priority", "normal");
        if (!priority_from_string(prio, obj.priority)) {
            return fail_with(error, "unknown priority '" + prio + "'");
        }

        if (j.contains("criteria")) {
            for (const auto & c : j.at("criteria")) {
                success_criterion crit;
                crit.description = c.value("description", "");
                crit.required = c.value("required", true);
                obj.criteria.push_back(crit);
            }
        }

        if (j.contains("constraints")) {
            for (const auto & c : j.at("constraints")) {
                constraint con;
                std::string kind = c.value("kind", "");
                if (!constraint_kind_from_string(kind, con.kind)) {
                    return fail_with(error, "unknown constraint kind '" + kind + "'");
                }
                con.mandatory = c.value("mandatory", true);
                if (!c.contains("value")) {
                    return fail_with(error, "constraint '" + kind + "' has no value");
                }
                const auto & v = c.at("value");
                if (con.is_numeric()) {
                    if (!v.is_number()) {
                        return fail_with(error, "constraint '" + kind + "' needs a number");
                    }
                    con.number = v.get<double>();
                } else {
                    if (!v.is_string()) {
                        return fail_with(error, "constraint '" + kind + "' needs a string");
                    }
                    con.text = v.get<std::string>();
                }
                obj.constraints.push_back(con);
            }
        }

        if (j.contains("sub_objectives")) {
            for (const auto & s : j.at("sub_objectives")) {
                objective sub;
                if (!objective::from_json(s, sub, error)) {
                    return false;
                }
                obj.sub_objectives.push_back(std::move(sub));
            }
        }

        out = std::move(obj);
        return true;
    } catch (const json::exception & e) {
        return fail_with(error, std::string("malformed objective: ") + e.what());
    }
}

// task_unit
json task_unit::to_json() const {
    return json{
        {"id", id},
        {"plan_id", plan_id},
        {"description", description},
        {"phase", phase},
        {"capabilities", capabilities},
        {"estimated_duration_ms", estimated_duration_ms},
        {"timeout_ms", timeout_ms},
        {"preconditions", preconditions},
        {"expected_outcome", expected_outcome},
        {"optional", optional},
        {"risk", risk}
    };
}

task_unit task_unit::from_json(const json & j) {
    task_unit unit;
    unit.id = j.value("id", "");
    unit.plan_id = j.value("plan_id", "");
    unit.description = j.value("description", "");
    unit.phase = j.value("phase", "");
    unit.capabilities = j.value("capabilities", std::vector<std::string>());
    unit.estimated_duration_ms = j.value("estimated_duration_ms", static_cast<int64_t>(0));
    unit.timeout_ms = j.value("timeout_ms", static_cast<int64_t>(0));
    unit.preconditions = j.value("preconditions", std::vector<std::string>());
    unit.expected_outcome = j.value("expected_outcome", "");
    unit.optional = j.value("optional", false);
    unit.risk = j.value("risk", 0.0);
    return unit;
}

json dependency_edge::to_json() const {
    return json{
        {"from", from},
        {"to", to},
        {"kind", edge_kind_to_string(kind)}
    };
}

json risk_assessment::to_json() const {
    return json{
        {"overall", overall},
        {"complexity", complexity},
        {"constraint_violations", constraint_violations},
        {"resource_scarcity", resource_scarcity},
        {"unit_risk", unit_risk}
    };
}

risk_assessment risk_assessment::from_json(const json & j) {
    risk_assessment r;
    r.overall = j.value("overall", 0.0);
    r.complexity = j.value("complexity", 0.0);
    r.constraint_violations = j.value("constraint_violations", 0);
    r.resource_scarcity = j.value("resource_scarcity", 0.0);
    r.unit_risk = j.value("unit_risk", std::map<std::string, double>());
    return r;
}

json contingency_plan::to_json() const {
    return json{
        {"task_id", task_id},
        {"trigger", contingency_trigger_to_string(trigger)},
        {"fallback", fallback.to_json()}
    };
}

// task_plan
const task_unit * task_plan::find_unit(const std::string & unit_id) const {
    for (const auto & unit : units) {
        if (unit.id == unit_id) {
            return &unit;
        }
    }
    return nullptr;
}

std::vector<std::string> task_plan::predecessors(const std::string & unit_id) const {
    std::vector<std::string> result;
    for (const auto & e : edges) {
        if (e.to == unit_id) {
            result.push_back(e.from);
        }
    }
    return result;
}

std::vector<std::string> task_plan::successors(const std::string & unit_id) const {
    std::vector<std::string> result;
    for (const auto & e : edges) {
        if (e.from == unit_id) {
            result.push_back(e.to);
        }
    }
    return result;
}

std::vector<std::string> task_plan::topological_order() const {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < units.size(); i++) {
        index[units[i].id] = i;
    }

    std::vector<int> in_degree(units.size(), 0);
    std::vector<std::vector<size_t>> out(units.size());
    for (const auto & e : edges) {
        auto f = index.find(e.from);
        auto t = index.find(e.to);
        if (f == index.end() || t == index.end()) {
            return {};
        }
        out[f->second].push_back(t->second);
        in_degree[t->second]++;
    }

    // Smallest declaration index first keeps the order stable
    std::set<size_t> ready;
    for (size_t i = 0; i < units.size(); i++) {
        if (in_degree[i] == 0) {
            ready.insert(i);
        }
    }

    std::vector<std::string> order;
    order.reserve(units.size());
    while (!ready.empty()) {
        size_t i = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(units[i].id);
        for (size_t next : out[i]) {
            if (--in_degree[next] == 0) {
                ready.insert(next);
            }
        }
    }

    if (order.size() != units.size()) {
        return {};
    }
    return order;
}

bool task_plan::is_acyclic() const {
    return units.empty() || !topological_order().empty();
}

int64_t task_plan::critical_path_ms() const {
    std::vector<std::string> order = topological_order();
    if (order.empty()) {
        return 0;
    }

    std::unordered_map<std::string, int64_t> finish;
    int64_t longest = 0;
    for (const auto & id : order) {
        int64_t start = 0;
        for (const auto & pred : predecessors(id)) {
            start = std::max(start, finish[pred]);
        }
        const task_unit * unit = find_unit(id);
        finish[id] = start + (unit ? unit->estimated_duration_ms : 0);
        longest = std::max(longest, finish[id]);
    }
    return longest;
}

const contingency_plan * task_plan::find_contingency(const std::string & unit_id) const {
    for (const auto & c : contingencies) {
        if (c.task_id == unit_id) {
            return &c;
        }
    }
    return nullptr;
}

bool task_plan::substitute_contingency(const std::string & unit_id) {
    auto c = std::find_if(contingencies.begin(), contingencies.end(),
                          [&unit_id](const contingency_plan & p) { return p.task_id == unit_id; });
    if (c == contingencies.end()) {
        return false;
    }

    for (auto & unit : units) {
        if (unit.id == unit_id) {
            unit = c->fallback;
            unit.id = unit_id;
            unit.plan_id = id;
            contingencies.erase(c);
            return true;
        }
    }
    return false;
}

json task_plan::to_json() const {
    json j;
    j["id"] = id;
    j["objective_id"] = objective_id;
    j["units"] = json::array();
    for (const auto & unit : units) {
        j["units"].push_back(unit.to_json());
    }
    j["edges"] = json::array();
    for (const auto & e : edges) {
        j["edges"].push_back(e.to_json());
    }
    j["estimated_duration_ms"] = estimated_duration_ms;
    j["complexity"] = complexity_to_string(complexity);
    j["risk"] = risk.to_json();
    j["contingencies"] = json::array();
    for (const auto & c : contingencies) {
        j["contingencies"].push_back(c.to_json());
    }
    j["created_at"] = created_at;
    j["deadline"] = deadline;
    j["replaces_plan_id"] = replaces_plan_id;
    return j;
}

bool task_plan::from_json(const json & j, task_plan & out, std::string * error) {
    if (!j.is_object()) {
        return fail_with(error, "plan must be an object");
    }

    try {
        task_plan plan;
        plan.id = j.value("id", "");
        plan.objective_id = j.value("objective_id", "");
        plan.estimated_duration_ms = j.value("estimated_duration_ms", static_cast<int64_t>(0));
        plan.created_at = j.value("created_at", static_cast<int64_t>(0));
        plan.deadline = j.value("deadline", static_cast<int64_t>(0));
        plan.replaces_plan_id = j.value("replaces_plan_id", "");

        std::string cls = j.value("complexity", "simple");
        if (!complexity_from_string(cls, plan.complexity)) {
            return fail_with(error, "unknown complexity '" + cls + "'");
        }

        for (const auto & u : j.value("units", json::array())) {
            plan.units.push_back(task_unit::from_json(u));
        }

        for (const auto & e : j.value("edges", json::array())) {
            dependency_edge edge;
            edge.from = e.value("from", "");
            edge.to = e.value("to", "");
            std::string kind = e.value("kind", "sequential");
            if (!edge_kind_from_string(kind, edge.kind)) {
                return fail_with(error, "unknown edge kind '" + kind + "'");
            }
            plan.edges.push_back(edge);
        }

        if (j.contains("risk")) {
            plan.risk = risk_assessment::from_json(j.at("risk"));
        }

        for (const auto & c : j.value("contingencies", json::array())) {
            contingency_plan cp;
            cp.task_id = c.value("task_id", "");
            cp.trigger = c.value("trigger", "failure") == "timeout" ? TRIGGER_TIMEOUT : TRIGGER_FAILURE;
            cp.fallback = task_unit::from_json(c.value("fallback", json::object()));
            plan.contingencies.push_back(cp);
        }

        if (!plan.is_acyclic()) {
            return fail_with(error, "plan " + plan.id + " has a dependency cycle");
        }

        out = std::move(plan);
        return true;
    } catch (const json::exception & e) {
        return fail_with(error, std::string("malformed plan: ") + e.what());
    }
}

// Assignments, decisions and outcomes
json task_assignment::to_json() const {
    return json{
        {"task_id", task_id},
        {"agent_id", agent_id},
        {"plan_id", plan_id},
        {"priority", priority_to_string(priority)},
        {"estimated_duration_ms", estimated_duration_ms},
        {"assigned_at", assigned_at}
    };
}

json scored_alternative::to_json() const {
    return json{
        {"action", action},
        {"score", score},
        {"rationale", rationale}
    };
}

json decision::to_json() const {
    json j;
    j["id"] = id;
    j["task_id"] = task_id;
    j["parent_id"] = parent_id;
    j["context"] = context;
    j["timestamp"] = timestamp;
    j["type"] = decision_type_to_string(type);
    j["action"] = action;
    j["confidence"] = confidence;
    j["alternatives"] = json::array();
    for (const auto & alt : alternatives) {
        j["alternatives"].push_back(alt.to_json());
    }
    j["rejected"] = rejected;
    j["rationale"] = rationale;
    j["terminal"] = decision_terminal_to_string(terminal);
    return j;
}

json execution_outcome::to_json() const {
    return json{
        {"success", success},
        {"error", error_type_to_string(error)},
        {"output", output},
        {"report", report},
        {"duration_ms", duration_ms}
    };
}

execution_outcome execution_outcome::from_json(const json & j) {
    execution_outcome o;
    o.success = j.value("success", false);
    o.error = error_type_from_string(j.value("error", "none"));
    o.output = j.value("output", "");
    o.report = j.value("report", json::object());
    o.duration_ms = j.value("duration_ms", static_cast<int64_t>(0));
    return o;
}

json execution_result::to_json() const {
    return json{
        {"plan_id", plan_id},
        {"status", execution_status_to_string(status)},
        {"error", error_type_to_string(error)},
        {"category", error_category_to_string(category)},
        {"circuit_open", circuit_open},
        {"message", message},
        {"completed", completed},
        {"failed", failed},
        {"skipped", skipped},
        {"conflicts", conflicts},
        {"replans", replans},
        {"duration_ms", duration_ms}
    };
}

// Conflicts
json conflicting_value::to_json() const {
    return json{
        {"agent_id", agent_id},
        {"value", value},
        {"timestamp", timestamp}
    };
}

json conflict::to_json() const {
    json j;
    j["id"] = id;
    j["severity"] = conflict_severity_to_string(severity);
    j["domain"] = domain;
    j["values"] = json::array();
    for (const auto & v : values) {
        j["values"].push_back(v.to_json());
    }
    j["timestamp"] = timestamp;
    return j;
}

json resolution::to_json() const {
    return json{
        {"conflict_id", conflict_id},
        {"strategy", resolution_strategy_to_string(strategy)},
        {"value", value},
        {"confidence", confidence},
        {"rationale", rationale},
        {"escalated_fields", escalated_fields},
        {"timestamp", timestamp}
    };
}

} // namespace coord
