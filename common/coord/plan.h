#pragma once

#include "failure.h"
#include "message.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace coord {

//
// Objectives
//

enum priority_level {
    PRIORITY_LOW,
    PRIORITY_NORMAL,
    PRIORITY_HIGH,
    PRIORITY_CRITICAL
};

const char * priority_to_string(priority_level priority);
bool priority_from_string(const std::string & str, priority_level & out);

struct success_criterion {
    std::string description;
    bool required = true;

    json to_json() const;
};

enum constraint_kind {
    CONSTRAINT_MAX_DURATION,        // number: ms for the critical path
    CONSTRAINT_MAX_TASKS,           // number: task unit count
    CONSTRAINT_REQUIRED_CAPABILITY, // text: tag some agent must offer
    CONSTRAINT_EXCLUDED_CAPABILITY, // text: tag no unit may require
    CONSTRAINT_CUSTOM               // text: informational
};

const char * constraint_kind_to_string(constraint_kind kind);
bool constraint_kind_from_string(const std::string & str, constraint_kind & out);

struct constraint {
    constraint_kind kind = CONSTRAINT_CUSTOM;
    std::string text;
    double number = 0.0;
    bool mandatory = true;

    bool is_numeric() const {
        return kind == CONSTRAINT_MAX_DURATION || kind == CONSTRAINT_MAX_TASKS;
    }

    std::string describe() const;
    json to_json() const;
};

struct objective {
    std::string id;
    std::string description;
    priority_level priority = PRIORITY_NORMAL;
    int64_t deadline = 0;  // Epoch ms, 0 = none
    std::vector<success_criterion> criteria;
    std::vector<constraint> constraints;
    std::vector<objective> sub_objectives;

    json to_json() const;

    // Parse and type-check; on failure returns false and fills error
    static bool from_json(const json & j, objective & out, std::string * error = nullptr);
};

//
// Plans
//

enum complexity_class {
    COMPLEXITY_SIMPLE,
    COMPLEXITY_MODERATE,
    COMPLEXITY_COMPLEX,
    COMPLEXITY_VERY_COMPLEX
};

const char * complexity_to_string(complexity_class cls);
bool complexity_from_string(const std::string & str, complexity_class & out);

struct task_unit {
    std::string id;
    std::string plan_id;
    std::string description;
    std::string phase;
    std::vector<std::string> capabilities;  // Required tags
    int64_t estimated_duration_ms = 0;
    int64_t timeout_ms = 0;                 // Run budget, 0 = engine default
    std::vector<std::string> preconditions;
    std::string expected_outcome;
    bool optional = false;                  // Failure does not fail the plan
    double risk = 0.0;

    json to_json() const;
    static task_unit from_json(const json & j);
};

enum edge_kind {
    EDGE_SEQUENTIAL,     // `to` starts after `from` completes
    EDGE_PARALLEL_SAFE,  // Same wait rule; siblings of one fan-out may run together
    EDGE_CONDITIONAL     // Into an optional unit
};

const char * edge_kind_to_string(edge_kind kind);
bool edge_kind_from_string(const std::string & str, edge_kind & out);

struct dependency_edge {
    std::string from;
    std::string to;
    edge_kind kind = EDGE_SEQUENTIAL;

    bool operator==(const dependency_edge & other) const {
        return from == other.from && to == other.to && kind == other.kind;
    }

    json to_json() const;
};

struct risk_assessment {
    double overall = 0.0;               // 0..1
    double complexity = 0.0;
    int constraint_violations = 0;      // Non-mandatory constraints not met
    double resource_scarcity = 0.0;
    std::map<std::string, double> unit_risk;

    json to_json() const;
    static risk_assessment from_json(const json & j);
};

enum contingency_trigger {
    TRIGGER_FAILURE,
    TRIGGER_TIMEOUT
};

const char * contingency_trigger_to_string(contingency_trigger trigger);

struct contingency_plan {
    std::string task_id;
    contingency_trigger trigger = TRIGGER_FAILURE;
    task_unit fallback;  // Carries the id of the unit it replaces

    json to_json() const;
};

struct task_plan {
    std::string id;
    std::string objective_id;
    std::vector<task_unit> units;        // Declaration order
    std::vector<dependency_edge> edges;
    int64_t estimated_duration_ms = 0;   // Critical path
    complexity_class complexity = COMPLEXITY_SIMPLE;
    risk_assessment risk;
    std::vector<contingency_plan> contingencies;
    int64_t created_at = 0;
    int64_t deadline = 0;                // Objective deadline, epoch ms, 0 = none
    std::string replaces_plan_id;

    const task_unit * find_unit(const std::string & unit_id) const;
    std::vector<std::string> predecessors(const std::string & unit_id) const;
    std::vector<std::string> successors(const std::string & unit_id) const;

    bool is_acyclic() const;

    // Kahn order, ties in declaration order; empty when the edges have a cycle
    std::vector<std::string> topological_order() const;

    // Longest path over estimated durations (0 when cyclic)
    int64_t critical_path_ms() const;

    const contingency_plan * find_contingency(const std::string & unit_id) const;

    // Swap a unit for its fallback; the contingency is consumed
    bool substitute_contingency(const std::string & unit_id);

    json to_json() const;
    static bool from_json(const json & j, task_plan & out, std::string * error = nullptr);
};

//
// Assignments, decisions and outcomes
//

struct task_assignment {
    std::string task_id;
    std::string agent_id;
    std::string plan_id;
    priority_level priority = PRIORITY_NORMAL;
    int64_t estimated_duration_ms = 0;
    int64_t assigned_at = 0;

    json to_json() const;
};

enum decision_type {
    DECISION_STRATEGIC,   // Which action kind
    DECISION_TACTICAL,    // Which variant of the kind
    DECISION_OPERATIONAL, // Dispatch bookkeeping
    DECISION_REACTIVE     // Backtrack or terminal reaction
};

const char * decision_type_to_string(decision_type type);

enum decision_terminal {
    TERMINAL_NONE,
    TERMINAL_COMPLETED,
    TERMINAL_FAILED,
    TERMINAL_CANCELLED
};

const char * decision_terminal_to_string(decision_terminal terminal);

struct scored_alternative {
    std::string action;
    double score = 0.0;
    std::string rationale;

    json to_json() const;
};

struct decision {
    std::string id;
    std::string task_id;
    std::string parent_id;
    std::string context;     // Capability the task runs under, keys history
    int64_t timestamp = 0;
    decision_type type = DECISION_OPERATIONAL;
    std::string action;
    double confidence = 0.0;
    std::vector<scored_alternative> alternatives;
    std::vector<std::string> rejected;
    std::string rationale;
    decision_terminal terminal = TERMINAL_NONE;

    json to_json() const;
};

struct execution_outcome {
    bool success = false;
    error_type error = ERROR_TYPE_NONE;
    std::string output;
    json report = json::object();  // Extra structured detail from the executor
    int64_t duration_ms = 0;

    json to_json() const;
    static execution_outcome from_json(const json & j);
};

enum execution_status {
    EXECUTION_RUNNING,
    EXECUTION_COMPLETED,
    EXECUTION_FAILED,
    EXECUTION_CANCELLED
};

const char * execution_status_to_string(execution_status status);

struct execution_result {
    std::string plan_id;
    execution_status status = EXECUTION_RUNNING;
    error_type error = ERROR_TYPE_NONE;
    error_category category = ERROR_CATEGORY_NONE;
    bool circuit_open = false;
    std::string message;
    std::vector<std::string> completed;
    std::vector<std::string> failed;
    std::vector<std::string> skipped;
    int conflicts = 0;
    int replans = 0;
    int64_t duration_ms = 0;

    json to_json() const;
};

//
// Conflicts
//

enum conflict_severity {
    CONFLICT_SEVERITY_LOW,
    CONFLICT_SEVERITY_MEDIUM,
    CONFLICT_SEVERITY_HIGH
};

const char * conflict_severity_to_string(conflict_severity severity);

struct conflicting_value {
    std::string agent_id;
    json value;
    int64_t timestamp = 0;

    json to_json() const;
};

struct conflict {
    std::string id;
    conflict_severity severity = CONFLICT_SEVERITY_LOW;
    std::string domain;
    std::vector<conflicting_value> values;
    int64_t timestamp = 0;

    json to_json() const;
};

enum resolution_strategy {
    RESOLUTION_LAST_WRITER_WINS,
    RESOLUTION_MERGE,
    RESOLUTION_CONSENSUS
};

const char * resolution_strategy_to_string(resolution_strategy strategy);

struct resolution {
    std::string conflict_id;
    resolution_strategy strategy = RESOLUTION_LAST_WRITER_WINS;
    json value;
    double confidence = 0.0;
    std::string rationale;
    std::vector<std::string> escalated_fields;
    int64_t timestamp = 0;

    json to_json() const;
};

} // namespace coord
