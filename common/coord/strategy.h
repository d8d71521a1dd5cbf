#pragma once

#include "plan.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace coord {

// Closed set of execution strategies a task can be driven with
enum action_kind {
    ACTION_KIND_SEQUENTIAL,
    ACTION_KIND_PARALLEL,
    ACTION_KIND_ADAPTIVE
};

const char * action_kind_to_string(action_kind kind);
bool action_kind_from_string(const std::string & str, action_kind & out);

// Description keywords mapped to the capability tag they need
struct capability_rule {
    std::vector<std::string> keywords;  // Lowercase substrings
    std::string capability;
};

struct action_variant {
    std::string id;
    std::string pattern_id;                          // Handed to the pattern executor
    std::vector<std::string> required_capabilities;  // Agent must offer all of them
    double base_success = 0.8;                       // Prior success probability
    double relative_cost = 1.0;                      // 1.0 = nominal
};

struct action_entry {
    action_kind kind = ACTION_KIND_SEQUENTIAL;
    std::vector<action_variant> variants;
};

// Tunable weights. None of these carry correctness; they only shape scores.
struct scoring_weights {
    // Complexity score terms
    double keyword = 0.15;          // Per complexity keyword found
    double length = 0.05;           // Per 100 description characters
    double quantity = 0.10;         // Per number in the description
    double constraint = 0.08;       // Per constraint
    double sub_objective = 0.25;    // Per nested sub-objective
    double deadline = 0.30;         // Times deadline tightness (0..1)
    int64_t tight_deadline_ms = 3600000;

    // Class thresholds on the complexity score
    double moderate_threshold = 0.25;
    double complex_threshold = 0.60;
    double very_complex_threshold = 0.90;

    // Plan risk terms
    double risk_complexity = 0.5;
    double risk_constraints = 0.3;
    double risk_scarcity = 0.2;

    // Decision scoring
    double history_bias = 0.3;      // Pull of the historical success rate
    double deadline_fit_floor = 0.2;
};

//
// Strategy catalog: the planning and decision vocabulary of one coordinator.
// Constructed explicitly and passed by reference; default_catalog() gives
// the stock rules, apply_json() overrides parts of them.
//

class strategy_catalog {
public:
    std::vector<capability_rule> capability_rules;
    std::string default_capability = "general";

    std::vector<std::string> complexity_keywords;

    std::map<complexity_class, std::vector<std::string>> phase_templates;
    std::map<std::string, std::string> phase_capabilities;  // Phase -> fixed tag
    std::map<std::string, int64_t> phase_durations;         // Phase -> estimate
    double timeout_factor = 4.0;                            // Unit run budget over its estimate
    std::set<std::string> optional_phases;
    std::string fan_out_phase = "execute";
    int max_fan_out = 16;

    std::vector<action_entry> actions;
    scoring_weights weights;

    static strategy_catalog default_catalog();

    // First rule whose keyword occurs in the text; default_capability otherwise
    std::string capability_for(const std::string & text) const;

    // Tag a unit of the given phase requires, primary being the objective's tag
    std::string capability_for_phase(const std::string & phase, const std::string & primary) const;

    int64_t duration_for_phase(const std::string & phase) const;

    // Run budget of a unit estimated at duration_ms
    int64_t timeout_for(int64_t duration_ms) const;

    const action_entry * find_action(action_kind kind) const;

    json to_json() const;

    // Override fields present in j; false with error on a malformed section
    bool apply_json(const json & j, std::string * error = nullptr);
};

std::string to_lower(const std::string & str);

} // namespace coord
