#include "planner.h"
#include "../log.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace coord {

const char * planning_error_to_string(planning_error err) {
    switch (err) {
        case PLANNING_OK:         return "ok";
        case PLANNING_INVALID:    return "invalid";
        case PLANNING_INFEASIBLE: return "infeasible";
        default:                  return "invalid";
    }
}

json planning_result::to_json() const {
    json j;
    j["error"] = planning_error_to_string(error);
    j["message"] = message;
    j["violations"] = violations;
    if (ok()) {
        j["plan"] = plan.to_json();
    }
    return j;
}

std::vector<int> extract_quantities(const std::string & text) {
    std::vector<int> result;
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            i++;
        }
        // Ignore digits glued to letters, e.g. "v2" or "utf8"
        bool glued = (start > 0 && std::isalpha(static_cast<unsigned char>(text[start - 1]))) ||
                     (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i])));
        if (glued) {
            continue;
        }
        std::string digits = text.substr(start, std::min<size_t>(i - start, 9));
        result.push_back(std::stoi(digits));
    }
    return result;
}

static std::string trim(const std::string & s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static void collect_ids(const objective & obj, std::vector<std::string> & ids) {
    if (!obj.id.empty()) {
        ids.push_back(obj.id);
    }
    for (const auto & sub : obj.sub_objectives) {
        collect_ids(sub, ids);
    }
}

static void assign_missing_ids(objective & obj) {
    if (obj.id.empty()) {
        obj.id = generate_uuid();
    }
    for (auto & sub : obj.sub_objectives) {
        assign_missing_ids(sub);
    }
}

static bool validate_tree(const objective & obj, std::string * error) {
    auto fail = [error](const std::string & msg) {
        if (error) *error = msg;
        return false;
    };

    std::string label = obj.id.empty() ? "<unnamed>" : obj.id;

    if (trim(obj.description).empty()) {
        return fail("objective " + label + " has an empty description");
    }
    if (obj.deadline < 0) {
        return fail("objective " + label + " has a negative deadline");
    }

    for (const auto & c : obj.constraints) {
        if (c.is_numeric() && c.number <= 0.0) {
            return fail("objective " + label + ": constraint " + constraint_kind_to_string(c.kind) + " must be positive");
        }
        if ((c.kind == CONSTRAINT_REQUIRED_CAPABILITY || c.kind == CONSTRAINT_EXCLUDED_CAPABILITY) &&
            trim(c.text).empty()) {
            return fail("objective " + label + ": constraint " + constraint_kind_to_string(c.kind) + " names no capability");
        }
    }

    for (const auto & sub : obj.sub_objectives) {
        if (!validate_tree(sub, error)) {
            return false;
        }
    }
    return true;
}

decision_planner::decision_planner(const strategy_catalog & catalog,
                                   knowledge_store * store,
                                   double risk_threshold)
    : catalog(catalog), store(store), risk_threshold(risk_threshold) {}

bool decision_planner::validate(const objective & obj, std::string * error) const {
    if (!validate_tree(obj, error)) {
        return false;
    }

    std::vector<std::string> ids;
    collect_ids(obj, ids);
    std::sort(ids.begin(), ids.end());
    auto dup = std::adjacent_find(ids.begin(), ids.end());
    if (dup != ids.end()) {
        if (error) *error = "duplicate objective id " + *dup;
        return false;
    }
    return true;
}

double decision_planner::complexity_score(const objective & obj) const {
    const auto & w = catalog.weights;
    std::string lower = to_lower(obj.description);

    int keywords = 0;
    for (const auto & kw : catalog.complexity_keywords) {
        if (lower.find(kw) != std::string::npos) {
            keywords++;
        }
    }

    double score = 0.0;
    score += w.keyword * keywords;
    score += w.length * (static_cast<double>(obj.description.size()) / 100.0);
    score += w.quantity * static_cast<double>(extract_quantities(obj.description).size());
    score += w.constraint * static_cast<double>(obj.constraints.size());
    score += w.sub_objective * static_cast<double>(obj.sub_objectives.size());

    if (obj.deadline > 0 && w.tight_deadline_ms > 0) {
        double remaining = static_cast<double>(obj.deadline - get_timestamp_ms());
        double tightness = 1.0 - remaining / static_cast<double>(w.tight_deadline_ms);
        score += w.deadline * std::min(1.0, std::max(0.0, tightness));
    }

    return score;
}

complexity_class decision_planner::classify(const objective & obj) const {
    const auto & w = catalog.weights;
    double score = complexity_score(obj);

    if (score >= w.very_complex_threshold) return COMPLEXITY_VERY_COMPLEX;
    if (score >= w.complex_threshold)      return COMPLEXITY_COMPLEX;
    if (score >= w.moderate_threshold)     return COMPLEXITY_MODERATE;
    return COMPLEXITY_SIMPLE;
}

int64_t decision_planner::estimate_duration(const std::string & phase,
                                            const std::string & capability,
                                            std::map<std::string, int64_t> & cache) {
    int64_t base = catalog.duration_for_phase(phase);

    auto it = cache.find(capability);
    if (it == cache.end()) {
        int64_t observed = 0;
        if (store) {
            int samples = 0;
            double total = 0.0;
            for (const auto & pattern : store->query_historical_patterns(capability)) {
                total += pattern.avg_duration_ms * pattern.samples();
                samples += pattern.samples();
            }
            if (samples > 0) {
                observed = static_cast<int64_t>(total / samples);
            }
        }
        it = cache.emplace(capability, observed).first;
    }

    if (it->second > 0) {
        return (base + it->second) / 2;
    }
    return base;
}

decision_planner::subtree decision_planner::expand(const objective & obj,
                                                   complexity_class cls,
                                                   bool fan_out,
                                                   task_plan & plan,
                                                   int & counter,
                                                   std::map<std::string, int64_t> & duration_cache) {
    static const std::vector<std::string> fallback_template = {"execute"};

    std::string primary = catalog.capability_for(obj.description);

    std::vector<std::string> required;
    for (const auto & c : obj.constraints) {
        if (c.kind == CONSTRAINT_REQUIRED_CAPABILITY && c.mandatory) {
            required.push_back(c.text);
        }
    }

    auto tmpl = catalog.phase_templates.find(cls);
    const std::vector<std::string> & phases =
        tmpl != catalog.phase_templates.end() && !tmpl->second.empty() ? tmpl->second : fallback_template;

    int fan = 1;
    if (fan_out) {
        std::vector<int> quantities = extract_quantities(obj.description);
        if (!quantities.empty() && quantities[0] >= 2) {
            fan = std::min(quantities[0], catalog.max_fan_out);
        }
    }

    auto attach_subs = [&](std::vector<std::string> & current) {
        std::vector<std::string> joined = current;
        for (const auto & sub : obj.sub_objectives) {
            subtree st = expand(sub, classify(sub), true, plan, counter, duration_cache);
            for (const auto & entry : st.entries) {
                for (const auto & from : current) {
                    plan.edges.push_back({from, entry, EDGE_PARALLEL_SAFE});
                }
            }
            joined.insert(joined.end(), st.exits.begin(), st.exits.end());
        }
        current = joined;
    };

    subtree result;
    std::vector<std::string> prev;
    bool subs_attached = false;

    for (size_t pi = 0; pi < phases.size(); pi++) {
        const std::string & phase = phases[pi];
        bool is_fan_phase = phase == catalog.fan_out_phase;
        int copies = is_fan_phase ? fan : 1;

        std::vector<std::string> current;
        for (int k = 0; k < copies; k++) {
            task_unit unit;
            unit.id = plan.id + "/" + std::to_string(++counter) + "-" + phase;
            unit.plan_id = plan.id;
            unit.phase = phase;
            if (copies > 1) {
                unit.description = phase + " " + std::to_string(k + 1) + "/" + std::to_string(copies) + ": " + obj.description;
            } else {
                unit.description = phase + ": " + obj.description;
            }

            std::string capability = catalog.capability_for_phase(phase, primary);
            unit.capabilities.push_back(capability);
            if (is_fan_phase) {
                for (const auto & tag : required) {
                    if (std::find(unit.capabilities.begin(), unit.capabilities.end(), tag) == unit.capabilities.end()) {
                        unit.capabilities.push_back(tag);
                    }
                }
            }

            unit.estimated_duration_ms = estimate_duration(phase, capability, duration_cache);
            unit.timeout_ms = catalog.timeout_for(unit.estimated_duration_ms);
            unit.optional = catalog.optional_phases.count(phase) > 0;
            unit.expected_outcome = phase + " completed for objective " + obj.id;

            edge_kind kind = unit.optional ? EDGE_CONDITIONAL : (copies > 1 ? EDGE_PARALLEL_SAFE : EDGE_SEQUENTIAL);
            for (const auto & from : prev) {
                plan.edges.push_back({from, unit.id, kind});
                unit.preconditions.push_back(from + " completed");
            }

            current.push_back(unit.id);
            plan.units.push_back(std::move(unit));
        }

        if (pi == 0) {
            result.entries = current;
        }

        if (is_fan_phase && !obj.sub_objectives.empty()) {
            attach_subs(current);
            subs_attached = true;
        }
        prev = current;
    }

    // Template without a fan-out phase: sub-objectives follow the last phase
    if (!subs_attached && !obj.sub_objectives.empty()) {
        attach_subs(prev);
    }

    result.exits = prev;
    return result;
}

std::vector<std::string> decision_planner::check_constraints(const objective & obj,
                                                             const task_plan & plan,
                                                             const registry_snapshot & snapshot,
                                                             bool mandatory) const {
    std::vector<std::string> violations;

    for (const auto & c : obj.constraints) {
        if (c.mandatory != mandatory) {
            continue;
        }

        switch (c.kind) {
            case CONSTRAINT_MAX_TASKS:
                if (static_cast<double>(plan.units.size()) > c.number) {
                    violations.push_back(c.describe() + ": plan needs " + std::to_string(plan.units.size()) + " units");
                }
                break;
            case CONSTRAINT_MAX_DURATION:
                if (static_cast<double>(plan.estimated_duration_ms) > c.number) {
                    violations.push_back(c.describe() + ": critical path is " +
                                         std::to_string(plan.estimated_duration_ms) + " ms");
                }
                break;
            case CONSTRAINT_REQUIRED_CAPABILITY:
                if (!snapshot.has_capability(c.text)) {
                    violations.push_back(c.describe() + ": no registered agent offers it");
                }
                break;
            case CONSTRAINT_EXCLUDED_CAPABILITY:
                for (const auto & unit : plan.units) {
                    if (std::find(unit.capabilities.begin(), unit.capabilities.end(), c.text) != unit.capabilities.end()) {
                        violations.push_back(c.describe() + ": unit " + unit.id + " requires it");
                        break;
                    }
                }
                break;
            case CONSTRAINT_CUSTOM:
                break;
        }
    }

    if (mandatory && obj.deadline > 0) {
        int64_t remaining = obj.deadline - get_timestamp_ms();
        if (plan.estimated_duration_ms > remaining) {
            violations.push_back("deadline: critical path " + std::to_string(plan.estimated_duration_ms) +
                                 " ms, " + std::to_string(std::max<int64_t>(0, remaining)) + " ms left");
        }
    }

    return violations;
}

void decision_planner::assess_risk(task_plan & plan,
                                   double complexity,
                                   double violation_ratio,
                                   int soft_violations,
                                   const registry_snapshot & snapshot) const {
    const auto & w = catalog.weights;

    std::map<std::string, int> capable;
    for (const auto & agent : snapshot.agents) {
        if (agent.status == AGENT_STATUS_UNREACHABLE) {
            continue;
        }
        for (const auto & cap : agent.capabilities) {
            if (cap.confidence > 0.0) {
                capable[cap.tag]++;
            }
        }
    }

    auto clamp01 = [](double v) { return std::min(1.0, std::max(0.0, v)); };

    plan.risk = risk_assessment();
    plan.risk.complexity = clamp01(complexity);
    plan.risk.constraint_violations = soft_violations;

    double scarcity_sum = 0.0;
    for (auto & unit : plan.units) {
        double unit_scarcity = 0.0;
        for (const auto & tag : unit.capabilities) {
            int n = capable.count(tag) ? capable[tag] : 0;
            unit_scarcity += n == 0 ? 1.0 : 1.0 / (1.0 + n);
        }
        if (!unit.capabilities.empty()) {
            unit_scarcity /= unit.capabilities.size();
        }
        scarcity_sum += unit_scarcity;

        unit.risk = clamp01(w.risk_complexity * plan.risk.complexity +
                            w.risk_constraints * violation_ratio +
                            w.risk_scarcity * unit_scarcity);
        plan.risk.unit_risk[unit.id] = unit.risk;
    }

    plan.risk.resource_scarcity = plan.units.empty() ? 0.0 : scarcity_sum / plan.units.size();
    plan.risk.overall = clamp01(w.risk_complexity * plan.risk.complexity +
                                w.risk_constraints * violation_ratio +
                                w.risk_scarcity * plan.risk.resource_scarcity);
}

void decision_planner::build_contingencies(task_plan & plan) const {
    plan.contingencies.clear();

    for (const auto & unit : plan.units) {
        if (unit.risk <= risk_threshold) {
            continue;
        }

        contingency_plan cp;
        cp.task_id = unit.id;
        cp.trigger = TRIGGER_FAILURE;
        cp.fallback = unit;
        cp.fallback.description = "fallback: " + unit.description;
        cp.fallback.estimated_duration_ms = unit.estimated_duration_ms + unit.estimated_duration_ms / 2;
        cp.fallback.timeout_ms = catalog.timeout_for(cp.fallback.estimated_duration_ms);
        cp.fallback.risk = unit.risk / 2.0;
        plan.contingencies.push_back(cp);
    }
}

planning_result decision_planner::plan(const objective & obj, const registry_snapshot & snapshot) {
    planning_result result;

    std::string error;
    if (!validate(obj, &error)) {
        result.error = PLANNING_INVALID;
        result.message = error;
        LOG_WRN("planner: invalid objective: %s\n", error.c_str());
        return result;
    }

    objective o = obj;
    assign_missing_ids(o);

    // Violations no decomposition can repair
    std::string primary = catalog.capability_for(o.description);
    for (const auto & c : o.constraints) {
        if (!c.mandatory) {
            continue;
        }
        if (c.kind == CONSTRAINT_EXCLUDED_CAPABILITY && c.text == primary) {
            result.violations.push_back(c.describe() + ": the objective itself needs it");
        }
        if (c.kind == CONSTRAINT_REQUIRED_CAPABILITY && !snapshot.has_capability(c.text)) {
            result.violations.push_back(c.describe() + ": no registered agent offers it");
        }
    }
    if (o.deadline > 0 && o.deadline <= get_timestamp_ms()) {
        result.violations.push_back("deadline already passed");
    }

    double score = complexity_score(o);
    complexity_class top = classify(o);

    std::vector<int> quantities = extract_quantities(o.description);
    bool can_fan_out = !quantities.empty() && quantities[0] >= 2;

    if (result.violations.empty()) {
        std::string plan_id = generate_uuid();
        std::map<std::string, int64_t> duration_cache;

        for (int cls = top; cls >= COMPLEXITY_SIMPLE; cls--) {
            std::vector<bool> variants = can_fan_out ? std::vector<bool>{true, false} : std::vector<bool>{false};
            for (bool fan : variants) {
                task_plan candidate;
                candidate.id = plan_id;
                candidate.objective_id = o.id;
                candidate.complexity = static_cast<complexity_class>(cls);
                candidate.created_at = get_timestamp_ms();
                candidate.deadline = o.deadline;

                int counter = 0;
                expand(o, candidate.complexity, fan, candidate, counter, duration_cache);
                candidate.estimated_duration_ms = candidate.critical_path_ms();

                std::vector<std::string> violations = check_constraints(o, candidate, snapshot, true);
                if (!violations.empty()) {
                    LOG_DBG("planner: %s candidate (fan-out %s) rejected: %s\n",
                            complexity_to_string(candidate.complexity), fan ? "on" : "off", violations.front().c_str());
                    result.violations = violations;
                    continue;
                }

                std::vector<std::string> soft = check_constraints(o, candidate, snapshot, false);
                size_t n_constraints = std::max<size_t>(1, o.constraints.size());
                assess_risk(candidate, score, static_cast<double>(soft.size()) / n_constraints,
                            static_cast<int>(soft.size()), snapshot);
                build_contingencies(candidate);

                result.error = PLANNING_OK;
                result.violations.clear();
                result.plan = std::move(candidate);

                LOG_INF("planner: objective %s -> plan %s (%s, %zu units, %zu edges, risk %.2f)\n",
                        o.id.c_str(), result.plan.id.c_str(), complexity_to_string(result.plan.complexity),
                        result.plan.units.size(), result.plan.edges.size(), result.plan.risk.overall);
                return result;
            }
        }
    }

    result.error = PLANNING_INFEASIBLE;
    result.message = "no decomposition of objective " + o.id + " satisfies its mandatory constraints";
    for (const auto & v : result.violations) {
        result.message += "; " + v;
    }
    LOG_WRN("planner: %s\n", result.message.c_str());
    return result;
}

planning_result decision_planner::replan(const task_plan & previous,
                                         const std::set<std::string> & completed,
                                         const std::set<std::string> & failed,
                                         const registry_snapshot & snapshot) {
    planning_result result;

    task_plan next;
    next.id = generate_uuid();
    next.objective_id = previous.objective_id;
    next.complexity = previous.complexity;
    next.created_at = get_timestamp_ms();
    next.deadline = previous.deadline;
    next.replaces_plan_id = previous.id;

    std::map<std::string, std::string> remap;
    for (const auto & unit : previous.units) {
        if (completed.count(unit.id) > 0) {
            continue;
        }
        task_unit copy = unit;
        size_t slash = unit.id.rfind('/');
        copy.id = next.id + "/" + (slash == std::string::npos ? unit.id : unit.id.substr(slash + 1));
        copy.plan_id = next.id;
        copy.preconditions.clear();
        if (failed.count(unit.id) > 0 && copy.description.rfind("retry: ", 0) != 0) {
            copy.description = "retry: " + copy.description;
        }
        remap[unit.id] = copy.id;
        next.units.push_back(std::move(copy));
    }

    if (next.units.empty()) {
        result.error = PLANNING_INVALID;
        result.message = "plan " + previous.id + " has no unfinished units to replan";
        return result;
    }

    for (const auto & e : previous.edges) {
        auto from = remap.find(e.from);
        auto to = remap.find(e.to);
        if (from != remap.end() && to != remap.end()) {
            next.edges.push_back({from->second, to->second, e.kind});
        }
    }
    for (auto & unit : next.units) {
        for (const auto & pred : next.predecessors(unit.id)) {
            unit.preconditions.push_back(pred + " completed");
        }
    }

    for (const auto & unit : next.units) {
        for (const auto & tag : unit.capabilities) {
            if (!snapshot.has_capability(tag)) {
                result.violations.push_back("no reachable agent offers '" + tag + "' for " + unit.id);
            }
        }
    }
    if (!result.violations.empty()) {
        result.error = PLANNING_INFEASIBLE;
        result.message = "replacement for plan " + previous.id + " cannot be staffed";
        return result;
    }

    next.estimated_duration_ms = next.critical_path_ms();
    assess_risk(next, previous.risk.complexity, 0.0, previous.risk.constraint_violations, snapshot);

    // Units that already failed once carry more risk
    for (auto & unit : next.units) {
        for (const auto & [old_id, new_id] : remap) {
            if (new_id == unit.id && failed.count(old_id) > 0) {
                unit.risk = std::min(1.0, unit.risk + 0.25);
                next.risk.unit_risk[unit.id] = unit.risk;
            }
        }
    }
    build_contingencies(next);

    LOG_INF("planner: plan %s replaces %s (%zu of %zu units left)\n",
            next.id.c_str(), previous.id.c_str(), next.units.size(), previous.units.size());

    result.plan = std::move(next);
    return result;
}

} // namespace coord
