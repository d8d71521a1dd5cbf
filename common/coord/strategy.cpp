#include "strategy.h"

#include <algorithm>
#include <cctype>

namespace coord {

const char * action_kind_to_string(action_kind kind) {
    switch (kind) {
        case ACTION_KIND_SEQUENTIAL: return "sequential";
        case ACTION_KIND_PARALLEL:   return "parallel";
        case ACTION_KIND_ADAPTIVE:   return "adaptive";
        default:                     return "sequential";
    }
}

bool action_kind_from_string(const std::string & str, action_kind & out) {
    if (str == "sequential") { out = ACTION_KIND_SEQUENTIAL; return true; }
    if (str == "parallel")   { out = ACTION_KIND_PARALLEL;   return true; }
    if (str == "adaptive")   { out = ACTION_KIND_ADAPTIVE;   return true; }
    return false;
}

std::string to_lower(const std::string & str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

strategy_catalog strategy_catalog::default_catalog() {
    strategy_catalog cat;

    cat.capability_rules = {
        {{"migrat", "write", "copy", "move", "file"}, "file-write"},
        {{"validat", "verify", "check", "test"},      "validate"},
        {{"analy", "inspect", "profil"},              "analyze"},
        {{"deploy", "release", "rollout"},            "deploy"},
    };
    cat.default_capability = "general";

    cat.complexity_keywords = {
        "migrat", "validat", "integrat", "analy", "distribut", "optimi",
        "coordinat", "refactor", "deploy", "orchestrat", "concurren", "secur",
    };

    cat.phase_templates[COMPLEXITY_SIMPLE]       = {"execute"};
    cat.phase_templates[COMPLEXITY_MODERATE]     = {"execute", "validate"};
    cat.phase_templates[COMPLEXITY_COMPLEX]      = {"prepare", "execute", "validate", "report"};
    cat.phase_templates[COMPLEXITY_VERY_COMPLEX] = {"analyze", "prepare", "execute", "integrate", "validate", "report"};

    cat.phase_capabilities = {
        {"validate", "validate"},
    };

    cat.phase_durations = {
        {"analyze",   2000},
        {"prepare",   1500},
        {"execute",   3000},
        {"integrate", 2000},
        {"validate",  1500},
        {"report",     500},
    };

    cat.optional_phases = {"report"};
    cat.fan_out_phase = "execute";
    cat.max_fan_out = 16;

    cat.actions = {
        {ACTION_KIND_SEQUENTIAL, {
            {"step-by-step", "sequential.step",       {}, 0.85, 1.0},
            {"checkpointed", "sequential.checkpoint", {}, 0.90, 1.3},
        }},
        {ACTION_KIND_PARALLEL, {
            {"fan-out", "parallel.fanout", {}, 0.80, 0.7},
            {"batched", "parallel.batch",  {}, 0.82, 0.85},
        }},
        {ACTION_KIND_ADAPTIVE, {
            {"probe-then-commit", "adaptive.probe",    {}, 0.75, 1.2},
            {"fallback-chain",    "adaptive.fallback", {}, 0.70, 1.5},
        }},
    };

    return cat;
}

std::string strategy_catalog::capability_for(const std::string & text) const {
    std::string lower = to_lower(text);
    for (const auto & rule : capability_rules) {
        for (const auto & kw : rule.keywords) {
            if (lower.find(kw) != std::string::npos) {
                return rule.capability;
            }
        }
    }
    return default_capability;
}

std::string strategy_catalog::capability_for_phase(const std::string & phase, const std::string & primary) const {
    auto it = phase_capabilities.find(phase);
    if (it != phase_capabilities.end()) {
        return it->second;
    }
    return primary;
}

int64_t strategy_catalog::duration_for_phase(const std::string & phase) const {
    auto it = phase_durations.find(phase);
    if (it != phase_durations.end()) {
        return it->second;
    }
    return 1000;
}

int64_t strategy_catalog::timeout_for(int64_t duration_ms) const {
    if (duration_ms <= 0 || timeout_factor <= 0.0) {
        return 0;
    }
    return static_cast<int64_t>(static_cast<double>(duration_ms) * timeout_factor);
}

const action_entry * strategy_catalog::find_action(action_kind kind) const {
    for (const auto & entry : actions) {
        if (entry.kind == kind) {
            return &entry;
        }
    }
    return nullptr;
}

json strategy_catalog::to_json() const {
    json j;

    j["capability_rules"] = json::array();
    for (const auto & rule : capability_rules) {
        j["capability_rules"].push_back({{"keywords", rule.keywords}, {"capability", rule.capability}});
    }
    j["default_capability"] = default_capability;
    j["complexity_keywords"] = complexity_keywords;

    j["phase_templates"] = json::object();
    for (const auto & [cls, phases] : phase_templates) {
        j["phase_templates"][complexity_to_string(cls)] = phases;
    }
    j["phase_capabilities"] = phase_capabilities;
    j["phase_durations"] = phase_durations;
    j["timeout_factor"] = timeout_factor;
    j["optional_phases"] = optional_phases;
    j["fan_out_phase"] = fan_out_phase;
    j["max_fan_out"] = max_fan_out;

    j["actions"] = json::array();
    for (const auto & entry : actions) {
        json variants = json::array();
        for (const auto & v : entry.variants) {
            variants.push_back({
                {"id", v.id},
                {"pattern_id", v.pattern_id},
                {"required_capabilities", v.required_capabilities},
                {"base_success", v.base_success},
                {"relative_cost", v.relative_cost}
            });
        }
        j["actions"].push_back({{"kind", action_kind_to_string(entry.kind)}, {"variants", variants}});
    }

    j["weights"] = {
        {"keyword", weights.keyword},
        {"length", weights.length},
        {"quantity", weights.quantity},
        {"constraint", weights.constraint},
        {"sub_objective", weights.sub_objective},
        {"deadline", weights.deadline},
        {"tight_deadline_ms", weights.tight_deadline_ms},
        {"moderate_threshold", weights.moderate_threshold},
        {"complex_threshold", weights.complex_threshold},
        {"very_complex_threshold", weights.very_complex_threshold},
        {"risk_complexity", weights.risk_complexity},
        {"risk_constraints", weights.risk_constraints},
        {"risk_scarcity", weights.risk_scarcity},
        {"history_bias", weights.history_bias},
        {"deadline_fit_floor", weights.deadline_fit_floor}
    };

    return j;
}

bool strategy_catalog::apply_json(const json & j, std::string * error) {
    if (!j.is_object()) {
        if (error) *error = "catalog override must be an object";
        return false;
    }

    // Work on a copy so a bad section leaves the catalog untouched
    strategy_catalog next = *this;

    try {
        if (j.contains("capability_rules")) {
            next.capability_rules.clear();
            for (const auto & r : j.at("capability_rules")) {
                capability_rule rule;
                rule.keywords = r.at("keywords").get<std::vector<std::string>>();
                rule.capability = r.at("capability").get<std::string>();
                next.capability_rules.push_back(rule);
            }
        }
        next.default_capability = j.value("default_capability", next.default_capability);
        if (j.contains("complexity_keywords")) {
            next.complexity_keywords = j.at("complexity_keywords").get<std::vector<std::string>>();
        }

        if (j.contains("phase_templates")) {
            for (const auto & [name, phases] : j.at("phase_templates").items()) {
                complexity_class cls;
                if (!complexity_from_string(name, cls)) {
                    if (error) *error = "unknown complexity class '" + name + "'";
                    return false;
                }
                next.phase_templates[cls] = phases.get<std::vector<std::string>>();
                if (next.phase_templates[cls].empty()) {
                    if (error) *error = "phase template '" + name + "' is empty";
                    return false;
                }
            }
        }
        if (j.contains("phase_capabilities")) {
            next.phase_capabilities = j.at("phase_capabilities").get<std::map<std::string, std::string>>();
        }
        if (j.contains("phase_durations")) {
            for (const auto & [phase, ms] : j.at("phase_durations").items()) {
                next.phase_durations[phase] = ms.get<int64_t>();
            }
        }
        if (j.contains("optional_phases")) {
            next.optional_phases = j.at("optional_phases").get<std::set<std::string>>();
        }
        next.fan_out_phase = j.value("fan_out_phase", next.fan_out_phase);
        next.max_fan_out = std::max(1, j.value("max_fan_out", next.max_fan_out));
        next.timeout_factor = std::max(0.0, j.value("timeout_factor", next.timeout_factor));

        if (j.contains("actions")) {
            next.actions.clear();
            for (const auto & a : j.at("actions")) {
                action_entry entry;
                std::string kind = a.at("kind").get<std::string>();
                if (!action_kind_from_string(kind, entry.kind)) {
                    if (error) *error = "unknown action kind '" + kind + "'";
                    return false;
                }
                for (const auto & v : a.at("variants")) {
                    action_variant variant;
                    variant.id = v.at("id").get<std::string>();
                    variant.pattern_id = v.value("pattern_id", variant.id);
                    variant.required_capabilities = v.value("required_capabilities", std::vector<std::string>());
                    variant.base_success = v.value("base_success", 0.8);
                    variant.relative_cost = v.value("relative_cost", 1.0);
                    entry.variants.push_back(variant);
                }
                next.actions.push_back(entry);
            }
        }

        if (j.contains("weights")) {
            const json & w = j.at("weights");
            auto & nw = next.weights;
            nw.keyword = w.value("keyword", nw.keyword);
            nw.length = w.value("length", nw.length);
            nw.quantity = w.value("quantity", nw.quantity);
            nw.constraint = w.value("constraint", nw.constraint);
            nw.sub_objective = w.value("sub_objective", nw.sub_objective);
            nw.deadline = w.value("deadline", nw.deadline);
            nw.tight_deadline_ms = w.value("tight_deadline_ms", nw.tight_deadline_ms);
            nw.moderate_threshold = w.value("moderate_threshold", nw.moderate_threshold);
            nw.complex_threshold = w.value("complex_threshold", nw.complex_threshold);
            nw.very_complex_threshold = w.value("very_complex_threshold", nw.very_complex_threshold);
            nw.risk_complexity = w.value("risk_complexity", nw.risk_complexity);
            nw.risk_constraints = w.value("risk_constraints", nw.risk_constraints);
            nw.risk_scarcity = w.value("risk_scarcity", nw.risk_scarcity);
            nw.history_bias = w.value("history_bias", nw.history_bias);
            nw.deadline_fit_floor = w.value("deadline_fit_floor", nw.deadline_fit_floor);
        }
    } catch (const json::exception & e) {
        if (error) *error = std::string("malformed catalog override: ") + e.what();
        return false;
    }

    *this = std::move(next);
    return true;
}

} // namespace coord
