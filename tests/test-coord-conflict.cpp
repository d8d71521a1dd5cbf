// Tests for conflict classification and resolution

#include "coord/conflict.h"
#include "log.h"
#include "testing.h"

#include <atomic>
#include <cmath>
#include <memory>
#include <vector>

using namespace coord;

struct voter {
    message_bus & bus;
    consensus_participant participant;
    std::atomic<bool> drop{false};

    voter(message_bus & bus, const std::string & id) : bus(bus), participant(id) {
        bus.subscribe(id, [this](const agent_message & msg) {
            auto reply = participant.handle(msg);
            if (reply && !drop) {
                this->bus.send(reply->recipients.front(), *reply, 200);
            }
            return true;
        });
    }
};

struct voting_setup {
    message_bus bus;
    resilience_guard guard;
    std::vector<std::unique_ptr<voter>> voters;
    std::unique_ptr<consensus_coordinator> consensus;

    explicit voting_setup(const std::vector<std::string> & ids, int64_t phase_timeout_ms = 500) {
        for (const auto & id : ids) {
            voters.push_back(std::make_unique<voter>(bus, id));
        }
        retry_policy policy = retry_policy::default_policy();
        policy.max_attempts = 1;
        consensus = std::make_unique<consensus_coordinator>(bus, guard, "coordinator", phase_timeout_ms, policy);
        bus.start();
    }

    ~voting_setup() {
        bus.stop();
    }
};

static bool test_classify() {
    conflict_resolver resolver;

    TEST_ASSERT(resolver.classify("task/x", {{"a", 1, 1}}) == CONFLICT_SEVERITY_LOW, "single report");
    TEST_ASSERT(resolver.classify("task/x", {{"a", 1, 1}, {"b", 1, 2}}) == CONFLICT_SEVERITY_LOW, "agreement");
    TEST_ASSERT(resolver.classify("task/x", {{"a", 1, 1}, {"b", 2, 2}}) == CONFLICT_SEVERITY_LOW, "scalar disagreement");
    TEST_ASSERT(resolver.classify("task/x", {{"a", json{{"k", 1}}, 1}, {"b", json{{"k", 2}}, 2}}) == CONFLICT_SEVERITY_MEDIUM,
                "structured disagreement");
    TEST_ASSERT(resolver.classify("plan", {{"a", 1, 1}, {"b", 2, 2}}) == CONFLICT_SEVERITY_HIGH, "critical domain");

    resolver.set_critical_domains({"budget"});
    TEST_ASSERT(resolver.classify("budget", {{"a", 1, 1}, {"b", 2, 2}}) == CONFLICT_SEVERITY_HIGH, "custom critical domain");
    TEST_ASSERT(resolver.classify("plan", {{"a", 1, 1}, {"b", 2, 2}}) == CONFLICT_SEVERITY_LOW, "plan no longer critical");

    conflict c = resolver.make_conflict("task/x", {{"a", 1, 1}, {"b", 2, 2}});
    TEST_ASSERT(!c.id.empty() && c.timestamp > 0, "fresh conflict");
    TEST_ASSERT(c.severity == CONFLICT_SEVERITY_LOW, "classified on creation");
    return true;
}

static bool test_last_writer_wins() {
    conflict_resolver resolver;

    conflict c = resolver.make_conflict("status", {
        {"agent-b", "done", 100},
        {"agent-a", "failed", 300},
        {"agent-c", "done", 200},
    });
    resolution res = resolver.resolve(c);
    TEST_ASSERT(res.strategy == RESOLUTION_LAST_WRITER_WINS, "low severity strategy");
    TEST_ASSERT(res.value == "failed", "newest report wins");
    TEST_ASSERT(std::abs(res.confidence - 1.0 / 3.0) < 1e-9, "confidence is the agreeing share");
    TEST_ASSERT(res.conflict_id == c.id, "linked to the conflict");

    conflict tie = resolver.make_conflict("status", {
        {"agent-z", "z", 500},
        {"agent-m", "m", 500},
    });
    TEST_ASSERT(resolver.resolve(tie).value == "m", "equal timestamps go to the lowest agent id");
    return true;
}

static bool test_merge_without_consensus() {
    conflict_resolver resolver;

    conflict c = resolver.make_conflict("task/write-1", {
        {"writer-1", json{{"path", "/a"}, {"bytes", 10}}, 100},
        {"writer-2", json{{"path", "/a"}, {"bytes", 12}, {"checksum", "ff"}}, 200},
    });
    TEST_ASSERT(c.severity == CONFLICT_SEVERITY_MEDIUM, "medium severity");

    resolution res = resolver.resolve(c);
    TEST_ASSERT(res.strategy == RESOLUTION_MERGE, "merged");
    TEST_ASSERT(res.value["path"] == "/a", "agreeing field kept");
    TEST_ASSERT(res.value["checksum"] == "ff", "one-sided field kept");
    TEST_ASSERT(res.value["bytes"] == 12, "overlap falls back to the newest writer");
    TEST_ASSERT(res.escalated_fields == std::vector<std::string>{"bytes"}, "overlap escalated");
    TEST_ASSERT(res.confidence > 0.0 && res.confidence < 1.0, "partial confidence");
    TEST_ASSERT(std::abs(res.confidence - 2.5 / 3.0) < 1e-9, "agreed fields weigh more");
    return true;
}

// One agent says the upstream write succeeded, another that it failed
static bool test_completion_reports_disagree() {
    conflict_resolver resolver;

    conflict c = resolver.make_conflict("task/write-2", {
        {"writer-2", json{{"status", "completed"}, {"output", "3 files"}}, 100},
        {"validator", json{{"status", "failed"}, {"output", "checksum mismatch"}}, 150},
    });
    TEST_ASSERT(c.severity == CONFLICT_SEVERITY_MEDIUM, "medium severity");

    resolution res = resolver.resolve(c);
    TEST_ASSERT(res.strategy == RESOLUTION_MERGE, "merged");
    TEST_ASSERT(res.confidence > 0.0, "positive confidence");
    TEST_ASSERT(res.value["status"] == "failed", "newest report on the disputed field");
    TEST_ASSERT(res.escalated_fields.size() == 2, "both fields disputed");
    return true;
}

static bool test_merge_with_consensus() {
    voting_setup setup({"writer-1", "writer-2", "validator"});
    conflict_resolver resolver(nullptr, setup.consensus.get());

    conflict c = resolver.make_conflict("task/write-1", {
        {"writer-1", json{{"bytes", 10}}, 100},
        {"writer-2", json{{"bytes", 12}}, 200},
    });
    resolution res = resolver.resolve(c, {"writer-1", "writer-2", "validator"});
    TEST_ASSERT(res.strategy == RESOLUTION_MERGE, "merged");
    TEST_ASSERT(res.value["bytes"] == 12, "newest candidate committed first");
    TEST_ASSERT(res.rationale.find("consensus") != std::string::npos, "rationale names the escalation");
    TEST_ASSERT(setup.consensus->results().size() == 1, "one round held");
    return true;
}

static bool test_high_severity_consensus() {
    voting_setup setup({"a", "b", "c"});
    conflict_resolver resolver(nullptr, setup.consensus.get());

    conflict c = resolver.make_conflict("plan", {
        {"a", "plan-1", 100},
        {"b", "plan-2", 200},
        {"c", "plan-2", 150},
    });
    TEST_ASSERT(c.severity == CONFLICT_SEVERITY_HIGH, "plan disagreements are critical");

    resolution res = resolver.resolve(c);
    TEST_ASSERT(res.strategy == RESOLUTION_CONSENSUS, "consensus strategy");
    TEST_ASSERT(res.value == "plan-2", "committed value");
    TEST_ASSERT(res.confidence > 0.5, "quorum confidence");
    return true;
}

static bool test_high_severity_without_quorum() {
    voting_setup setup({"a", "b", "c"}, 100);
    setup.voters[1]->drop = true;
    setup.voters[2]->drop = true;
    conflict_resolver resolver(nullptr, setup.consensus.get());

    conflict c = resolver.make_conflict("plan", {
        {"a", "plan-1", 100},
        {"b", "plan-2", 200},
    });
    resolution res = resolver.resolve(c, {"a", "b", "c"});
    TEST_ASSERT(res.strategy == RESOLUTION_LAST_WRITER_WINS, "falls back to the newest report");
    TEST_ASSERT(res.value == "plan-2", "newest value");
    TEST_ASSERT(std::abs(res.confidence - 0.25) < 1e-9, "fallback confidence halved");
    TEST_ASSERT(setup.consensus->results().size() == 2, "every candidate was tried");
    return true;
}

static bool test_resolved_once() {
    memory_knowledge_store store;
    conflict_resolver resolver(&store);

    conflict c = resolver.make_conflict("status", {{"a", 1, 100}, {"b", 2, 200}});
    resolution first = resolver.resolve(c);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    resolution second = resolver.resolve(c);

    TEST_ASSERT(first.timestamp == second.timestamp, "same recorded resolution");
    TEST_ASSERT(first.value == second.value, "same value");
    TEST_ASSERT(resolver.get_log().size() == 1, "logged once");
    TEST_ASSERT(resolver.get_resolution(c.id).has_value(), "lookup by conflict id");
    TEST_ASSERT(!resolver.get_resolution("unknown").has_value(), "unknown conflict");

    knowledge_entry entry;
    TEST_ASSERT(store.get("resolution/" + c.id, entry), "resolution stored");
    TEST_ASSERT(json::parse(entry.value)["value"] == 2, "stored value");
    return true;
}

static bool test_store_down() {
    memory_knowledge_store store;
    store.set_available(false);
    conflict_resolver resolver(&store);

    conflict c = resolver.make_conflict("status", {{"a", 1, 100}, {"b", 2, 200}});
    resolution res = resolver.resolve(c);
    TEST_ASSERT(res.value == 2, "resolution unaffected by the store");
    TEST_ASSERT(resolver.get_log().size() == 1, "still logged");
    return true;
}

int main() {
    std::cout << "=== Conflict Resolution Tests ===" << std::endl << std::endl;
    coord_log_set_verbosity(COORD_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_classify);
    RUN_TEST(test_last_writer_wins);
    RUN_TEST(test_merge_without_consensus);
    RUN_TEST(test_completion_reports_disagree);
    RUN_TEST(test_merge_with_consensus);
    RUN_TEST(test_high_severity_consensus);
    RUN_TEST(test_high_severity_without_quorum);
    RUN_TEST(test_resolved_once);
    RUN_TEST(test_store_down);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
