// Tests for the agent registry

#include "coord/registry.h"
#include "log.h"
#include "testing.h"

#include <atomic>
#include <vector>

using namespace coord;

static agent_instance make_agent(const std::string & id,
                                 std::vector<agent_capability> caps,
                                 int capacity = 1) {
    agent_instance agent;
    agent.id = id;
    agent.name = id;
    agent.capabilities = std::move(caps);
    agent.capacity = capacity;
    return agent;
}

static bool test_register_and_lookup() {
    agent_registry registry;
    TEST_ASSERT(registry.register_agent(make_agent("a1", {{"file-write", 0.9}})), "register a1");
    TEST_ASSERT(!registry.register_agent(make_agent("a1", {{"validate", 0.5}})), "duplicate id refused");
    TEST_ASSERT(!registry.register_agent(make_agent("", {{"validate", 0.5}})), "empty id refused");
    TEST_ASSERT(registry.size() == 1, "one agent");

    auto agent = registry.get_agent("a1");
    TEST_ASSERT(agent.has_value(), "a1 found");
    TEST_ASSERT(agent->status == AGENT_STATUS_AVAILABLE, "new agent available");
    TEST_ASSERT(agent->confidence_for("file-write") == 0.9, "confidence kept");
    TEST_ASSERT(agent->confidence_for("deploy") == 0.0, "missing tag has zero confidence");
    TEST_ASSERT(!registry.get_agent("nope").has_value(), "unknown id");

    TEST_ASSERT(registry.unregister_agent("a1"), "unregistered");
    TEST_ASSERT(!registry.unregister_agent("a1"), "second unregister refused");
    TEST_ASSERT(registry.size() == 0, "empty");
    return true;
}

static bool test_find_agents() {
    agent_registry registry;
    registry.register_agent(make_agent("writer", {{"file-write", 0.9}}));
    registry.register_agent(make_agent("both", {{"file-write", 0.7}, {"validate", 0.8}}));
    registry.register_agent(make_agent("checker", {{"validate", 0.95}}));

    agent_query all_of;
    all_of.capabilities = {"file-write", "validate"};
    auto found = registry.find_agents(all_of);
    TEST_ASSERT(found.size() == 1 && found[0].id == "both", "AND query");

    agent_query any_of = all_of;
    any_of.require_all_capabilities = false;
    TEST_ASSERT(registry.find_agents(any_of).size() == 3, "OR query");

    agent_query none;
    TEST_ASSERT(registry.find_agents(none).size() == 3, "empty query matches every agent");

    registry.mark_unreachable("writer");
    agent_query writers;
    writers.capabilities = {"file-write"};
    found = registry.find_agents(writers);
    TEST_ASSERT(found.size() == 1 && found[0].id == "both", "unreachable agent excluded");

    writers.include_unavailable = true;
    TEST_ASSERT(registry.find_agents(writers).size() == 2, "included on request");
    return true;
}

static bool test_slots_drive_busy() {
    agent_registry registry;
    registry.register_agent(make_agent("a", {{"general", 1.0}}, 2));

    TEST_ASSERT(registry.acquire_slot("a"), "first slot");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_AVAILABLE, "still available");
    TEST_ASSERT(registry.acquire_slot("a"), "second slot");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_BUSY, "busy at capacity");
    TEST_ASSERT(!registry.acquire_slot("a"), "no third slot");

    TEST_ASSERT(registry.release_slot("a"), "release");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_AVAILABLE, "available again");
    TEST_ASSERT(registry.release_slot("a"), "release second");
    TEST_ASSERT(!registry.release_slot("a"), "nothing left to release");
    TEST_ASSERT(registry.get_agent("a")->active_tasks == 0, "no active tasks");
    return true;
}

static bool test_heartbeat_sweep() {
    agent_registry registry(100, 3);
    registry.register_agent(make_agent("a", {{"general", 1.0}}));
    registry.register_agent(make_agent("b", {{"general", 1.0}}));

    int64_t base = get_timestamp_ms();
    registry.heartbeat("a", 0.2, base);
    registry.heartbeat("b", 0.4, base);

    TEST_ASSERT(registry.sweep_heartbeats(base + 150).empty(), "one miss tolerated");
    TEST_ASSERT(registry.get_agent("a")->missed_heartbeats == 1, "miss counted");

    registry.heartbeat("b", 0.5, base + 250);
    auto lost = registry.sweep_heartbeats(base + 320);
    TEST_ASSERT(lost.size() == 1 && lost[0] == "a", "a lost after three missed intervals");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_UNREACHABLE, "a unreachable");
    TEST_ASSERT(registry.get_agent("b")->status == AGENT_STATUS_AVAILABLE, "b still fine");
    TEST_ASSERT(registry.get_agent("b")->load == 0.5, "load from heartbeat");

    TEST_ASSERT(registry.sweep_heartbeats(base + 400).empty(), "already lost agents not reported again");

    TEST_ASSERT(registry.heartbeat("a", 0.1, base + 500), "late heartbeat accepted");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_AVAILABLE, "agent recovers");
    TEST_ASSERT(!registry.heartbeat("ghost", 0.1), "unknown agent heartbeat refused");
    return true;
}

static bool test_draining() {
    agent_registry registry;
    registry.register_agent(make_agent("a", {{"general", 1.0}}, 2));
    registry.acquire_slot("a");

    TEST_ASSERT(registry.set_draining("a", true), "drain");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_DRAINING, "draining");
    TEST_ASSERT(!registry.acquire_slot("a"), "draining agent takes nothing new");
    TEST_ASSERT(registry.release_slot("a"), "existing work finishes");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_DRAINING, "still draining");

    TEST_ASSERT(registry.set_draining("a", false), "undrain");
    TEST_ASSERT(registry.get_agent("a")->status == AGENT_STATUS_AVAILABLE, "available");

    registry.mark_unreachable("a");
    TEST_ASSERT(!registry.set_draining("a", true), "unreachable agent cannot drain");
    return true;
}

static bool test_snapshot_versions() {
    agent_registry registry;
    registry.register_agent(make_agent("b", {{"validate", 0.9}}));
    registry.register_agent(make_agent("a", {{"file-write", 0.9}}));

    registry_snapshot snap = registry.snapshot();
    TEST_ASSERT(snap.agents.size() == 2, "two agents");
    TEST_ASSERT(snap.agents[0].id == "a", "sorted by id");
    TEST_ASSERT(snap.find("b") != nullptr, "find by id");
    TEST_ASSERT(snap.has_capability("validate"), "capability present");

    uint64_t before = registry.version();
    registry.mark_unreachable("b");
    TEST_ASSERT(registry.version() > before, "mutation bumps version");
    TEST_ASSERT(snap.find("b")->status == AGENT_STATUS_AVAILABLE, "old snapshot unchanged");
    TEST_ASSERT(!registry.snapshot().has_capability("validate"), "unreachable agents offer nothing");

    auto stats = registry.get_stats();
    TEST_ASSERT(stats.total_agents == 2 && stats.unreachable_agents == 1, "stats");
    TEST_ASSERT(registry.to_json()["agents"].size() == 2, "json listing");
    return true;
}

static bool test_concurrent_slots() {
    agent_registry registry;
    registry.register_agent(make_agent("a", {{"general", 1.0}}, 5));

    std::atomic<int> acquired{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]() {
            for (int k = 0; k < 10; k++) {
                if (registry.acquire_slot("a")) {
                    acquired++;
                }
            }
        });
    }
    for (auto & t : threads) {
        t.join();
    }
    TEST_ASSERT(acquired == 5, "never more slots than capacity");
    TEST_ASSERT(registry.get_agent("a")->active_tasks == 5, "active tasks at capacity");
    return true;
}

int main() {
    std::cout << "=== Agent Registry Tests ===" << std::endl << std::endl;
    coord_log_set_verbosity(COORD_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_register_and_lookup);
    RUN_TEST(test_find_agents);
    RUN_TEST(test_slots_drive_busy);
    RUN_TEST(test_heartbeat_sweep);
    RUN_TEST(test_draining);
    RUN_TEST(test_snapshot_versions);
    RUN_TEST(test_concurrent_slots);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
