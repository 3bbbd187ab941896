#include <unity.h>

#include <memory>

#include "engine.hpp"
#include "../MockLanternStore.h"
#include "../MockRoundGate.h"
#include "../MockSyncClient.h"
#include "../ScriptedRandom.h"

using namespace lantern;

static std::shared_ptr<MockLanternStore> store;
static std::shared_ptr<MockRoundGate> rounds;
static std::shared_ptr<MockSyncClient> syncClient;

static std::unique_ptr<LanternEngine> makeEngine(int decayMs = 0) {
	EngineParts parts;
	parts.store = store;
	parts.rounds = rounds;
	parts.sync = syncClient;
	parts.random = std::make_shared<ScriptedRandom>();
	parts.decayIntervalMs = decayMs;
	return std::make_unique<LanternEngine>(parts);
}

void setUp(void) {
	store = std::make_shared<MockLanternStore>();
	rounds = std::make_shared<MockRoundGate>();
	syncClient = std::make_shared<MockSyncClient>();
	store->addStation(1, 100, true);
	store->addStation(2, 120, false);
	store->addStation(3, 80, true);
	store->candidates[1] = {{1, "alice", {"abcde"}}, {1, "bob", {"zzzzz"}}};
}

void tearDown(void) {}

void test_overview_without_round_hides_stations(void) {
	rounds->active = false;
	auto engine = makeEngine();

	Overview o = engine->overview();
	json j = o;

	TEST_ASSERT_FALSE(o.round.isActive);
	TEST_ASSERT_FALSE(j.contains("activeStations"));
	TEST_ASSERT_FALSE(j.contains("inactiveStations"));
}

void test_overview_splits_stations_by_activity(void) {
	auto engine = makeEngine();

	Overview o = engine->overview();

	TEST_ASSERT_TRUE(o.stationsIncluded);
	TEST_ASSERT_EQUAL(2, o.activeStations.size());
	TEST_ASSERT_EQUAL(1, o.inactiveStations.size());
	TEST_ASSERT_EQUAL_INT(2, o.inactiveStations[0].stationId);
}

void test_hack_flow_through_facade(void) {
	auto engine = makeEngine();

	HackPayload p = engine->getOrCreateSession("neo", 1);
	TEST_ASSERT_EQUAL_STRING("alice", p.userName.c_str());

	AttemptResult miss = engine->attempt("neo", "abxxx", false);
	TEST_ASSERT_EQUAL_INT(3, miss.triesLeft);
	TEST_ASSERT_EQUAL_INT(2, *miss.matches);

	AttemptResult hit = engine->attempt("neo", "abcde", false);
	TEST_ASSERT_TRUE(hit.success);
	TEST_ASSERT_EQUAL_INT(90, store->valueOf(1));

	json j = hit;
	TEST_ASSERT_TRUE(j["success"].get<bool>());
	TEST_ASSERT_FALSE(j["boosting"].get<bool>());
}

void test_disabled_decay_does_not_start(void) {
	auto engine = makeEngine(0);
	engine->start();
	TEST_ASSERT_FALSE(engine->decay()->running());
	engine->stop();
}

void test_decay_runs_until_stopped(void) {
	auto engine = makeEngine(60000);
	engine->start();
	TEST_ASSERT_TRUE(engine->decay()->running());
	engine->stop();
	TEST_ASSERT_FALSE(engine->decay()->running());
}

int main(void) {
	UNITY_BEGIN();

	RUN_TEST(test_overview_without_round_hides_stations);
	RUN_TEST(test_overview_splits_stations_by_activity);
	RUN_TEST(test_hack_flow_through_facade);
	RUN_TEST(test_disabled_decay_does_not_start);
	RUN_TEST(test_decay_runs_until_stopped);

	return UNITY_END();
}
