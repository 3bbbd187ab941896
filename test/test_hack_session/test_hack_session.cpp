#include <unity.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "hack_session.hpp"
#include "../MockLanternStore.h"
#include "../MockRoundGate.h"
#include "../MockSyncClient.h"
#include "../ScriptedRandom.h"

using namespace lantern;

static std::shared_ptr<MockLanternStore> store;
static std::shared_ptr<MockSyncClient> syncClient;
static std::shared_ptr<MockRoundGate> rounds;
static std::shared_ptr<ScriptedRandom> rng;
static std::shared_ptr<SignalController> signals;

// --- Helpers ---
static std::unique_ptr<HackSessionManager> makeManager(int tries = 4, int decoys = 13) {
	SessionSettings settings;
	settings.triesBudget = tries;
	settings.decoyPasswordCount = decoys;
	return std::make_unique<HackSessionManager>(store, signals, rng, settings);
}

static void expectError(ErrorKind kind, const std::function<void()> &fn) {
	try {
		fn();
		TEST_FAIL_MESSAGE("expected EngineError");
	} catch (const EngineError &e) {
		TEST_ASSERT_EQUAL(kind, e.kind());
	}
}

void setUp(void) {
	store = std::make_shared<MockLanternStore>();
	syncClient = std::make_shared<MockSyncClient>();
	rounds = std::make_shared<MockRoundGate>();
	rng = std::make_shared<ScriptedRandom>();
	signals = std::make_shared<SignalController>(store, syncClient, rounds);

	store->addStation(5, 100);
	store->addStation(6, 100);
	store->candidates[5] = {
		{5, "alice", {"abcde"}},
		{5, "bob", {"zzzzz"}},
		{5, "carol", {"qwert"}},
	};
	store->candidates[6] = {
		{6, "dave", {"lmnop"}},
		{6, "erin", {"vwxyz"}},
	};
	for (int i = 0; i < 20; ++i) store->filler.push_back("f" + std::to_string(i));
}

void tearDown(void) {}

// ============================================================================
// SESSION LIFECYCLE
// ============================================================================

void test_new_session_payload(void) {
	auto manager = makeManager();

	HackPayload p = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL(SessionTransition::Created, p.transition);
	TEST_ASSERT_EQUAL_INT(5, p.stationId);
	TEST_ASSERT_EQUAL_INT(4, p.triesLeft);
	TEST_ASSERT_EQUAL_STRING("alice", p.userName.c_str());
	TEST_ASSERT_EQUAL_INT(4, p.hint.index);
	TEST_ASSERT_EQUAL_STRING("e", p.hint.character.c_str());
	TEST_ASSERT_EQUAL(15, p.passwords.size());
	TEST_ASSERT_EQUAL_STRING("f0", p.passwords[0].c_str());
	TEST_ASSERT_EQUAL_STRING("abcde", p.passwords[13].c_str());
	TEST_ASSERT_EQUAL_STRING("zzzzz", p.passwords[14].c_str());

	auto stored = store->sessions.at("neo");
	TEST_ASSERT_EQUAL(2, stored.gameUsers.size());
	int correct = 0;
	for (auto &u : stored.gameUsers) correct += u.isCorrect ? 1 : 0;
	TEST_ASSERT_EQUAL_INT(1, correct);
}

void test_first_drawn_candidate_is_correct(void) {
	// Swap the last candidate to the front on the first shuffle step.
	rng->script = {0};
	auto manager = makeManager();

	HackPayload p = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL_STRING("carol", p.userName.c_str());
	const HackUser *correct = store->sessions.at("neo").correctUser();
	TEST_ASSERT_NOT_NULL(correct);
	TEST_ASSERT_EQUAL_STRING("qwert", correct->password.c_str());
}

void test_session_reuse_keeps_tries_and_hint(void) {
	auto manager = makeManager();
	HackPayload first = manager->getOrCreateSession("neo", 5);
	rng->script = {0, 0, 0};
	HackPayload second = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL(SessionTransition::Reused, second.transition);
	TEST_ASSERT_EQUAL_INT(first.triesLeft, second.triesLeft);
	TEST_ASSERT_EQUAL_STRING(first.userName.c_str(), second.userName.c_str());
	TEST_ASSERT_EQUAL_INT(first.hint.index, second.hint.index);
	TEST_ASSERT_EQUAL_INT(1, store->upsertSessionCalls);
}

void test_station_switch_regenerates(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);
	manager->attempt("neo", "wrong", true);
	TEST_ASSERT_EQUAL_INT(3, store->sessions.at("neo").triesLeft);

	HackPayload p = manager->getOrCreateSession("neo", 6);

	TEST_ASSERT_EQUAL(SessionTransition::Superseded, p.transition);
	TEST_ASSERT_EQUAL_INT(4, p.triesLeft);
	TEST_ASSERT_EQUAL_STRING("dave", p.userName.c_str());
	TEST_ASSERT_EQUAL_INT(6, store->sessions.at("neo").stationId);
}

void test_station_without_candidates_is_not_found(void) {
	store->addStation(9, 100);
	auto manager = makeManager();
	expectError(ErrorKind::NotFound, [&]() { manager->getOrCreateSession("neo", 9); });
	TEST_ASSERT_EQUAL(0, store->sessions.count("neo"));
}

void test_single_candidate_station(void) {
	store->candidates[7] = {{7, "solo", {"only1"}}};
	auto manager = makeManager();

	HackPayload p = manager->getOrCreateSession("neo", 7);

	TEST_ASSERT_EQUAL_STRING("solo", p.userName.c_str());
	TEST_ASSERT_EQUAL(14, p.passwords.size());
	TEST_ASSERT_EQUAL(1, store->sessions.at("neo").gameUsers.size());
}

void test_candidate_without_passwords_is_invalid(void) {
	store->candidates[8] = {{8, "empty", {}}};
	auto manager = makeManager();
	expectError(ErrorKind::InvalidData, [&]() { manager->getOrCreateSession("neo", 8); });
}

void test_small_filler_pool_is_used_whole(void) {
	store->filler = {"x1", "x2"};
	auto manager = makeManager();

	HackPayload p = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL(4, p.passwords.size());
}

void test_decoy_duplicates_are_kept(void) {
	store->filler = {"abcde", "f1"};
	auto manager = makeManager();

	HackPayload p = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL(2, std::count(p.passwords.begin(), p.passwords.end(), std::string("abcde")));
}

void test_invalid_session_request(void) {
	auto manager = makeManager();
	expectError(ErrorKind::InvalidData, [&]() { manager->getOrCreateSession("", 5); });
	expectError(ErrorKind::InvalidData, [&]() { manager->getOrCreateSession("neo", 0); });
	expectError(ErrorKind::InvalidData, [&]() { manager->getOrCreateSession("neo", -3); });
}

void test_payload_json_hides_incorrect_candidate(void) {
	auto manager = makeManager();
	json j = manager->getOrCreateSession("neo", 5);

	TEST_ASSERT_EQUAL_STRING("alice", j["userName"].get<std::string>().c_str());
	TEST_ASSERT_EQUAL_STRING("e", j["passwordHint"]["character"].get<std::string>().c_str());
	TEST_ASSERT_FALSE(j.dump().find("bob") != std::string::npos);
}

// ============================================================================
// ATTEMPTS
// ============================================================================

void test_correct_guess_adjusts_and_ends_session(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);

	AttemptResult r = manager->attempt("neo", "ABCDE", true);

	TEST_ASSERT_TRUE(r.success);
	TEST_ASSERT_TRUE(r.boosting);
	TEST_ASSERT_EQUAL_INT(110, store->valueOf(5));
	TEST_ASSERT_EQUAL(0, store->sessions.count("neo"));
	TEST_ASSERT_EQUAL(1, syncClient->count());
}

void test_wrong_guess_reports_matches(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);

	AttemptResult r = manager->attempt("neo", "axcye", false);

	TEST_ASSERT_FALSE(r.success);
	TEST_ASSERT_EQUAL_INT(3, r.triesLeft);
	TEST_ASSERT_TRUE(r.matches.has_value());
	TEST_ASSERT_EQUAL_INT(3, *r.matches);
	TEST_ASSERT_EQUAL_INT(100, store->valueOf(5));
}

void test_exhaustion_with_budget_two(void) {
	auto manager = makeManager(2);
	manager->getOrCreateSession("neo", 5);

	AttemptResult first = manager->attempt("neo", "nope", true);
	TEST_ASSERT_FALSE(first.success);
	TEST_ASSERT_EQUAL_INT(1, first.triesLeft);
	TEST_ASSERT_TRUE(first.matches.has_value());

	AttemptResult second = manager->attempt("neo", "nope", true);
	TEST_ASSERT_FALSE(second.success);
	TEST_ASSERT_EQUAL_INT(0, second.triesLeft);
	TEST_ASSERT_FALSE(second.matches.has_value());
	TEST_ASSERT_EQUAL(0, store->sessions.count("neo"));

	json j = second;
	TEST_ASSERT_FALSE(j.contains("matches"));

	expectError(ErrorKind::NotFound, [&]() { manager->attempt("neo", "abcde", true); });
}

void test_tries_never_increase(void) {
	auto manager = makeManager(4);
	manager->getOrCreateSession("neo", 5);
	int last = 4;
	for (int i = 0; i < 4; ++i) {
		AttemptResult r = manager->attempt("neo", "guess" + std::to_string(i), true);
		TEST_ASSERT_TRUE(r.triesLeft < last);
		last = r.triesLeft;
	}
	TEST_ASSERT_EQUAL_INT(0, last);
	TEST_ASSERT_EQUAL(0, store->sessions.count("neo"));
}

void test_sync_failure_leaves_session_untouched(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);
	syncClient->mode = MockSyncClient::NETWORK_DOWN;

	expectError(ErrorKind::External, [&]() { manager->attempt("neo", "abcde", true); });

	TEST_ASSERT_EQUAL(1, store->sessions.count("neo"));
	TEST_ASSERT_EQUAL_INT(4, store->sessions.at("neo").triesLeft);
	// The value itself was committed before the push.
	TEST_ASSERT_EQUAL_INT(110, store->valueOf(5));
}

void test_station_write_failure_leaves_session_untouched(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);
	store->failSetSignalValue = true;

	expectError(ErrorKind::Storage, [&]() { manager->attempt("neo", "abcde", true); });

	TEST_ASSERT_EQUAL_INT(4, store->sessions.at("neo").triesLeft);
	TEST_ASSERT_EQUAL_INT(100, store->valueOf(5));
}

void test_decrement_failure_keeps_tries(void) {
	auto manager = makeManager();
	manager->getOrCreateSession("neo", 5);
	store->failUpsertSession = true;

	expectError(ErrorKind::Storage, [&]() { manager->attempt("neo", "wrong", true); });

	TEST_ASSERT_EQUAL_INT(4, store->sessions.at("neo").triesLeft);
}

void test_attempt_without_session(void) {
	auto manager = makeManager();
	expectError(ErrorKind::NotFound, [&]() { manager->attempt("ghost", "abc", true); });
	expectError(ErrorKind::InvalidData, [&]() { manager->attempt("neo", "", true); });
}

void test_concurrent_attempts_for_one_owner(void) {
	auto manager = makeManager(4);
	manager->getOrCreateSession("neo", 5);

	std::vector<int> seen(4, -1);
	std::vector<std::thread> threads;
	for (int i = 0; i < 4; ++i) {
		threads.emplace_back([&, i]() { seen[i] = manager->attempt("neo", "wrong", true).triesLeft; });
	}
	for (auto &t : threads) t.join();

	std::sort(seen.begin(), seen.end());
	TEST_ASSERT_EQUAL_INT(0, seen[0]);
	TEST_ASSERT_EQUAL_INT(1, seen[1]);
	TEST_ASSERT_EQUAL_INT(2, seen[2]);
	TEST_ASSERT_EQUAL_INT(3, seen[3]);
}

void test_finished_sessions_release_owner_locks(void) {
	auto manager = makeManager(1);
	manager->getOrCreateSession("neo", 5);
	manager->getOrCreateSession("trinity", 5);
	manager->getOrCreateSession("morpheus", 6);
	TEST_ASSERT_EQUAL(3, manager->trackedOwners());

	TEST_ASSERT_TRUE(manager->attempt("neo", "abcde", true).success);
	TEST_ASSERT_FALSE(manager->attempt("trinity", "wrong", true).success);
	TEST_ASSERT_EQUAL(1, manager->trackedOwners());

	expectError(ErrorKind::NotFound, [&]() { manager->attempt("ghost", "abc", true); });
	TEST_ASSERT_EQUAL(1, manager->trackedOwners());

	// A live session keeps its entry.
	TEST_ASSERT_EQUAL(1, store->sessions.count("morpheus"));
}

// ============================================================================
// MATCH COUNTING
// ============================================================================

void test_count_matches(void) {
	TEST_ASSERT_EQUAL_INT(3, countMatches("axcye", "abcde"));
	TEST_ASSERT_EQUAL_INT(5, countMatches("abcde", "abcde"));
	TEST_ASSERT_EQUAL_INT(3, countMatches("abc", "abcde"));
	TEST_ASSERT_EQUAL_INT(2, countMatches("abxdefgh", "ab"));
	TEST_ASSERT_EQUAL_INT(0, countMatches("", "abc"));
}

int main(void) {
	UNITY_BEGIN();

	// Lifecycle
	RUN_TEST(test_new_session_payload);
	RUN_TEST(test_first_drawn_candidate_is_correct);
	RUN_TEST(test_session_reuse_keeps_tries_and_hint);
	RUN_TEST(test_station_switch_regenerates);
	RUN_TEST(test_station_without_candidates_is_not_found);
	RUN_TEST(test_single_candidate_station);
	RUN_TEST(test_candidate_without_passwords_is_invalid);
	RUN_TEST(test_small_filler_pool_is_used_whole);
	RUN_TEST(test_decoy_duplicates_are_kept);
	RUN_TEST(test_invalid_session_request);
	RUN_TEST(test_payload_json_hides_incorrect_candidate);

	// Attempts
	RUN_TEST(test_correct_guess_adjusts_and_ends_session);
	RUN_TEST(test_wrong_guess_reports_matches);
	RUN_TEST(test_exhaustion_with_budget_two);
	RUN_TEST(test_tries_never_increase);
	RUN_TEST(test_sync_failure_leaves_session_untouched);
	RUN_TEST(test_station_write_failure_leaves_session_untouched);
	RUN_TEST(test_decrement_failure_keeps_tries);
	RUN_TEST(test_attempt_without_session);
	RUN_TEST(test_concurrent_attempts_for_one_owner);
	RUN_TEST(test_finished_sessions_release_owner_locks);

	// Matches
	RUN_TEST(test_count_matches);

	return UNITY_END();
}
