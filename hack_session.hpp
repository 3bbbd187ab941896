#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lantern_store.hpp"
#include "lantern_types.hpp"
#include "signal_controller.hpp"

namespace lantern {

class RandomSource {
public:
	virtual ~RandomSource() = default;
	// Uniform integer in [lo, hi].
	virtual std::size_t uniform(std::size_t lo, std::size_t hi) = 0;
};

class MtRandomSource : public RandomSource {
public:
	MtRandomSource() : rng_(std::random_device{}()) {}
	explicit MtRandomSource(unsigned seed) : rng_(seed) {}

	std::size_t uniform(std::size_t lo, std::size_t hi) override {
		std::lock_guard<std::mutex> lock(mu_);
		std::uniform_int_distribution<std::size_t> dist(lo, hi);
		return dist(rng_);
	}

private:
	std::mt19937 rng_;
	std::mutex mu_;
};

template <typename T>
void shuffleWith(std::vector<T> &items, RandomSource &random) {
	for (std::size_t i = items.size(); i > 1; --i) {
		std::size_t j = random.uniform(0, i - 1);
		std::swap(items[i - 1], items[j]);
	}
}

enum class SessionTransition { Created, Reused, Superseded };

const char *transitionName(SessionTransition t);

// What the player sees: decoys plus the session passwords, and the hint for
// the correct candidate only.
struct HackPayload {
	std::vector<std::string> passwords;
	int triesLeft{0};
	std::string userName;
	PasswordHint hint;
	int stationId{0};
	SessionTransition transition{SessionTransition::Created};
};

struct AttemptResult {
	bool success{false};
	bool boosting{false};
	int triesLeft{0};
	std::optional<int> matches;
	std::optional<AdjustResult> adjustment;
};

void to_json(json &j, const HackPayload &p);
void to_json(json &j, const AttemptResult &r);

std::string lowerCase(std::string s);

// Equal characters at equal positions, over the shorter of the two strings.
int countMatches(const std::string &guess, const std::string &correct);

struct SessionSettings {
	int triesBudget{4};
	int decoyPasswordCount{13};
};

class HackSessionManager {
public:
	HackSessionManager(std::shared_ptr<LanternStore> store,
					   std::shared_ptr<SignalController> signals,
					   std::shared_ptr<RandomSource> random,
					   SessionSettings settings = SessionSettings{});

	HackPayload getOrCreateSession(const std::string &owner, int stationId);
	AttemptResult attempt(const std::string &owner, const std::string &guess, bool boosting);

	const SessionSettings &settings() const { return settings_; }
	std::size_t trackedOwners();

private:
	HackSession generate(const std::string &owner, int stationId);
	HackUser drawUser(const GameUser &candidate);
	HackPayload buildPayload(const HackSession &session, SessionTransition transition);
	std::shared_ptr<std::mutex> ownerLock(const std::string &owner);
	// Drops the owner's entry once no other caller holds it; call while holding mu.
	void releaseOwnerLock(const std::string &owner, const std::shared_ptr<std::mutex> &mu);

	std::shared_ptr<LanternStore> store_;
	std::shared_ptr<SignalController> signals_;
	std::shared_ptr<RandomSource> random_;
	SessionSettings settings_;

	std::mutex locksMu_;
	std::unordered_map<std::string, std::shared_ptr<std::mutex>> ownerLocks_;
};

} // namespace lantern
