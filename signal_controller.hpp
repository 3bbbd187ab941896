#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "lantern_store.hpp"
#include "lantern_types.hpp"
#include "round_gate.hpp"
#include "sync_client.hpp"

namespace lantern {

struct SignalParams {
	int defaultValue{100};
	int threshold{50};
	int maxChange{10};
	double changePercentage{0.2};

	int minValue() const { return defaultValue - threshold; }
	int maxValue() const { return defaultValue + threshold; }
};

// Pure step functions, exposed for tests.
int computeAdjustedValue(int current, bool boosting, const SignalParams &params);
int computeDecayedValue(int current, const SignalParams &params);

enum class SyncStatus { Delivered, SyncFailed };

struct SyncOutcome {
	SyncStatus status{SyncStatus::Delivered};
	long statusCode{0};
	ErrorKind errorKind{ErrorKind::External};
	std::string error;

	bool delivered() const { return status == SyncStatus::Delivered; }
};

// The value is committed whenever adjust() returns; sync reports the push.
struct AdjustResult {
	int stationId{0};
	int previousValue{0};
	int newValue{0};
	SyncOutcome sync;
};

struct DecayReport {
	bool skipped{false};
	std::string skipReason;
	int stationsVisited{0};
	int stationsMoved{0};
	int storageFailures{0};
	int syncFailures{0};
};

class SignalController {
public:
	SignalController(std::shared_ptr<LanternStore> store,
					 std::shared_ptr<SyncClient> sync,
					 std::shared_ptr<RoundGate> rounds,
					 SignalParams params = SignalParams{});

	// Throws EngineError NotFound/Storage; never throws for a failed push.
	AdjustResult adjust(int stationId, bool boosting);

	// One step toward the default for every station, only during a round.
	DecayReport decayTick();

	const SignalParams &params() const { return params_; }

private:
	std::shared_ptr<std::mutex> stationLock(int stationId);
	SyncOutcome pushValue(int stationId, int value);

	std::shared_ptr<LanternStore> store_;
	std::shared_ptr<SyncClient> sync_;
	std::shared_ptr<RoundGate> rounds_;
	SignalParams params_;

	std::mutex locksMu_;
	// Never pruned; bounded by the seeded station set.
	std::unordered_map<int, std::shared_ptr<std::mutex>> stationLocks_;
};

} // namespace lantern
