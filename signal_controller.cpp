#include "signal_controller.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace lantern {

int computeAdjustedValue(int current, bool boosting, const SignalParams &params) {
	const double difference = std::abs(current - params.defaultValue);
	double change = (params.threshold - difference) * params.changePercentage;

	if (boosting && current < params.defaultValue) {
		change = params.maxChange;
	} else if (!boosting && current > params.defaultValue) {
		change = params.maxChange;
	}

	const double target = current + (boosting ? change : -std::abs(change));
	const int ceiled = (int)std::ceil(target);
	return std::clamp(ceiled, params.minValue(), params.maxValue());
}

int computeDecayedValue(int current, const SignalParams &params) {
	if (current > params.defaultValue) return current - 1;
	if (current < params.defaultValue) return current + 1;
	return current;
}

SignalController::SignalController(std::shared_ptr<LanternStore> store,
								   std::shared_ptr<SyncClient> sync,
								   std::shared_ptr<RoundGate> rounds,
								   SignalParams params)
	: store_(std::move(store)), sync_(std::move(sync)), rounds_(std::move(rounds)), params_(params) {
	if (!store_ || !sync_ || !rounds_) throw std::invalid_argument("SignalController requires store, sync client and round gate");
}

std::shared_ptr<std::mutex> SignalController::stationLock(int stationId) {
	std::lock_guard<std::mutex> lock(locksMu_);
	auto &slot = stationLocks_[stationId];
	if (!slot) slot = std::make_shared<std::mutex>();
	return slot;
}

SyncOutcome SignalController::pushValue(int stationId, int value) {
	SyncOutcome outcome;
	try {
		outcome.statusCode = sync_->push(SyncRequest{stationId, value});
		outcome.status = SyncStatus::Delivered;
	} catch (const EngineError &e) {
		outcome.status = SyncStatus::SyncFailed;
		outcome.errorKind = e.kind();
		outcome.error = e.what();
		std::cerr << "[SignalController] Sync of station " << stationId << " (" << value << ") failed: " << e.what() << std::endl;
	}
	return outcome;
}

AdjustResult SignalController::adjust(int stationId, bool boosting) {
	auto mu = stationLock(stationId);
	std::lock_guard<std::mutex> lock(*mu);

	auto station = store_->getStation(stationId);
	if (!station) throw EngineError(ErrorKind::NotFound, "station " + std::to_string(stationId) + " does not exist");

	AdjustResult result;
	result.stationId = stationId;
	result.previousValue = station->signalValue;
	result.newValue = computeAdjustedValue(station->signalValue, boosting, params_);

	store_->setSignalValue(stationId, result.newValue);
	std::cout << "[SignalController] Station " << stationId << ' ' << (boosting ? "boosted" : "dampened") << ": "
			  << result.previousValue << " -> " << result.newValue << std::endl;

	// Pushed under the station lock so the scoring service sees values in write order.
	result.sync = pushValue(stationId, result.newValue);
	return result;
}

DecayReport SignalController::decayTick() {
	DecayReport report;
	if (!rounds_->isRoundActive()) {
		report.skipped = true;
		report.skipReason = "no active round";
		return report;
	}

	for (const auto &listed : store_->getAllStations()) {
		report.stationsVisited++;
		auto mu = stationLock(listed.stationId);
		std::lock_guard<std::mutex> lock(*mu);
		try {
			auto station = store_->getStation(listed.stationId);
			if (!station) continue;
			const int next = computeDecayedValue(station->signalValue, params_);
			if (next == station->signalValue) continue;
			store_->setSignalValue(station->stationId, next);
			report.stationsMoved++;
			if (!pushValue(station->stationId, next).delivered()) report.syncFailures++;
		} catch (const EngineError &e) {
			report.storageFailures++;
			std::cerr << "[SignalController] Decay of station " << listed.stationId << " failed: " << e.what() << std::endl;
		}
	}
	return report;
}

} // namespace lantern
