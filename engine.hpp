#pragma once

#include <memory>
#include <string>
#include <vector>

#include "decay_loop.hpp"
#include "hack_session.hpp"
#include "lantern_store.hpp"
#include "round_gate.hpp"
#include "signal_controller.hpp"
#include "sync_client.hpp"

namespace lantern {

struct Overview {
	Round round;
	bool stationsIncluded{false};
	std::vector<Station> activeStations;
	std::vector<Station> inactiveStations;
};

void to_json(json &j, const Overview &o);

struct EngineParts {
	std::shared_ptr<LanternStore> store;
	std::shared_ptr<RoundGate> rounds;
	std::shared_ptr<SyncClient> sync;
	std::shared_ptr<RandomSource> random;
	SignalParams signal;
	SessionSettings session;
	int decayIntervalMs{60000};
};

// Wires the controller, the session manager and the decay loop over one store.
class LanternEngine {
public:
	explicit LanternEngine(EngineParts parts);
	~LanternEngine();

	HackPayload getOrCreateSession(const std::string &owner, int stationId);
	AttemptResult attempt(const std::string &owner, const std::string &guess, bool boosting);
	Overview overview();

	void start() { decay_->start(); }
	void stop() { decay_->stop(); }

	const std::shared_ptr<SignalController> &signals() const { return signals_; }
	const std::shared_ptr<HackSessionManager> &sessions() const { return sessions_; }
	const std::shared_ptr<DecayLoop> &decay() const { return decay_; }

private:
	std::shared_ptr<LanternStore> store_;
	std::shared_ptr<RoundGate> rounds_;
	std::shared_ptr<SignalController> signals_;
	std::shared_ptr<HackSessionManager> sessions_;
	std::shared_ptr<DecayLoop> decay_;
};

} // namespace lantern
