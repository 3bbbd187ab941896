#include "engine.hpp"

#include <stdexcept>

namespace lantern {

void to_json(json &j, const Overview &o) {
	j = json{{"round", o.round}};
	if (o.stationsIncluded) {
		j["activeStations"] = o.activeStations;
		j["inactiveStations"] = o.inactiveStations;
	}
}

LanternEngine::LanternEngine(EngineParts parts) : store_(parts.store), rounds_(parts.rounds) {
	if (!parts.random) parts.random = std::make_shared<MtRandomSource>();
	signals_ = std::make_shared<SignalController>(parts.store, parts.sync, parts.rounds, parts.signal);
	sessions_ = std::make_shared<HackSessionManager>(parts.store, signals_, parts.random, parts.session);
	decay_ = std::make_shared<DecayLoop>(signals_, parts.decayIntervalMs);
}

LanternEngine::~LanternEngine() {
	decay_->stop();
}

HackPayload LanternEngine::getOrCreateSession(const std::string &owner, int stationId) {
	return sessions_->getOrCreateSession(owner, stationId);
}

AttemptResult LanternEngine::attempt(const std::string &owner, const std::string &guess, bool boosting) {
	return sessions_->attempt(owner, guess, boosting);
}

Overview LanternEngine::overview() {
	Overview o;
	o.round = rounds_->round();
	if (!o.round.isActive) return o;
	o.stationsIncluded = true;
	for (auto &s : store_->getAllStations()) {
		if (s.isActive) o.activeStations.push_back(s);
		else o.inactiveStations.push_back(s);
	}
	return o;
}

} // namespace lantern
