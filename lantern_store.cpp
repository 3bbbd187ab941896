#include "lantern_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

#include "round_gate.hpp"

namespace lantern {

namespace {

static std::string stationKey(int stationId) { return "station:" + std::to_string(stationId); }
static std::string sessionKey(const std::string &owner) { return "session:" + owner; }
static std::string gameUsersKey(int stationId) { return "gameusers:" + std::to_string(stationId); }
static const char *kFakePasswordsKey = "fakepasswords";

template <typename T>
static T decode(const json &doc, const std::string &key) {
	try {
		return doc.get<T>();
	} catch (const json::exception &e) {
		throw EngineError(ErrorKind::Storage, "malformed record " + key + ": " + e.what());
	}
}

} // namespace

KvLanternStore::KvLanternStore(std::shared_ptr<KeyValueStore> kv) : kv_(std::move(kv)) {
	if (!kv_) throw std::invalid_argument("KvLanternStore requires a key-value store");
}

std::optional<json> KvLanternStore::read(const std::string &key) {
	try {
		return kv_->get(key);
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, "read " + key + " failed: " + e.what());
	}
}

void KvLanternStore::write(const std::string &key, const json &value) {
	try {
		kv_->put(key, value);
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, "write " + key + " failed: " + e.what());
	}
}

std::optional<Station> KvLanternStore::getStation(int stationId) {
	const auto key = stationKey(stationId);
	auto doc = read(key);
	if (!doc) return std::nullopt;
	return decode<Station>(*doc, key);
}

void KvLanternStore::setSignalValue(int stationId, int signalValue) {
	const auto key = stationKey(stationId);
	auto doc = read(key);
	if (!doc) throw EngineError(ErrorKind::NotFound, "station " + std::to_string(stationId) + " does not exist");
	auto station = decode<Station>(*doc, key);
	station.signalValue = signalValue;
	write(key, station);
}

std::vector<Station> KvLanternStore::getAllStations() {
	std::vector<std::pair<std::string, json>> all;
	try {
		all = kv_->entries("station:");
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, std::string("list stations failed: ") + e.what());
	}
	std::vector<Station> out;
	out.reserve(all.size());
	for (const auto &kv : all) out.push_back(decode<Station>(kv.second, kv.first));
	std::sort(out.begin(), out.end(), [](const Station &a, const Station &b) { return a.stationId < b.stationId; });
	return out;
}

void KvLanternStore::putStation(const Station &station) {
	write(stationKey(station.stationId), station);
}

std::optional<HackSession> KvLanternStore::getSession(const std::string &owner) {
	const auto key = sessionKey(owner);
	auto doc = read(key);
	if (!doc) return std::nullopt;
	return decode<HackSession>(*doc, key);
}

void KvLanternStore::upsertSession(const HackSession &session) {
	write(sessionKey(session.owner), session);
}

void KvLanternStore::deleteSession(const std::string &owner) {
	const auto key = sessionKey(owner);
	try {
		kv_->del(key);
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, "delete " + key + " failed: " + e.what());
	}
}

std::vector<GameUser> KvLanternStore::getCandidates(int stationId) {
	const auto key = gameUsersKey(stationId);
	auto doc = read(key);
	if (!doc) return {};
	auto users = decode<std::vector<GameUser>>(*doc, key);
	for (auto &u : users) u.stationId = stationId;
	return users;
}

void KvLanternStore::putCandidates(int stationId, const std::vector<GameUser> &gameUsers) {
	write(gameUsersKey(stationId), gameUsers);
}

std::vector<std::string> KvLanternStore::getFillerPasswords() {
	auto doc = read(kFakePasswordsKey);
	if (!doc) return {};
	return decode<std::vector<std::string>>(*doc, kFakePasswordsKey);
}

void KvLanternStore::putFillerPasswords(const std::vector<std::string> &passwords) {
	write(kFakePasswordsKey, passwords);
}

// ------------------ Seeding ------------------

SeedSummary seedFromJson(LanternStore &store, RoundGate *rounds, const json &seed) {
	SeedSummary summary;
	if (!seed.is_object()) throw EngineError(ErrorKind::InvalidData, "seed document must be an object");

	try {
		std::vector<Station> stations;
		std::set<int> seededIds;
		for (const auto &item : seed.value("stations", json::array())) {
			auto station = item.get<Station>();
			if (station.stationId <= 0) {
				throw EngineError(ErrorKind::InvalidData, "station ids must be positive");
			}
			seededIds.insert(station.stationId);
			stations.push_back(station);
		}

		std::map<int, std::vector<GameUser>> byStation;
		for (const auto &item : seed.value("gameUsers", json::array())) {
			auto user = item.get<GameUser>();
			if (user.stationId <= 0) {
				throw EngineError(ErrorKind::InvalidData, "game user " + user.userName + " needs a positive stationId");
			}
			if (!seededIds.count(user.stationId) && !store.getStation(user.stationId)) {
				throw EngineError(ErrorKind::InvalidData, "game user " + user.userName + " references unknown station " +
															  std::to_string(user.stationId));
			}
			if (user.passwords.empty()) {
				throw EngineError(ErrorKind::InvalidData, "game user " + user.userName + " has no passwords");
			}
			for (auto &p : user.passwords) {
				std::transform(p.begin(), p.end(), p.begin(), [](unsigned char c) { return (char)std::tolower(c); });
			}
			byStation[user.stationId].push_back(std::move(user));
		}

		std::vector<std::string> fillers;
		const bool hasFillers = seed.contains("fakePasswords");
		if (hasFillers) fillers = seed.at("fakePasswords").get<std::vector<std::string>>();
		std::optional<Round> round;
		if (rounds && seed.contains("round")) round = seed.at("round").get<Round>();

		// Nothing is written until the whole document has validated.
		if (round) {
			rounds->setRound(*round);
			summary.roundSet = true;
		}
		for (auto &station : stations) {
			auto existing = store.getStation(station.stationId);
			if (existing) {
				station.signalValue = existing->signalValue;
				summary.stationsKept++;
			} else {
				summary.stationsCreated++;
			}
			store.putStation(station);
		}
		for (auto &entry : byStation) {
			summary.gameUsers += (int)entry.second.size();
			store.putCandidates(entry.first, entry.second);
		}
		if (hasFillers) {
			summary.fakePasswords = (int)fillers.size();
			store.putFillerPasswords(fillers);
		}
	} catch (const json::exception &e) {
		throw EngineError(ErrorKind::InvalidData, std::string("malformed seed document: ") + e.what());
	}
	return summary;
}

SeedSummary seedFromFile(LanternStore &store, RoundGate *rounds, const fs::path &file) {
	std::ifstream in(file);
	if (!in) throw EngineError(ErrorKind::NotFound, "seed file not found: " + file.string());
	json seed = json::parse(in, nullptr, false);
	if (seed.is_discarded()) throw EngineError(ErrorKind::InvalidData, "seed file is not valid JSON: " + file.string());
	auto summary = seedFromJson(store, rounds, seed);
	std::cout << "[Store] Seeded from " << file.string() << ": " << summary.stationsCreated << " new stations, "
			  << summary.stationsKept << " kept, " << summary.gameUsers << " game users, "
			  << summary.fakePasswords << " fake passwords" << std::endl;
	return summary;
}

} // namespace lantern
