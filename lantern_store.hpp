#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kv_store.hpp"
#include "lantern_types.hpp"

namespace lantern {

// Durable records the engine reads and writes. Implementations report every
// medium failure as EngineError(ErrorKind::Storage).
class LanternStore {
public:
	virtual ~LanternStore() = default;

	virtual std::optional<Station> getStation(int stationId) = 0;
	virtual void setSignalValue(int stationId, int signalValue) = 0;
	virtual std::vector<Station> getAllStations() = 0;
	virtual void putStation(const Station &station) = 0;

	virtual std::optional<HackSession> getSession(const std::string &owner) = 0;
	virtual void upsertSession(const HackSession &session) = 0;
	virtual void deleteSession(const std::string &owner) = 0;

	virtual std::vector<GameUser> getCandidates(int stationId) = 0;
	virtual void putCandidates(int stationId, const std::vector<GameUser> &gameUsers) = 0;
	virtual std::vector<std::string> getFillerPasswords() = 0;
	virtual void putFillerPasswords(const std::vector<std::string> &passwords) = 0;
};

class KvLanternStore : public LanternStore {
public:
	explicit KvLanternStore(std::shared_ptr<KeyValueStore> kv);

	std::optional<Station> getStation(int stationId) override;
	void setSignalValue(int stationId, int signalValue) override;
	std::vector<Station> getAllStations() override;
	void putStation(const Station &station) override;

	std::optional<HackSession> getSession(const std::string &owner) override;
	void upsertSession(const HackSession &session) override;
	void deleteSession(const std::string &owner) override;

	std::vector<GameUser> getCandidates(int stationId) override;
	void putCandidates(int stationId, const std::vector<GameUser> &gameUsers) override;
	std::vector<std::string> getFillerPasswords() override;
	void putFillerPasswords(const std::vector<std::string> &passwords) override;

	const std::shared_ptr<KeyValueStore> &kv() const { return kv_; }

private:
	std::optional<json> read(const std::string &key);
	void write(const std::string &key, const json &value);

	std::shared_ptr<KeyValueStore> kv_;
};

class RoundGate;

struct SeedSummary {
	int stationsCreated{0};
	int stationsKept{0};
	int gameUsers{0};
	int fakePasswords{0};
	bool roundSet{false};
};

// Loads {round, stations, gameUsers, fakePasswords} from a JSON document.
// Stations already present keep their signal value.
SeedSummary seedFromJson(LanternStore &store, RoundGate *rounds, const json &seed);
SeedSummary seedFromFile(LanternStore &store, RoundGate *rounds, const fs::path &file);

} // namespace lantern
