#include "lantern_types.hpp"

namespace lantern {

const char *errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::NotFound: return "not-found";
	case ErrorKind::Storage: return "storage";
	case ErrorKind::External: return "external";
	case ErrorKind::InvalidData: return "invalid-data";
	case ErrorKind::NotAllowed: return "not-allowed";
	case ErrorKind::Internal: return "internal";
	}
	return "unknown";
}

const HackUser *HackSession::correctUser() const {
	for (const auto &u : gameUsers) {
		if (u.isCorrect) return &u;
	}
	return nullptr;
}

void to_json(json &j, const Station &s) {
	j = json{{"stationId", s.stationId}, {"signalValue", s.signalValue}, {"isActive", s.isActive}};
}

void from_json(const json &j, Station &s) {
	j.at("stationId").get_to(s.stationId);
	s.signalValue = j.value("signalValue", 100);
	s.isActive = j.value("isActive", false);
}

void to_json(json &j, const GameUser &u) {
	j = json{{"stationId", u.stationId}, {"userName", u.userName}, {"passwords", u.passwords}};
}

void from_json(const json &j, GameUser &u) {
	u.stationId = j.value("stationId", 0);
	j.at("userName").get_to(u.userName);
	j.at("passwords").get_to(u.passwords);
}

void to_json(json &j, const PasswordHint &h) {
	j = json{{"index", h.index}, {"character", h.character}};
}

void from_json(const json &j, PasswordHint &h) {
	j.at("index").get_to(h.index);
	j.at("character").get_to(h.character);
}

void to_json(json &j, const HackUser &u) {
	j = json{{"userName", u.userName}, {"password", u.password}, {"passwordHint", u.hint}, {"isCorrect", u.isCorrect}};
}

void from_json(const json &j, HackUser &u) {
	j.at("userName").get_to(u.userName);
	j.at("password").get_to(u.password);
	j.at("passwordHint").get_to(u.hint);
	u.isCorrect = j.value("isCorrect", false);
}

void to_json(json &j, const HackSession &s) {
	j = json{{"owner", s.owner}, {"stationId", s.stationId}, {"triesLeft", s.triesLeft}, {"gameUsers", s.gameUsers}};
}

void from_json(const json &j, HackSession &s) {
	j.at("owner").get_to(s.owner);
	j.at("stationId").get_to(s.stationId);
	j.at("triesLeft").get_to(s.triesLeft);
	j.at("gameUsers").get_to(s.gameUsers);
}

void to_json(json &j, const Round &r) {
	j = json{{"isActive", r.isActive}};
	if (!r.startTime.empty()) j["startTime"] = r.startTime;
	if (!r.endTime.empty()) j["endTime"] = r.endTime;
}

void from_json(const json &j, Round &r) {
	r.isActive = j.value("isActive", false);
	r.startTime = j.value("startTime", "");
	r.endTime = j.value("endTime", "");
}

} // namespace lantern
