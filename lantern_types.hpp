#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lantern {

using json = nlohmann::json;

enum class ErrorKind {
	NotFound,
	Storage,
	External,
	InvalidData,
	NotAllowed,
	Internal
};

const char *errorKindName(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
	EngineError(ErrorKind kind, const std::string &message)
		: std::runtime_error(message), kind_(kind) {}

	ErrorKind kind() const { return kind_; }

private:
	ErrorKind kind_;
};

struct Station {
	int stationId{0};
	int signalValue{100};
	bool isActive{false};
};

struct GameUser {
	int stationId{0};
	std::string userName;
	std::vector<std::string> passwords;
};

struct PasswordHint {
	int index{0};
	std::string character;
};

struct HackUser {
	std::string userName;
	std::string password;
	PasswordHint hint;
	bool isCorrect{false};
};

struct HackSession {
	std::string owner;
	int stationId{0};
	int triesLeft{0};
	std::vector<HackUser> gameUsers;

	const HackUser *correctUser() const;
};

struct Round {
	bool isActive{false};
	std::string startTime;
	std::string endTime;
};

void to_json(json &j, const Station &s);
void from_json(const json &j, Station &s);
void to_json(json &j, const GameUser &u);
void from_json(const json &j, GameUser &u);
void to_json(json &j, const PasswordHint &h);
void from_json(const json &j, PasswordHint &h);
void to_json(json &j, const HackUser &u);
void from_json(const json &j, HackUser &u);
void to_json(json &j, const HackSession &s);
void from_json(const json &j, HackSession &s);
void to_json(json &j, const Round &r);
void from_json(const json &j, Round &r);

} // namespace lantern
