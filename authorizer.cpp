#include "authorizer.hpp"

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

namespace lantern {

const char *accessLevelName(AccessLevel level) {
	switch (level) {
	case AccessLevel::Anonymous: return "ANONYMOUS";
	case AccessLevel::Standard: return "STANDARD";
	case AccessLevel::Privileged: return "PRIVILEGED";
	case AccessLevel::Moderator: return "MODERATOR";
	case AccessLevel::Admin: return "ADMIN";
	case AccessLevel::Superuser: return "SUPERUSER";
	case AccessLevel::God: return "GOD";
	}
	return "UNKNOWN";
}

const std::map<std::string, AccessLevel> &commandAccessLevels() {
	static const std::map<std::string, AccessLevel> table{
		{"HackLantern", AccessLevel::Standard},
		{"GetLanternStations", AccessLevel::Anonymous},
		{"GetLanternRound", AccessLevel::Anonymous},
	};
	return table;
}

namespace {

AccessLevel levelFromClaim(const json &claim) {
	int raw = 0;
	if (claim.is_number_integer()) raw = claim.get<int>();
	else if (claim.is_string()) {
		try {
			raw = std::stoi(claim.get<std::string>());
		} catch (const std::exception &) {
			throw EngineError(ErrorKind::NotAllowed, "invalid accessLevel claim");
		}
	} else if (!claim.is_null()) {
		throw EngineError(ErrorKind::NotAllowed, "invalid accessLevel claim");
	}
	if (raw < 0) raw = 0;
	if (raw > (int)AccessLevel::God) raw = (int)AccessLevel::God;
	return static_cast<AccessLevel>(raw);
}

} // namespace

JwtAuthorizer::JwtAuthorizer(std::string secret, bool enabled) : secret_(std::move(secret)), enabled_(enabled) {}

AuthorizedUser JwtAuthorizer::decode(const std::string &token, bool verify) const {
	try {
		auto dec = jwt::decode<jwt::traits::nlohmann_json>(token);
		if (verify) {
			jwt::verify<jwt::traits::nlohmann_json>()
				.allow_algorithm(jwt::algorithm::hs256{secret_})
				.verify(dec);
		}
		json payload = dec.get_payload_json();
		AuthorizedUser user;
		if (payload.contains("username") && payload["username"].is_string()) {
			user.userName = payload["username"].get<std::string>();
		}
		user.accessLevel = levelFromClaim(payload.value("accessLevel", json()));
		return user;
	} catch (const EngineError &) {
		throw;
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::NotAllowed, std::string("invalid token: ") + e.what());
	}
}

AuthorizedUser JwtAuthorizer::isAllowed(const std::string &token, const std::string &commandName) {
	const auto &table = commandAccessLevels();
	auto it = table.find(commandName);
	if (it == table.end()) throw EngineError(ErrorKind::NotAllowed, "unknown command " + commandName);

	AuthorizedUser user;
	if (!token.empty()) user = decode(token, enabled_);
	if (!enabled_) return user;

	if ((int)user.accessLevel < (int)it->second) {
		throw EngineError(ErrorKind::NotAllowed, std::string(commandName) + " requires " + accessLevelName(it->second));
	}
	return user;
}

} // namespace lantern
