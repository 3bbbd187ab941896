#include "gateway_support.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace lantern {

int httpStatusFor(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::NotFound: return 404;
	case ErrorKind::InvalidData: return 400;
	case ErrorKind::NotAllowed: return 401;
	case ErrorKind::External: return 502;
	case ErrorKind::Storage:
	case ErrorKind::Internal: return 500;
	}
	return 500;
}

json errorPayload(ErrorKind kind, const std::string &message) {
	return json{{"error", {{"type", errorKindName(kind)}, {"message", message}}}};
}

std::string bearerToken(const std::string &authorizationHeader) {
	std::size_t i = 0;
	while (i < authorizationHeader.size() && std::isspace((unsigned char)authorizationHeader[i])) i++;
	const std::string scheme = "bearer";
	if (authorizationHeader.size() < i + scheme.size()) return "";
	for (std::size_t k = 0; k < scheme.size(); ++k) {
		if (std::tolower((unsigned char)authorizationHeader[i + k]) != scheme[k]) return "";
	}
	i += scheme.size();
	if (i >= authorizationHeader.size() || !std::isspace((unsigned char)authorizationHeader[i])) return "";
	while (i < authorizationHeader.size() && std::isspace((unsigned char)authorizationHeader[i])) i++;
	std::size_t end = authorizationHeader.size();
	while (end > i && std::isspace((unsigned char)authorizationHeader[end - 1])) end--;
	return authorizationHeader.substr(i, end - i);
}

int parseStationId(const json &value) {
	long long id = 0;
	if (value.is_number_integer()) {
		id = value.get<long long>();
	} else if (value.is_number_float()) {
		double d = value.get<double>();
		if (!std::isfinite(d) || std::floor(d) != d) throw EngineError(ErrorKind::InvalidData, "stationId must be an integer");
		id = (long long)d;
	} else if (value.is_string()) {
		const std::string s = value.get<std::string>();
		if (s.empty() || s.size() > 10) throw EngineError(ErrorKind::InvalidData, "stationId must be an integer");
		for (char c : s) {
			if (!std::isdigit((unsigned char)c)) throw EngineError(ErrorKind::InvalidData, "stationId must be an integer");
		}
		id = std::stoll(s);
	} else {
		throw EngineError(ErrorKind::InvalidData, "stationId is required");
	}
	if (id <= 0 || id > std::numeric_limits<int>::max()) {
		throw EngineError(ErrorKind::InvalidData, "stationId must be a positive integer");
	}
	return (int)id;
}

bool jsTruthy(const json &v) {
	if (v.is_null()) return false;
	if (v.is_boolean()) return v.get<bool>();
	if (v.is_number()) return v.get<double>() != 0.0;
	if (v.is_string()) return !v.get<std::string>().empty();
	return true;
}

} // namespace lantern
