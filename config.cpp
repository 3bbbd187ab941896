#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace lantern {

std::string getEnv(const std::string &key, const std::string &fallback) {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = value;
	std::transform(v.begin(), v.end(), v.begin(), ::tolower);
	if (v.empty()) return fallback;
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

double numberOr(const std::string &s, double fallback) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return fallback;
	auto end = s.find_last_not_of(" \t\r\n");
	const std::string trimmed = s.substr(start, end - start + 1);
	char *parsedEnd = nullptr;
	double v = std::strtod(trimmed.c_str(), &parsedEnd);
	if (parsedEnd != trimmed.c_str() + trimmed.size()) return fallback;
	if (!std::isfinite(v)) return fallback;
	return v;
}

int intOr(const std::string &s, int fallback) {
	const double v = numberOr(s, fallback);
	if (v < (double)std::numeric_limits<int>::min() || v > (double)std::numeric_limits<int>::max()) return fallback;
	return (int)v;
}

std::map<std::string, std::string> parseArgs(int argc, char **argv) {
	std::map<std::string, std::string> out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			out[item.substr(2)] = "true";
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

Config loadConfig(int argc, char **argv) {
	const auto args = parseArgs(argc, argv);
	const fs::path rootDir = fs::current_path();
	auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
		auto it = args.find(argKey);
		if (it != args.end() && !it->second.empty()) return it->second;
		std::string v = getEnv(env);
		if (!v.empty()) return v;
		return def;
	};

	Config c;
	c.host = argOrEnv("host", "LANTERN_HOST", "127.0.0.1");
	c.port = intOr(argOrEnv("port", "LANTERN_PORT", "5090"), 5090);
	if (c.port < 1 || c.port > 65535) {
		std::cerr << "[Bootstrap] Port " << c.port << " out of range, using 5090" << std::endl;
		c.port = 5090;
	}
	c.dataDir = fs::absolute(argOrEnv("data-dir", "LANTERN_DATA_DIR", (rootDir / "runtime_store").string()));
	c.store = argOrEnv("store", "LANTERN_STORE", "json");
	std::transform(c.store.begin(), c.store.end(), c.store.begin(), ::tolower);
	int mapMb = intOr(argOrEnv("lmdb-map-mb", "LANTERN_LMDB_MAP_MB", "64"), 64);
	if (mapMb < 1) mapMb = 64;
	c.lmdbMapSizeBytes = (std::size_t)mapMb * 1024ull * 1024ull;
	const std::string seed = argOrEnv("seed-file", "LANTERN_SEED_FILE", "");
	if (!seed.empty()) c.seedFile = fs::absolute(seed);

	SignalParams defaults;
	c.signal.defaultValue = intOr(argOrEnv("signal-default", "LANTERN_SIGNAL_DEFAULT", "100"), defaults.defaultValue);
	c.signal.threshold = intOr(argOrEnv("signal-threshold", "LANTERN_SIGNAL_THRESHOLD", "50"), defaults.threshold);
	c.signal.maxChange = intOr(argOrEnv("signal-max-change", "LANTERN_SIGNAL_MAX_CHANGE", "10"), defaults.maxChange);
	c.signal.changePercentage = numberOr(argOrEnv("signal-change-percentage", "LANTERN_SIGNAL_CHANGE_PERCENTAGE", "0.2"), defaults.changePercentage);
	const long long span = c.signal.threshold;
	if (c.signal.threshold <= 0 || c.signal.maxChange < 0 || c.signal.changePercentage < 0 ||
		c.signal.defaultValue + span > std::numeric_limits<int>::max() ||
		c.signal.defaultValue - span < std::numeric_limits<int>::min()) {
		std::cerr << "[Bootstrap] Invalid signal parameters, using defaults" << std::endl;
		c.signal = defaults;
	}
	c.signalResetIntervalMs = std::max(0, intOr(argOrEnv("signal-reset-interval-ms", "LANTERN_SIGNAL_RESET_INTERVAL_MS", "60000"), 60000));

	c.session.triesBudget = std::max(1, intOr(argOrEnv("hacking-tries", "LANTERN_HACKING_TRIES", "4"), 4));
	c.session.decoyPasswordCount = std::max(0, intOr(argOrEnv("decoy-count", "LANTERN_DECOY_COUNT", "13"), 13));

	c.sync.host = argOrEnv("sync-host", "HACKING_API_HOST", "");
	c.sync.key = argOrEnv("sync-key", "HACKING_API_KEY", "");
	c.sync.path = argOrEnv("sync-path", "HACKING_API_PATH", "/reports/set_boost");
	c.sync.timeoutMs = std::max(1, intOr(argOrEnv("sync-timeout-ms", "HACKING_API_TIMEOUT_MS", "3000"), 3000));

	c.authEnabled = boolFrom(argOrEnv("auth-enabled", "LANTERN_AUTH_ENABLED", "true"), true);
	c.authJwtSecret = argOrEnv("auth-secret", "LANTERN_AUTH_JWT_SECRET", "dev-secret-change-me");
	return c;
}

} // namespace lantern
