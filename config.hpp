#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include "hack_session.hpp"
#include "signal_controller.hpp"
#include "sync_client.hpp"

namespace lantern {

namespace fs = std::filesystem;

struct Config {
	std::string host{"127.0.0.1"};
	int port{5090};
	fs::path dataDir;
	std::string store{"json"};
	std::size_t lmdbMapSizeBytes{64ull * 1024ull * 1024ull};
	fs::path seedFile;

	SignalParams signal;
	int signalResetIntervalMs{60000};
	SessionSettings session;
	SyncSettings sync;

	bool authEnabled{true};
	std::string authJwtSecret{"dev-secret-change-me"};
};

std::string getEnv(const std::string &key, const std::string &fallback = "");
bool boolFrom(const std::string &value, bool fallback = true);
// Falls back on empty, unparsable or non-finite input.
double numberOr(const std::string &s, double fallback);
// As numberOr, and falls back when the value does not fit an int.
int intOr(const std::string &s, int fallback);
std::map<std::string, std::string> parseArgs(int argc, char **argv);

// --key=value arguments win over environment variables, which win over defaults.
Config loadConfig(int argc, char **argv);

} // namespace lantern
