#pragma once

#include <string>

#include "lantern_types.hpp"

namespace lantern {

struct SyncRequest {
	int stationId{0};
	int boost{0};
};

struct SyncSettings {
	std::string host;
	std::string key;
	std::string path{"/reports/set_boost"};
	int timeoutMs{3000};
};

// Pushes a station's new boost to the external scoring service. Returns the
// HTTP status of whatever answered. Throws EngineError(Internal) when the
// endpoint or key is not configured, EngineError(External) when the request
// could not be delivered.
class SyncClient {
public:
	virtual ~SyncClient() = default;
	virtual long push(const SyncRequest &request) = 0;
};

class CurlSyncClient : public SyncClient {
public:
	explicit CurlSyncClient(SyncSettings settings);

	long push(const SyncRequest &request) override;

	const SyncSettings &settings() const { return settings_; }

private:
	SyncSettings settings_;
};

std::string syncUrl(const SyncSettings &settings);
std::string syncBody(const SyncSettings &settings, const SyncRequest &request);

} // namespace lantern
