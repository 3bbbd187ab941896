#include "sync_client.hpp"

#include <iostream>
#include <mutex>

#include <curl/curl.h>

namespace lantern {

namespace {

static size_t curlDiscardCb(char *, size_t size, size_t nmemb, void *) {
	return size * nmemb;
}

static void ensureCurlGlobal() {
	static std::once_flag once;
	std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

std::string syncUrl(const SyncSettings &settings) {
	std::string url = settings.host;
	if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) url = "http://" + url;
	if (!url.empty() && url.back() == '/' && !settings.path.empty() && settings.path.front() == '/') url.pop_back();
	return url + settings.path;
}

std::string syncBody(const SyncSettings &settings, const SyncRequest &request) {
	json body{{"data", {{"station", request.stationId}, {"boost", request.boost}, {"key", settings.key}}}};
	return body.dump();
}

CurlSyncClient::CurlSyncClient(SyncSettings settings) : settings_(std::move(settings)) {
	ensureCurlGlobal();
}

long CurlSyncClient::push(const SyncRequest &request) {
	if (settings_.host.empty() || settings_.key.empty()) {
		throw EngineError(ErrorKind::Internal, "hacking api host or key not set");
	}

	const std::string url = syncUrl(settings_);
	const std::string body = syncBody(settings_, request);

	CURL *curl = curl_easy_init();
	if (!curl) throw EngineError(ErrorKind::External, "curl_easy_init failed");

	struct curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, "Content-Type: application/json");

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)settings_.timeoutMs);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlDiscardCb);

	CURLcode rc = curl_easy_perform(curl);
	long status = 0;
	if (rc == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);

	if (rc != CURLE_OK) {
		throw EngineError(ErrorKind::External, "push to " + url + " failed: " + curl_easy_strerror(rc));
	}
	if (status < 200 || status >= 300) {
		std::cerr << "[SyncClient] Station " << request.stationId << " answered with HTTP " << status << std::endl;
	}
	return status;
}

} // namespace lantern
