#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <drogon/drogon.h>
#include <json/json.h>

#include "authorizer.hpp"
#include "config.hpp"
#include "engine.hpp"

namespace lantern {

json fromJsoncpp(const Json::Value &v);
Json::Value toJsoncpp(const json &v);

class GatewayServer {
public:
	GatewayServer(std::shared_ptr<LanternEngine> engine, std::shared_ptr<Authorizer> authorizer, const Config &config);

	// Blocks until drogon quits.
	void listen();

private:
	using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

	void setupRoutes();
	void handleHack(const drogon::HttpRequestPtr &req, const Callback &cb);
	void handleManipulate(const drogon::HttpRequestPtr &req, const Callback &cb);
	void handleInfo(const drogon::HttpRequestPtr &req, const Callback &cb);

	json parseRequestBody(const drogon::HttpRequestPtr &req) const;
	AuthorizedUser authorize(const drogon::HttpRequestPtr &req, const std::string &command);

	void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK);
	void respondError(const Callback &cb, const EngineError &e);

	std::shared_ptr<LanternEngine> engine_;
	std::shared_ptr<Authorizer> authorizer_;
	Config config_;
	std::chrono::steady_clock::time_point startedAt_;
};

} // namespace lantern
