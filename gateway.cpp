#include "gateway.hpp"

#include <iostream>

#include "gateway_support.hpp"

namespace lantern {

json fromJsoncpp(const Json::Value &v) {
	switch (v.type()) {
	case Json::nullValue: return nullptr;
	case Json::intValue: return (int64_t)v.asInt64();
	case Json::uintValue: return (uint64_t)v.asUInt64();
	case Json::realValue: return v.asDouble();
	case Json::stringValue: return v.asString();
	case Json::booleanValue: return v.asBool();
	case Json::arrayValue: {
		json out = json::array();
		for (const auto &item : v) out.push_back(fromJsoncpp(item));
		return out;
	}
	case Json::objectValue: {
		json out = json::object();
		for (auto it = v.begin(); it != v.end(); ++it) out[it.name()] = fromJsoncpp(*it);
		return out;
	}
	}
	return nullptr;
}

Json::Value toJsoncpp(const json &v) {
	if (v.is_null()) return Json::Value();
	if (v.is_boolean()) return Json::Value(v.get<bool>());
	if (v.is_number_integer()) return Json::Value((Json::Int64)v.get<long long>());
	if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
	if (v.is_number_float()) return Json::Value(v.get<double>());
	if (v.is_string()) return Json::Value(v.get<std::string>());
	if (v.is_array()) {
		Json::Value arr(Json::arrayValue);
		for (const auto &item : v) arr.append(toJsoncpp(item));
		return arr;
	}
	Json::Value obj(Json::objectValue);
	for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
	return obj;
}

GatewayServer::GatewayServer(std::shared_ptr<LanternEngine> engine, std::shared_ptr<Authorizer> authorizer, const Config &config)
	: engine_(std::move(engine)), authorizer_(std::move(authorizer)), config_(config) {
	startedAt_ = std::chrono::steady_clock::now();
	setupRoutes();
}

void GatewayServer::listen() {
	std::cout << "[Gateway] Listening on " << config_.host << ':' << config_.port << std::endl;
	drogon::app().addListener(config_.host, static_cast<uint16_t>(config_.port));
	drogon::app().run();
}

json GatewayServer::parseRequestBody(const drogon::HttpRequestPtr &req) const {
	auto payload = req->getJsonObject();
	if (payload) return fromJsoncpp(*payload);
	if (req->getBody().empty()) return json::object();
	throw EngineError(ErrorKind::InvalidData, "invalid json");
}

AuthorizedUser GatewayServer::authorize(const drogon::HttpRequestPtr &req, const std::string &command) {
	return authorizer_->isAllowed(bearerToken(req->getHeader("authorization")), command);
}

void GatewayServer::respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code) {
	auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
	resp->setStatusCode(code);
	cb(resp);
}

void GatewayServer::respondError(const Callback &cb, const EngineError &e) {
	const int status = httpStatusFor(e.kind());
	if (status >= 500) {
		std::cerr << "[Gateway] " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
	}
	respondJson(cb, errorPayload(e.kind(), e.what()), (drogon::HttpStatusCode)status);
}

void GatewayServer::handleHack(const drogon::HttpRequestPtr &req, const Callback &cb) {
	AuthorizedUser user = authorize(req, "HackLantern");
	json body = parseRequestBody(req);
	int stationId = parseStationId(body.value("stationId", json()));
	HackPayload payload = engine_->getOrCreateSession(user.userName, stationId);
	respondJson(cb, json{{"data", payload}});
}

void GatewayServer::handleManipulate(const drogon::HttpRequestPtr &req, const Callback &cb) {
	AuthorizedUser user = authorize(req, "HackLantern");
	json body = parseRequestBody(req);
	if (!body.contains("password") || !body["password"].is_string()) {
		throw EngineError(ErrorKind::InvalidData, "password is required");
	}
	const bool boosting = jsTruthy(body.value("boostingSignal", json()));
	AttemptResult result = engine_->attempt(user.userName, body["password"].get<std::string>(), boosting);
	respondJson(cb, json{{"data", result}});
}

void GatewayServer::handleInfo(const drogon::HttpRequestPtr &req, const Callback &cb) {
	authorize(req, "GetLanternRound");
	Overview overview = engine_->overview();
	if (overview.stationsIncluded) authorize(req, "GetLanternStations");
	respondJson(cb, json{{"data", overview}});
}

void GatewayServer::setupRoutes() {
	auto guarded = [this](void (GatewayServer::*handler)(const drogon::HttpRequestPtr &, const Callback &)) {
		return [this, handler](const drogon::HttpRequestPtr &req, Callback &&cb) {
			try {
				(this->*handler)(req, cb);
			} catch (const EngineError &e) {
				respondError(cb, e);
			} catch (const std::exception &e) {
				respondError(cb, EngineError(ErrorKind::Internal, e.what()));
			}
		};
	};

	drogon::app().registerHandler("/api/lantern/hack", guarded(&GatewayServer::handleHack), {drogon::Post});
	drogon::app().registerHandler("/api/lantern/manipulate", guarded(&GatewayServer::handleManipulate), {drogon::Post});
	drogon::app().registerHandler("/api/lantern/info", guarded(&GatewayServer::handleInfo), {drogon::Get});

	drogon::app().registerHandler("/api/system/status", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
		const auto now = std::chrono::steady_clock::now();
		const auto uptime = std::chrono::duration_cast<std::chrono::duration<double>>(now - startedAt_).count();
		const auto &decay = engine_->decay();
		json out;
		out["ok"] = true;
		out["uptime"] = uptime;
		out["decay"] = json{{"running", decay->running()}, {"intervalMs", decay->intervalMs()}, {"ticks", decay->ticks()}};
		out["store"] = config_.store;
		out["authEnabled"] = config_.authEnabled;
		respondJson(cb, out);
	}, {drogon::Get});
}

} // namespace lantern
