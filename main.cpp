#include <iostream>
#include <memory>

#include "authorizer.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "gateway.hpp"
#include "kv_store.hpp"
#include "lantern_store.hpp"
#include "round_gate.hpp"
#include "sync_client.hpp"

using namespace lantern;

static std::shared_ptr<KeyValueStore> openStore(const Config &config) {
	std::shared_ptr<KeyValueStore> kv;
	if (config.store == "lmdb") {
#ifdef HAVE_LMDB
		auto lmdb = std::make_shared<LmdbStore>("lantern", config.dataDir, config.lmdbMapSizeBytes);
		if (lmdb->ok()) kv = lmdb;
		else std::cerr << "[Bootstrap] LMDB unavailable under " << config.dataDir.string() << ", using json store" << std::endl;
#else
		std::cerr << "[Bootstrap] Built without LMDB, using json store" << std::endl;
#endif
	}
	if (!kv) kv = std::make_shared<JsonFileStore>("lantern", config.dataDir);
	return kv;
}

int main(int argc, char **argv) {
	const Config config = loadConfig(argc, argv);

	std::shared_ptr<KeyValueStore> kv;
	try {
		kv = openStore(config);
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] Cannot open store: " << e.what() << std::endl;
		return 1;
	}

	auto store = std::make_shared<KvLanternStore>(kv);
	auto rounds = std::make_shared<KvRoundGate>(kv);

	if (!config.seedFile.empty()) {
		try {
			seedFromFile(*store, rounds.get(), config.seedFile);
		} catch (const EngineError &e) {
			std::cerr << "[Bootstrap] Seeding failed (" << errorKindName(e.kind()) << "): " << e.what() << std::endl;
			return 1;
		}
	}

	if (config.sync.host.empty() || config.sync.key.empty()) {
		std::cerr << "[Bootstrap] HACKING_API_HOST or HACKING_API_KEY not set, station sync will fail" << std::endl;
	}

	EngineParts parts;
	parts.store = store;
	parts.rounds = rounds;
	parts.sync = std::make_shared<CurlSyncClient>(config.sync);
	parts.random = std::make_shared<MtRandomSource>();
	parts.signal = config.signal;
	parts.session = config.session;
	parts.decayIntervalMs = config.signalResetIntervalMs;
	auto engine = std::make_shared<LanternEngine>(parts);

	auto authorizer = std::make_shared<JwtAuthorizer>(config.authJwtSecret, config.authEnabled);
	if (!config.authEnabled) std::cout << "[Bootstrap] Authorization disabled" << std::endl;

	engine->start();
	GatewayServer gateway(engine, authorizer, config);
	gateway.listen();

	engine->stop();
	try {
		kv->flush();
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] Final flush failed: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
