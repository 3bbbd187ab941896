#include "round_gate.hpp"

#include <stdexcept>

namespace lantern {

KvRoundGate::KvRoundGate(std::shared_ptr<KeyValueStore> kv) : kv_(std::move(kv)) {
	if (!kv_) throw std::invalid_argument("KvRoundGate requires a key-value store");
}

Round KvRoundGate::round() {
	std::optional<json> doc;
	try {
		doc = kv_->get("round");
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, std::string("read round failed: ") + e.what());
	}
	if (!doc) return Round{};
	try {
		return doc->get<Round>();
	} catch (const json::exception &e) {
		throw EngineError(ErrorKind::Storage, std::string("malformed round record: ") + e.what());
	}
}

void KvRoundGate::setRound(const Round &round) {
	try {
		kv_->put("round", round);
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::Storage, std::string("write round failed: ") + e.what());
	}
}

} // namespace lantern
