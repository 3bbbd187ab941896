#pragma once

#include <memory>

#include "kv_store.hpp"
#include "lantern_types.hpp"

namespace lantern {

class RoundGate {
public:
	virtual ~RoundGate() = default;
	virtual bool isRoundActive() = 0;
	virtual Round round() = 0;
	virtual void setRound(const Round &round) = 0;
};

// Round record kept under the "round" key; an absent record means no round.
class KvRoundGate : public RoundGate {
public:
	explicit KvRoundGate(std::shared_ptr<KeyValueStore> kv);

	bool isRoundActive() override { return round().isActive; }
	Round round() override;
	void setRound(const Round &round) override;

private:
	std::shared_ptr<KeyValueStore> kv_;
};

} // namespace lantern
