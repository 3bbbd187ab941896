#include "hack_session.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace lantern {

const char *transitionName(SessionTransition t) {
	switch (t) {
	case SessionTransition::Created: return "created";
	case SessionTransition::Reused: return "reused";
	case SessionTransition::Superseded: return "superseded";
	}
	return "unknown";
}

void to_json(json &j, const HackPayload &p) {
	j = json{{"passwords", p.passwords},
			 {"triesLeft", p.triesLeft},
			 {"userName", p.userName},
			 {"passwordHint", p.hint},
			 {"stationId", p.stationId}};
}

void to_json(json &j, const AttemptResult &r) {
	if (r.success) {
		j = json{{"success", true}, {"boosting", r.boosting}};
		if (r.adjustment) j["signalValue"] = r.adjustment->newValue;
		return;
	}
	j = json{{"success", false}, {"triesLeft", r.triesLeft}};
	if (r.matches) j["matches"] = json{{"amount", *r.matches}};
}

std::string lowerCase(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return s;
}

int countMatches(const std::string &guess, const std::string &correct) {
	const std::size_t n = std::min(guess.size(), correct.size());
	int amount = 0;
	for (std::size_t i = 0; i < n; ++i) {
		if (guess[i] == correct[i]) amount++;
	}
	return amount;
}

HackSessionManager::HackSessionManager(std::shared_ptr<LanternStore> store,
									   std::shared_ptr<SignalController> signals,
									   std::shared_ptr<RandomSource> random,
									   SessionSettings settings)
	: store_(std::move(store)), signals_(std::move(signals)), random_(std::move(random)), settings_(settings) {
	if (!store_ || !signals_ || !random_) throw std::invalid_argument("HackSessionManager requires store, signal controller and random source");
	if (settings_.triesBudget < 1) settings_.triesBudget = 1;
	if (settings_.decoyPasswordCount < 0) settings_.decoyPasswordCount = 0;
}

std::shared_ptr<std::mutex> HackSessionManager::ownerLock(const std::string &owner) {
	std::lock_guard<std::mutex> lock(locksMu_);
	auto &slot = ownerLocks_[owner];
	if (!slot) slot = std::make_shared<std::mutex>();
	return slot;
}

void HackSessionManager::releaseOwnerLock(const std::string &owner, const std::shared_ptr<std::mutex> &mu) {
	std::lock_guard<std::mutex> lock(locksMu_);
	auto it = ownerLocks_.find(owner);
	// The map and the caller are the only holders.
	if (it != ownerLocks_.end() && it->second == mu && mu.use_count() == 2) ownerLocks_.erase(it);
}

std::size_t HackSessionManager::trackedOwners() {
	std::lock_guard<std::mutex> lock(locksMu_);
	return ownerLocks_.size();
}

HackUser HackSessionManager::drawUser(const GameUser &candidate) {
	if (candidate.passwords.empty()) {
		throw EngineError(ErrorKind::InvalidData, "game user " + candidate.userName + " has no passwords");
	}
	HackUser user;
	user.userName = candidate.userName;
	user.password = candidate.passwords[random_->uniform(0, candidate.passwords.size() - 1)];
	if (!user.password.empty()) {
		user.hint.index = (int)random_->uniform(0, user.password.size() - 1);
		user.hint.character = user.password.substr((std::size_t)user.hint.index, 1);
	}
	return user;
}

HackSession HackSessionManager::generate(const std::string &owner, int stationId) {
	std::vector<GameUser> candidates = store_->getCandidates(stationId);
	if (candidates.empty()) {
		throw EngineError(ErrorKind::NotFound, "station " + std::to_string(stationId) + " has no game users");
	}
	shuffleWith(candidates, *random_);

	HackSession session;
	session.owner = owner;
	session.stationId = stationId;
	session.triesLeft = settings_.triesBudget;
	const std::size_t drawn = std::min<std::size_t>(2, candidates.size());
	for (std::size_t i = 0; i < drawn; ++i) {
		HackUser user = drawUser(candidates[i]);
		user.isCorrect = (i == 0);
		session.gameUsers.push_back(std::move(user));
	}
	return session;
}

HackPayload HackSessionManager::buildPayload(const HackSession &session, SessionTransition transition) {
	const HackUser *correct = session.correctUser();
	if (!correct) throw EngineError(ErrorKind::Storage, "session of " + session.owner + " has no correct game user");

	std::vector<std::string> filler = store_->getFillerPasswords();
	shuffleWith(filler, *random_);
	if (filler.size() > (std::size_t)settings_.decoyPasswordCount) filler.resize((std::size_t)settings_.decoyPasswordCount);

	HackPayload payload;
	payload.passwords = std::move(filler);
	for (const auto &u : session.gameUsers) payload.passwords.push_back(u.password);
	payload.triesLeft = session.triesLeft;
	payload.userName = correct->userName;
	payload.hint = correct->hint;
	payload.stationId = session.stationId;
	payload.transition = transition;
	return payload;
}

HackPayload HackSessionManager::getOrCreateSession(const std::string &owner, int stationId) {
	if (owner.empty()) throw EngineError(ErrorKind::InvalidData, "owner is required");
	if (stationId <= 0) throw EngineError(ErrorKind::InvalidData, "stationId must be a positive integer");

	auto mu = ownerLock(owner);
	std::lock_guard<std::mutex> lock(*mu);

	auto existing = store_->getSession(owner);
	if (existing && existing->stationId == stationId) {
		return buildPayload(*existing, SessionTransition::Reused);
	}

	SessionTransition transition = SessionTransition::Created;
	if (existing) {
		transition = SessionTransition::Superseded;
		std::cout << "[HackSession] " << owner << " left station " << existing->stationId << " with "
				  << existing->triesLeft << " tries, session discarded" << std::endl;
	}

	HackSession session = generate(owner, stationId);
	store_->upsertSession(session);
	std::cout << "[HackSession] " << owner << " started hacking station " << stationId << std::endl;
	return buildPayload(session, transition);
}

AttemptResult HackSessionManager::attempt(const std::string &owner, const std::string &guess, bool boosting) {
	if (owner.empty()) throw EngineError(ErrorKind::InvalidData, "owner is required");
	if (guess.empty()) throw EngineError(ErrorKind::InvalidData, "password is required");

	auto mu = ownerLock(owner);
	std::lock_guard<std::mutex> lock(*mu);

	auto session = store_->getSession(owner);
	if (!session) {
		releaseOwnerLock(owner, mu);
		throw EngineError(ErrorKind::NotFound, "no hacking session for " + owner);
	}
	const HackUser *correct = session->correctUser();
	if (!correct) throw EngineError(ErrorKind::Storage, "session of " + owner + " has no correct game user");

	const std::string normalized = lowerCase(guess);
	const std::string expected = lowerCase(correct->password);

	AttemptResult result;
	result.boosting = boosting;

	if (normalized == expected && session->triesLeft > 0) {
		AdjustResult adjusted = signals_->adjust(session->stationId, boosting);
		if (!adjusted.sync.delivered()) {
			throw EngineError(ErrorKind::External, "station " + std::to_string(session->stationId) +
													   " changed to " + std::to_string(adjusted.newValue) +
													   " but sync failed: " + adjusted.sync.error);
		}
		store_->deleteSession(owner);
		releaseOwnerLock(owner, mu);
		std::cout << "[HackSession] " << owner << " hacked station " << session->stationId << std::endl;
		result.success = true;
		result.triesLeft = session->triesLeft;
		result.adjustment = adjusted;
		return result;
	}

	HackSession updated = *session;
	updated.triesLeft -= 1;
	if (updated.triesLeft <= 0) {
		store_->deleteSession(owner);
		releaseOwnerLock(owner, mu);
		std::cout << "[HackSession] " << owner << " ran out of tries on station " << session->stationId << std::endl;
		result.triesLeft = 0;
		return result;
	}

	store_->upsertSession(updated);
	result.triesLeft = updated.triesLeft;
	result.matches = countMatches(normalized, expected);
	return result;
}

} // namespace lantern
