#pragma once

#include <map>
#include <string>

#include "lantern_types.hpp"

namespace lantern {

enum class AccessLevel {
	Anonymous = 0,
	Standard = 1,
	Privileged = 2,
	Moderator = 3,
	Admin = 4,
	Superuser = 5,
	God = 6
};

const char *accessLevelName(AccessLevel level);

struct AuthorizedUser {
	std::string userName;
	AccessLevel accessLevel{AccessLevel::Anonymous};

	bool anonymous() const { return userName.empty(); }
};

// Minimum level per command name.
const std::map<std::string, AccessLevel> &commandAccessLevels();

class Authorizer {
public:
	virtual ~Authorizer() = default;
	// Throws EngineError(NotAllowed).
	virtual AuthorizedUser isAllowed(const std::string &token, const std::string &commandName) = 0;
};

// HS256 tokens carrying "username" and "accessLevel" claims.
class JwtAuthorizer : public Authorizer {
public:
	JwtAuthorizer(std::string secret, bool enabled);

	AuthorizedUser isAllowed(const std::string &token, const std::string &commandName) override;

	bool enabled() const { return enabled_; }

private:
	AuthorizedUser decode(const std::string &token, bool verify) const;

	std::string secret_;
	bool enabled_{true};
};

} // namespace lantern
