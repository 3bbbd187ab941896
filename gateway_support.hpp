#pragma once

#include <string>

#include "lantern_types.hpp"

namespace lantern {

// HTTP status used to render each error kind.
int httpStatusFor(ErrorKind kind);

json errorPayload(ErrorKind kind, const std::string &message);

// Token part of an "Authorization: Bearer <token>" header, or "".
std::string bearerToken(const std::string &authorizationHeader);

// Accepts a positive integer or a string holding one; throws InvalidData.
int parseStationId(const json &value);

// Loose truthiness for request flags.
bool jsTruthy(const json &v);

} // namespace lantern
