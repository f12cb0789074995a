//
// Helpers for building and picking apart HTTP messages
//

#ifndef ECHO_SERVICE_HTTPUTILS_H
#define ECHO_SERVICE_HTTPUTILS_H

#include "HttpTypes.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Splits "/a/b/" into {"a", "b", ""}. The leading slash is dropped, empty segments are kept
auto splitPath(const std::string &path) -> std::vector<std::string>;

// Strict percent decoding. Returns nullopt for a truncated or non-hex escape
auto percentDecode(const std::string &value) -> std::optional<std::string>;

// Invalid UTF-8 in any string is replaced with U+FFFD
auto jsonResponse(SimpleWeb::StatusCode status, const nlohmann::json &body) -> sHttpResponse;

// {"error": {"kind": kind, "message": message}}
auto errorResponse(SimpleWeb::StatusCode status, const std::string &kind, const std::string &message) -> sHttpResponse;

#endif //ECHO_SERVICE_HTTPUTILS_H
