#pragma once

#include "http_types.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace swiv {

// Largest request head (request line + headers) the server accepts
constexpr size_t max_request_head = 8192;

// Parse "METHOD /target HTTP/1.x\r\nName: value\r\n..." (the part before the
// blank line). Path is percent-decoded, query string split off and decoded.
// Returns nullopt for a malformed head.
std::optional<Request> parse_request(const std::string& head);

// "a=1&b=two+words" -> {a: "1", b: "two words"}; later keys win
std::unordered_map<std::string, std::string> parse_query(const std::string& query);

} // namespace swiv
