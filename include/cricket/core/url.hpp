#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cricket::core {

// Ordered so that generated URLs are deterministic.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percentEncode(std::string_view Value);
std::string percentDecode(std::string_view Value);

// Join base and path with exactly one slash between them.
std::string joinUrl(std::string_view Base, std::string_view Path);

std::string buildUrl(
    std::string_view Base, std::string_view Path, const QueryParams &Params
);

// Query component of a request target ("/api/x?a=1&b=2").
std::unordered_map<std::string, std::string>
parseQuery(std::string_view Target);

} // namespace cricket::core
