#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace gp::protocols::http {

// Throws std::invalid_argument on a malformed %XX escape.
std::string url_decode(const std::string& value);

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target);

// Path component of a request target, query string removed.
std::string target_path(const std::string& target);

// Accepts an optionally signed decimal integer and nothing else. Out-of-range values saturate.
std::optional<long long> parse_integer(const std::string& value);

}
