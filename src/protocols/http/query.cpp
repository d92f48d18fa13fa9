#include "protocols/http/query.hpp"

#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace gp::protocols::http {

static int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.length())
                throw std::invalid_argument("Invalid percent-encoding in URL");
            const int hi = hexValue(value[i + 1]), lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (value[i] == '+') result += ' ';
        else result += value[i];
    }
    return result;
}

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string::npos) return params;

    std::istringstream stream(target.substr(pos + 1));
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) params[url_decode(pair)] = "";
        else params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }

    return params;
}

std::string target_path(const std::string& target) {
    return target.substr(0, target.find('?'));
}

std::optional<long long> parse_integer(const std::string& value) {
    if (value.empty()) return std::nullopt;

    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (*first == '+') ++first;

    long long out = 0;
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ptr != last) return std::nullopt;
    if (ec == std::errc::result_out_of_range)
        return value.front() == '-' ? std::numeric_limits<long long>::min() : std::numeric_limits<long long>::max();
    if (ec != std::errc{}) return std::nullopt;
    return out;
}

}
