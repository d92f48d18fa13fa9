#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gp::webhook::payload {

struct Commit {
    std::optional<std::string> id;
};

struct Pusher {
    std::optional<std::string> name;
};

// The subset of a "push" delivery we read. Every field may be missing.
// Only the last entry of "commits" is decoded; earlier entries are never inspected.
struct Push {
    std::optional<Commit> latest_commit;
    std::optional<std::string> ref;
    std::optional<Pusher> pusher;
};

void from_json(const nlohmann::json& j, Commit& c);
void from_json(const nlohmann::json& j, Pusher& p);
void from_json(const nlohmann::json& j, Push& p);

}
