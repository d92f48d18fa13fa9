#pragma once

#include "types/Event.hpp"
#include "webhook/payload/Push.hpp"
#include "webhook/payload/PullRequest.hpp"

#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace gp::webhook {

inline constexpr const char* UNKNOWN_AUTHOR = "Unknown";
inline constexpr const char* BRANCH_REF_PREFIX = "refs/heads/";

// Pure mappings from a decoded payload to an Event; nullopt means "not applicable".
std::optional<types::Event> fromPush(const payload::Push& push);
std::optional<types::Event> fromPullRequestOpened(const payload::PullRequest& pr);
std::optional<types::Event> fromMerge(const payload::PullRequest& pr);

// Decode-then-map. A malformed payload is logged and yields nullopt.
std::optional<types::Event> parsePush(const nlohmann::json& payload);
std::optional<types::Event> parsePullRequestOpened(const nlohmann::json& payload);
std::optional<types::Event> parseMerge(const nlohmann::json& payload);

std::string stripBranchPrefix(const std::string& ref);

}
