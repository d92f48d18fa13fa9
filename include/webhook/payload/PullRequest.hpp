#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gp::webhook::payload {

struct User {
    std::optional<std::string> login;
};

struct BranchRef {
    std::optional<std::string> ref;
};

struct PullRequest {
    std::optional<std::string> id;   // numeric on the wire, kept in string form
    std::optional<User> user;
    std::optional<User> merged_by;
    std::optional<BranchRef> base;
    std::optional<BranchRef> head;
    bool merged{false};
};

// A "pull_request" delivery: the action verb plus the pull request itself.
struct PullRequestEvent {
    std::optional<std::string> action;
    PullRequest pull_request;
};

void from_json(const nlohmann::json& j, User& u);
void from_json(const nlohmann::json& j, BranchRef& b);
void from_json(const nlohmann::json& j, PullRequest& pr);
void from_json(const nlohmann::json& j, PullRequestEvent& e);

}
