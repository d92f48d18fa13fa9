#include "webhook/payload/PullRequest.hpp"
#include "webhook/payload/fields.hpp"

namespace gp::webhook::payload {

void from_json(const json& j, User& u) {
    u.login = optionalString(j, "login");
}

void from_json(const json& j, BranchRef& b) {
    b.ref = optionalString(j, "ref");
}

void from_json(const json& j, PullRequest& pr) {
    pr.id = optionalScalarString(j, "id");
    pr.user = optionalObject<User>(j, "user");
    pr.merged_by = optionalObject<User>(j, "merged_by");
    pr.base = optionalObject<BranchRef>(j, "base");
    pr.head = optionalObject<BranchRef>(j, "head");
    pr.merged = optionalBool(j, "merged", false);
}

void from_json(const json& j, PullRequestEvent& e) {
    e.action = optionalString(j, "action");
    e.pull_request = optionalObject<PullRequest>(j, "pull_request").value_or(PullRequest{});
}

}
