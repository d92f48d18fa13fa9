#include "webhook/parsers.hpp"
#include "webhook/ParseFailure.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace gp::types;
using namespace gp::log;

namespace gp::webhook {

std::string stripBranchPrefix(const std::string& ref) {
    const std::string prefix(BRANCH_REF_PREFIX);
    if (ref.starts_with(prefix)) return ref.substr(prefix.size());
    return ref;
}

static std::string loginOrUnknown(const std::optional<payload::User>& user) {
    if (user && user->login) return *user->login;
    return UNKNOWN_AUTHOR;
}

static std::string refOrEmpty(const std::optional<payload::BranchRef>& branch) {
    if (branch && branch->ref) return *branch->ref;
    return {};
}

std::optional<Event> fromPush(const payload::Push& push) {
    // a push without commits (branch deletion, tag push) is not an event
    if (!push.latest_commit) return std::nullopt;

    const auto& latest = *push.latest_commit;
    const auto author = push.pusher && push.pusher->name ? *push.pusher->name : std::string(UNKNOWN_AUTHOR);

    return Event(latest.id.value_or(""),
                 author,
                 Action::PUSH,
                 stripBranchPrefix(push.ref.value_or("")));
}

std::optional<Event> fromPullRequestOpened(const payload::PullRequest& pr) {
    return Event(pr.id.value_or(""),
                 loginOrUnknown(pr.user),
                 Action::PULL_REQUEST,
                 refOrEmpty(pr.base),
                 refOrEmpty(pr.head));
}

std::optional<Event> fromMerge(const payload::PullRequest& pr) {
    // closed-but-unmerged pull requests land here too
    if (!pr.merged) return std::nullopt;

    return Event(pr.id.value_or(""),
                 loginOrUnknown(pr.merged_by),
                 Action::MERGE,
                 refOrEmpty(pr.base),
                 refOrEmpty(pr.head));
}

template <typename Payload, typename Mapper>
static std::optional<Event> decodeAndMap(const char* ctx, const nlohmann::json& j, Mapper&& map) {
    try {
        return map(j.get<Payload>());
    } catch (const ParseFailure& e) {
        Registry::webhook()->warn("[{}] Malformed payload: {}", ctx, e.what());
    } catch (const nlohmann::json::exception& e) {
        Registry::webhook()->warn("[{}] Malformed payload: {}", ctx, e.what());
    }
    return std::nullopt;
}

std::optional<Event> parsePush(const nlohmann::json& payload) {
    return decodeAndMap<payload::Push>("parsePush", payload, fromPush);
}

std::optional<Event> parsePullRequestOpened(const nlohmann::json& payload) {
    return decodeAndMap<payload::PullRequestEvent>("parsePullRequestOpened", payload,
        [](const payload::PullRequestEvent& e) { return fromPullRequestOpened(e.pull_request); });
}

std::optional<Event> parseMerge(const nlohmann::json& payload) {
    return decodeAndMap<payload::PullRequestEvent>("parseMerge", payload,
        [](const payload::PullRequestEvent& e) { return fromMerge(e.pull_request); });
}

}
