#include "types/Event.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace gp::types;

static const char* VALID_ACTIONS_MSG = "Action must be one of [PUSH, PULL_REQUEST, MERGE]";

std::string gp::types::to_string(const Action& action) {
    switch (action) {
        case Action::PUSH: return "PUSH";
        case Action::PULL_REQUEST: return "PULL_REQUEST";
        case Action::MERGE: return "MERGE";
        default: throw ValidationError(VALID_ACTIONS_MSG);
    }
}

Action gp::types::action_from_string(const std::string& str) {
    if (str == "PUSH") return Action::PUSH;
    if (str == "PULL_REQUEST") return Action::PULL_REQUEST;
    if (str == "MERGE") return Action::MERGE;
    throw ValidationError(VALID_ACTIONS_MSG);
}

Event::Event(std::string requestId, std::string author, const Action action, std::string toBranch,
             std::optional<std::string> fromBranch, std::optional<std::string> timestamp)
    : request_id(std::move(requestId)),
      author(std::move(author)),
      action(action),
      from_branch(std::move(fromBranch)),
      to_branch(std::move(toBranch)),
      timestamp(timestamp ? std::move(*timestamp) : util::utcNowIso()) {}

Event::Event(std::string requestId, std::string author, const std::string& action, std::string toBranch,
             std::optional<std::string> fromBranch, std::optional<std::string> timestamp)
    : Event(std::move(requestId), std::move(author), action_from_string(action), std::move(toBranch),
            std::move(fromBranch), std::move(timestamp)) {}

nlohmann::json Event::toStorage() const {
    nlohmann::json j = {
        {"request_id", request_id},
        {"author", author},
        {"action", to_string(action)},
        {"from_branch", from_branch ? nlohmann::json(*from_branch) : nlohmann::json(nullptr)},
        {"to_branch", to_branch},
        {"timestamp", timestamp}
    };
    if (id) j["id"] = *id;
    return j;
}

Event Event::fromStorage(const nlohmann::json& j) {
    std::optional<std::string> fromBranch, timestamp;
    if (j.contains("from_branch") && !j.at("from_branch").is_null())
        fromBranch = j.at("from_branch").get<std::string>();
    if (j.contains("timestamp") && !j.at("timestamp").is_null())
        timestamp = j.at("timestamp").get<std::string>();

    Event e(j.at("request_id").get<std::string>(),
            j.at("author").get<std::string>(),
            j.at("action").get<std::string>(),
            j.at("to_branch").get<std::string>(),
            std::move(fromBranch),
            std::move(timestamp));

    if (j.contains("id") && !j.at("id").is_null()) e.id = j.at("id").get<std::string>();
    return e;
}

void gp::types::to_json(nlohmann::json& j, const Event& e) {
    j = e.toStorage();
}
