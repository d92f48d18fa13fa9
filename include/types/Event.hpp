#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gp::types {

class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class Action { PUSH, PULL_REQUEST, MERGE };

std::string to_string(const Action& action);

// Throws ValidationError for anything outside PUSH / PULL_REQUEST / MERGE.
Action action_from_string(const std::string& str);

/**
 * Canonical record of one repository action.
 *
 * Built transiently by the webhook parsers (no id), then handed to an
 * EventStore which assigns the id. Never mutated after insertion.
 */
struct Event {
    std::optional<std::string> id{};
    std::string request_id;
    std::string author;
    Action action{Action::PUSH};
    std::optional<std::string> from_branch{};
    std::string to_branch;
    std::string timestamp;   // ISO-8601 UTC, defaults to construction time

    Event(std::string requestId, std::string author, Action action, std::string toBranch,
          std::optional<std::string> fromBranch = std::nullopt,
          std::optional<std::string> timestamp = std::nullopt);

    Event(std::string requestId, std::string author, const std::string& action, std::string toBranch,
          std::optional<std::string> fromBranch = std::nullopt,
          std::optional<std::string> timestamp = std::nullopt);

    // Flat key-value form handed to the store; includes "id" only once assigned.
    [[nodiscard]] nlohmann::json toStorage() const;
    static Event fromStorage(const nlohmann::json& j);

    bool operator==(const Event& other) const = default;
};

void to_json(nlohmann::json& j, const Event& e);

}
