#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace gp::types {

struct Event;

// An event as read back from a store. The action stays a raw string so rows
// written by other producers can still be listed.
struct StoredEvent {
    std::string id;
    std::string request_id;
    std::string author;
    std::string action;
    std::optional<std::string> from_branch{};
    std::string to_branch;
    std::string timestamp;

    StoredEvent() = default;
    StoredEvent(std::string id, const Event& event);
    explicit StoredEvent(const pqxx::row& row);

    bool operator==(const StoredEvent& other) const = default;
};

void to_json(nlohmann::json& j, const StoredEvent& e);

}
