#include "types/StoredEvent.hpp"
#include "types/Event.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace gp::types;

StoredEvent::StoredEvent(std::string id, const Event& event)
    : id(std::move(id)),
      request_id(event.request_id),
      author(event.author),
      action(to_string(event.action)),
      from_branch(event.from_branch),
      to_branch(event.to_branch),
      timestamp(event.timestamp) {}

StoredEvent::StoredEvent(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      request_id(row["request_id"].as<std::string>()),
      author(row["author"].as<std::string>()),
      action(row["action"].as<std::string>()),
      to_branch(row["to_branch"].as<std::string>()),
      timestamp(row["timestamp"].as<std::string>()) {
    if (!row["from_branch"].is_null()) from_branch = row["from_branch"].as<std::string>();
}

void gp::types::to_json(nlohmann::json& j, const StoredEvent& e) {
    j = {
        {"id", e.id},
        {"request_id", e.request_id},
        {"author", e.author},
        {"action", e.action},
        {"from_branch", e.from_branch ? nlohmann::json(*e.from_branch) : nlohmann::json(nullptr)},
        {"to_branch", e.to_branch},
        {"timestamp", e.timestamp}
    };
}
