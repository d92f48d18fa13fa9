#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gp::types { struct StoredEvent; }

namespace gp::api {

// "07 March 2024 - 02:30 PM UTC"; the raw string comes back unchanged if it isn't ISO-8601.
std::string formatTimestamp(const std::string& iso);

std::string formatMessage(const types::StoredEvent& event);

// Stored fields plus formatted_timestamp and message.
nlohmann::json toDisplayJson(const types::StoredEvent& event);

}
