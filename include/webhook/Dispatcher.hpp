#pragma once

#include "types/Event.hpp"

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gp::storage { class EventStore; }

namespace gp::webhook {

struct IngestResult {
    enum class Outcome { Stored, Ignored, Malformed, Failed };

    Outcome outcome{Outcome::Ignored};
    std::string message;
    std::optional<std::string> event_id{};

    static IngestResult stored(std::string eventId);
    static IngestResult ignored(std::string message);
    static IngestResult malformed(std::string message);
    static IngestResult failed(std::string message);
};

std::string to_string(const IngestResult::Outcome& outcome);

/**
 * Routes a webhook delivery to the matching parser and persists the result.
 *
 *   push                                   -> parsePush
 *   pull_request, action=opened            -> parsePullRequestOpened
 *   pull_request, action=closed, merged    -> parseMerge
 *   anything else                          -> ignored
 *
 * Holds no state beyond the store it writes to.
 */
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<storage::EventStore> store);

    // eventType is the X-GitHub-Event header; empty when the header was absent.
    [[nodiscard]] IngestResult dispatch(const std::string& eventType, const nlohmann::json& payload) const;

    // Routing and parsing only, no persistence.
    static std::optional<types::Event> route(const std::string& eventType, const nlohmann::json& payload);

    static bool isEmptyPayload(const nlohmann::json& payload);

private:
    std::shared_ptr<storage::EventStore> store_;
};

}
