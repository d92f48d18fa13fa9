#include "webhook/Dispatcher.hpp"
#include "webhook/parsers.hpp"
#include "storage/EventStore.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace gp::webhook;
using namespace gp::types;
using namespace gp::log;

IngestResult IngestResult::stored(std::string eventId) {
    return {Outcome::Stored, "Event processed successfully", std::move(eventId)};
}

IngestResult IngestResult::ignored(std::string message) {
    return {Outcome::Ignored, std::move(message), std::nullopt};
}

IngestResult IngestResult::malformed(std::string message) {
    return {Outcome::Malformed, std::move(message), std::nullopt};
}

IngestResult IngestResult::failed(std::string message) {
    return {Outcome::Failed, std::move(message), std::nullopt};
}

std::string gp::webhook::to_string(const IngestResult::Outcome& outcome) {
    switch (outcome) {
        case IngestResult::Outcome::Stored: return "stored";
        case IngestResult::Outcome::Ignored: return "ignored";
        case IngestResult::Outcome::Malformed: return "malformed";
        case IngestResult::Outcome::Failed: return "failed";
        default: return "unknown";
    }
}

// Lenient lookups used for routing only; a field of the wrong type simply doesn't match.
static std::optional<std::string> stringAt(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static bool isMerged(const nlohmann::json& payload) {
    const auto pr = payload.find("pull_request");
    if (pr == payload.end() || !pr->is_object()) return false;
    const auto merged = pr->find("merged");
    return merged != pr->end() && merged->is_boolean() && merged->get<bool>();
}

Dispatcher::Dispatcher(std::shared_ptr<storage::EventStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Dispatcher requires an event store");
}

bool Dispatcher::isEmptyPayload(const nlohmann::json& payload) {
    return !payload.is_object() || payload.empty();
}

std::optional<Event> Dispatcher::route(const std::string& eventType, const nlohmann::json& payload) {
    if (eventType == "push") return parsePush(payload);

    if (eventType == "pull_request") {
        const auto action = stringAt(payload, "action");
        if (action == "opened") return parsePullRequestOpened(payload);
        if (action == "closed" && isMerged(payload)) return parseMerge(payload);
    }

    return std::nullopt;
}

IngestResult Dispatcher::dispatch(const std::string& eventType, const nlohmann::json& payload) const {
    if (isEmptyPayload(payload)) {
        Registry::webhook()->warn("[Dispatcher] Rejected '{}' delivery without a payload", eventType);
        return IngestResult::malformed("No payload received");
    }

    const auto typeName = eventType.empty() ? std::string("none") : eventType;
    Registry::webhook()->info("[Dispatcher] Received GitHub event: {}", typeName);

    const auto event = route(eventType, payload);
    if (!event) {
        Registry::webhook()->debug("[Dispatcher] Ignoring '{}' delivery", typeName);
        return IngestResult::ignored("Event type " + typeName + " not processed");
    }

    try {
        auto id = store_->insert(*event);
        Registry::webhook()->info("[Dispatcher] Saved {} event with ID: {}", to_string(event->action), id);
        return IngestResult::stored(std::move(id));
    } catch (const storage::StoreError& e) {
        Registry::webhook()->error("[Dispatcher] Failed to save {} event: {}", to_string(event->action), e.what());
        return IngestResult::failed("Failed to save event");
    }
}
