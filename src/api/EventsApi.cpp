#include "api/EventsApi.hpp"
#include "api/format.hpp"
#include "storage/EventStore.hpp"
#include "types/Event.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <vector>

using namespace gp::api;
using namespace gp::types;
using namespace gp::storage;
using namespace gp::log;

EventsApi::EventsApi(std::shared_ptr<EventStore> store, config::ApiConfig cfg)
    : store_(std::move(store)), cfg_(cfg) {
    if (!store_) throw std::invalid_argument("EventsApi requires an event store");
}

std::size_t EventsApi::clampLimit(const std::optional<long long> requested) const {
    const long long limit = requested.value_or(static_cast<long long>(cfg_.default_limit));
    return static_cast<std::size_t>(std::clamp(limit, 0LL, static_cast<long long>(cfg_.max_limit)));
}

Response EventsApi::listEvents(const std::optional<long long> requestedLimit) const {
    const auto limit = clampLimit(requestedLimit);

    json events = json::array();
    if (limit > 0)
        for (const auto& e : store_->listLatest(limit)) events.push_back(toDisplayJson(e));

    Registry::api()->debug("[EventsApi] Listing {} event(s) (limit {})", events.size(), limit);

    return Response::SUCCESS({
        {"status", "success"},
        {"count", events.size()},
        {"events", std::move(events)}
    });
}

Response EventsApi::getEvent(const std::string& id) const {
    const auto event = store_->getById(id);
    if (!event) return Response::NOT_FOUND("Event not found");

    return Response::SUCCESS({
        {"status", "success"},
        {"event", toDisplayJson(*event)}
    });
}

Response EventsApi::createSampleEvents() const {
    const auto deleted = store_->deleteAll();
    Registry::api()->info("[EventsApi] Deleted {} existing events", deleted);

    const std::vector<Event> samples{
        {"abc123", "john_doe", Action::PUSH, "main"},
        {"def456", "jane_smith", Action::PULL_REQUEST, "main", "feature-branch"},
        {"ghi789", "bob_wilson", Action::MERGE, "main", "develop"},
    };

    json ids = json::array();
    for (const auto& event : samples) {
        try {
            ids.push_back(store_->insert(event));
        } catch (const StoreError& e) {
            Registry::api()->error("[EventsApi] Error saving sample event {}: {}", event.request_id, e.what());
        }
    }

    const auto count = ids.size();
    return Response::SUCCESS({
        {"status", "success"},
        {"message", "Created " + std::to_string(count) + " sample events"},
        {"event_ids", std::move(ids)}
    });
}

Response EventsApi::health() {
    return Response::SUCCESS({
        {"status", "healthy"},
        {"service", SERVICE_NAME},
        {"timestamp", util::utcNowIso()}
    });
}

Response EventsApi::info() {
    return Response::SUCCESS({
        {"service", SERVICE_NAME},
        {"version", SERVICE_VERSION},
        {"endpoints", {
            {"webhook", "/api/webhook"},
            {"events", "/api/events"},
            {"health", "/api/health"}
        }}
    });
}
