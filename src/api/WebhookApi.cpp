#include "api/WebhookApi.hpp"
#include "webhook/Dispatcher.hpp"
#include "storage/EventStore.hpp"
#include "types/Event.hpp"
#include "log/Registry.hpp"

using namespace gp::api;
using namespace gp::webhook;
using namespace gp::types;
using namespace gp::storage;
using namespace gp::log;

WebhookApi::WebhookApi(std::shared_ptr<EventStore> store, std::shared_ptr<Dispatcher> dispatcher)
    : store_(std::move(store)), dispatcher_(std::move(dispatcher)) {
    if (!store_ || !dispatcher_) throw std::invalid_argument("WebhookApi requires a store and a dispatcher");
}

Response WebhookApi::receive(const std::string& eventType, const std::string& body) const {
    // unparseable bodies are treated like missing ones
    const auto payload = body.empty() ? json(nullptr) : json::parse(body, nullptr, false);
    const auto result = dispatcher_->dispatch(eventType, payload.is_discarded() ? json(nullptr) : payload);
    Registry::webhook()->debug("[WebhookApi] '{}' delivery {}: {}", eventType, to_string(result.outcome), result.message);

    switch (result.outcome) {
    case IngestResult::Outcome::Stored:
        return Response::SUCCESS({
            {"status", "success"},
            {"message", result.message},
            {"event_id", *result.event_id}
        });
    case IngestResult::Outcome::Ignored: return Response::IGNORED(std::string(result.message));
    case IngestResult::Outcome::Malformed: return Response::BAD_REQUEST(std::string(result.message));
    case IngestResult::Outcome::Failed:
    default: return Response::ERROR(std::string(result.message));
    }
}

Response WebhookApi::createTestEvent(const std::string& body) const {
    const auto data = body.empty() ? json::object() : json::parse(body, nullptr, false);
    if (data.is_discarded()) return Response::BAD_REQUEST("Invalid JSON body");
    if (!data.is_null() && !data.is_object()) return Response::BAD_REQUEST("Test event body must be a JSON object");

    const auto fields = data.is_null() ? json::object() : data;

    try {
        std::optional<std::string> fromBranch;
        if (const auto it = fields.find("from_branch"); it != fields.end() && !it->is_null())
            fromBranch = it->get<std::string>();

        const Event event(fields.value("request_id", "test-123"),
                          fields.value("author", "test-user"),
                          fields.value("action", "PUSH"),
                          fields.value("to_branch", "main"),
                          std::move(fromBranch));

        const auto id = store_->insert(event);
        Registry::webhook()->info("[WebhookApi] Created test {} event with ID: {}", to_string(event.action), id);

        return Response::SUCCESS({
            {"status", "success"},
            {"message", "Test event created successfully"},
            {"event_id", id}
        });
    } catch (const ValidationError& e) {
        return Response::BAD_REQUEST(e.what());
    } catch (const json::exception& e) {
        return Response::BAD_REQUEST(std::string("Invalid test event field: ") + e.what());
    } catch (const StoreError& e) {
        Registry::webhook()->error("[WebhookApi] Error creating test event: {}", e.what());
        return Response::ERROR("Failed to save test event");
    }
}
