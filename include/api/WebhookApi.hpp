#pragma once

#include "api/Response.hpp"

#include <memory>
#include <string>

namespace gp::storage { class EventStore; }
namespace gp::webhook { class Dispatcher; }

namespace gp::api {

// Write side: webhook deliveries and the direct test-event insert.
class WebhookApi {
public:
    WebhookApi(std::shared_ptr<storage::EventStore> store, std::shared_ptr<webhook::Dispatcher> dispatcher);

    // eventType is the X-GitHub-Event header (empty when absent), body the raw request body.
    [[nodiscard]] Response receive(const std::string& eventType, const std::string& body) const;

    // Builds one event straight from the body fields, skipping the parsers.
    [[nodiscard]] Response createTestEvent(const std::string& body) const;

private:
    std::shared_ptr<storage::EventStore> store_;
    std::shared_ptr<webhook::Dispatcher> dispatcher_;
};

}
