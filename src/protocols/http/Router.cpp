#include "protocols/http/Router.hpp"
#include "protocols/http/query.hpp"
#include "api/EventsApi.hpp"
#include "api/WebhookApi.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

using namespace gp::protocols::http;
using namespace gp::api;
using namespace gp::log;

static const std::string API_PREFIX = "/api";
static const std::string EVENTS_PREFIX = "/api/events/";

namespace {

// Thrown for a path that exists but does not accept the request method.
struct MethodNotAllowed {};

void addCommonHeaders(string_response& res) {
    res.set(field::content_type, "application/json");
    res.set(field::access_control_allow_origin, "*");
    res.set(field::access_control_allow_methods, ALLOWED_METHODS);
    res.set(field::access_control_allow_headers, ALLOWED_HEADERS);
}

std::string headerOrEmpty(const request& req, const char* name) {
    const auto it = req.find(name);
    if (it == req.end()) return {};
    return {it->value().data(), it->value().size()};
}

std::string methodName(const request& req) {
    const auto m = req.method_string();
    return {m.data(), m.size()};
}

void requireMethod(const request& req, const verb v) {
    if (req.method() != v) throw MethodNotAllowed{};
}

}

Router::Router(std::shared_ptr<EventsApi> events, std::shared_ptr<WebhookApi> webhook)
    : events_(std::move(events)), webhook_(std::move(webhook)) {}

string_response Router::route(const request& req) const {
    const std::string target(req.target().data(), req.target().size());

    if (req.method() == verb::options) return makePreflightResponse(req);

    try {
        const auto res = dispatch(req, target);
        if (res.status == Status::ERROR)
            Registry::http()->warn("[Router] {} {} -> {} ({})", methodName(req), target, to_string(res.status),
                                   res.body.value("error", ""));
        else
            Registry::http()->debug("[Router] {} {} -> {}", methodName(req), target, to_string(res.status));
        return makeJsonResponse(req, res);
    } catch (const MethodNotAllowed&) {
        return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
    } catch (const std::invalid_argument& e) {
        Registry::http()->warn("[Router] Bad request target {}: {}", target, e.what());
        return makeErrorResponse(req, e.what(), status::bad_request);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Unhandled exception for {} {}: {}",
                                methodName(req), target, e.what());
        return makeErrorResponse(req, "Internal server error", status::internal_server_error);
    }
}

Response Router::dispatch(const request& req, const std::string& target) const {
    auto path = target_path(target);
    if (path.size() > 1 && path.ends_with('/')) path.pop_back();

    if (path == API_PREFIX) {
        requireMethod(req, verb::get);
        return EventsApi::info();
    }

    if (path == "/api/health") {
        requireMethod(req, verb::get);
        return EventsApi::health();
    }

    if (path == "/api/webhook") {
        requireMethod(req, verb::post);
        return webhook_->receive(headerOrEmpty(req, "X-GitHub-Event"), req.body());
    }

    if (path == "/api/webhook/test") {
        requireMethod(req, verb::post);
        return webhook_->createTestEvent(req.body());
    }

    if (path == "/api/events") {
        requireMethod(req, verb::get);
        std::optional<long long> limit;
        const auto params = parse_query_params(target);
        if (const auto it = params.find("limit"); it != params.end()) limit = parse_integer(it->second);
        return events_->listEvents(limit);
    }

    if (path == "/api/events/sample") {
        requireMethod(req, verb::post);
        return events_->createSampleEvents();
    }

    if (path.starts_with(EVENTS_PREFIX)) {
        const auto id = url_decode(path.substr(EVENTS_PREFIX.size()));
        if (!id.empty() && id.find('/') == std::string::npos) {
            requireMethod(req, verb::get);
            return events_->getEvent(id);
        }
    }

    return Response::NOT_FOUND("Not found");
}

status Router::toHttpStatus(const Status& s) {
    switch (s) {
        case Status::OK:
        case Status::IGNORED: return status::ok;
        case Status::NOT_FOUND: return status::not_found;
        case Status::BAD_REQUEST: return status::bad_request;
        case Status::ERROR: return status::internal_server_error;
    }
    return status::internal_server_error;
}

string_response Router::makeJsonResponse(const request& req, const Response& res) {
    string_response out{toHttpStatus(res.status), req.version()};
    addCommonHeaders(out);
    out.keep_alive(req.keep_alive());
    out.body() = res.body.dump();
    out.prepare_payload();
    return out;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    string_response out{s, req.version()};
    addCommonHeaders(out);
    out.keep_alive(req.keep_alive());
    out.body() = nlohmann::json{{"error", msg}}.dump();
    out.prepare_payload();
    return out;
}

string_response Router::makePreflightResponse(const request& req) {
    string_response out{status::no_content, req.version()};
    addCommonHeaders(out);
    out.keep_alive(req.keep_alive());
    out.prepare_payload();
    return out;
}
