#pragma once

#include "api/Response.hpp"

#include <boost/beast/http.hpp>
#include <memory>
#include <string>

namespace gp::api { class EventsApi; class WebhookApi; }

namespace gp::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

inline constexpr const char* ALLOWED_METHODS = "GET, POST, OPTIONS";
inline constexpr const char* ALLOWED_HEADERS = "Content-Type, X-GitHub-Event, X-GitHub-Delivery";

// Maps /api/* requests onto the events and webhook APIs. Every reply is JSON with CORS headers.
class Router {
public:
    Router(std::shared_ptr<api::EventsApi> events, std::shared_ptr<api::WebhookApi> webhook);

    [[nodiscard]] string_response route(const request& req) const;

    static status toHttpStatus(const api::Status& s);

    static string_response makeJsonResponse(const request& req, const api::Response& res);
    static string_response makeErrorResponse(const request& req, const std::string& msg, status s);
    static string_response makePreflightResponse(const request& req);

private:
    api::Response dispatch(const request& req, const std::string& target) const;

    std::shared_ptr<api::EventsApi> events_;
    std::shared_ptr<api::WebhookApi> webhook_;
};

}
