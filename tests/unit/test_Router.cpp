#include <gtest/gtest.h>
#include "protocols/http/Router.hpp"
#include "protocols/http/query.hpp"
#include "api/EventsApi.hpp"
#include "api/WebhookApi.hpp"
#include "webhook/Dispatcher.hpp"
#include "storage/MemoryEventStore.hpp"
#include "types/Event.hpp"

#include <limits>
#include <nlohmann/json.hpp>

using namespace gp::protocols::http;
using namespace gp::storage;
using json = nlohmann::json;

class RouterTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryEventStore> store = std::make_shared<MemoryEventStore>();
    Router router{std::make_shared<gp::api::EventsApi>(store),
                  std::make_shared<gp::api::WebhookApi>(store, std::make_shared<gp::webhook::Dispatcher>(store))};

    static request makeRequest(const verb method, const std::string& target, const std::string& body = "") {
        request req{method, target, 11};
        req.set(field::host, "localhost");
        if (!body.empty()) {
            req.set(field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        return req;
    }

    static json bodyOf(const string_response& res) { return json::parse(res.body()); }
};

TEST_F(RouterTest, EveryResponseIsJsonWithCors) {
    const auto res = router.route(makeRequest(verb::get, "/api/health"));
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(res[field::content_type], "application/json");
    EXPECT_EQ(res[field::access_control_allow_origin], "*");
    EXPECT_EQ(bodyOf(res).at("status"), "healthy");
}

TEST_F(RouterTest, ServiceInfo) {
    const auto res = router.route(makeRequest(verb::get, "/api"));
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(bodyOf(res).at("service"), "Git Ping API");
}

TEST_F(RouterTest, PreflightIsNoContent) {
    const auto res = router.route(makeRequest(verb::options, "/api/webhook"));
    EXPECT_EQ(res.result(), status::no_content);
    EXPECT_EQ(res[field::access_control_allow_methods], ALLOWED_METHODS);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(RouterTest, WebhookUsesGithubEventHeader) {
    auto req = makeRequest(verb::post, "/api/webhook",
                           R"({"ref":"refs/heads/main","pusher":{"name":"alice"},"commits":[{"id":"a"}]})");
    req.set("X-GitHub-Event", "push");

    const auto res = router.route(req);
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(bodyOf(res).at("status"), "success");
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(RouterTest, WebhookStatusMapping) {
    auto ignored = makeRequest(verb::post, "/api/webhook", R"({"zen":"hi"})");
    ignored.set("X-GitHub-Event", "ping");
    EXPECT_EQ(router.route(ignored).result(), status::ok);

    const auto malformed = makeRequest(verb::post, "/api/webhook");
    EXPECT_EQ(router.route(malformed).result(), status::bad_request);
}

TEST_F(RouterTest, ListEventsParsesLimit) {
    for (int i = 0; i < 3; ++i) store->insert(gp::types::Event("r", "a", gp::types::Action::PUSH, "main"));

    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events?limit=2"))).at("count"), 2);
    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events?limit=0"))).at("count"), 0);
    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events?limit=abc"))).at("count"), 3);
    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events"))).at("count"), 3);
}

TEST_F(RouterTest, HugeLimitClampsToMaximum) {
    for (int i = 0; i < 105; ++i) store->insert(gp::types::Event("r", "a", gp::types::Action::PUSH, "main"));

    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events?limit=99999999999999999999"))).at("count"), 100);
    EXPECT_EQ(bodyOf(router.route(makeRequest(verb::get, "/api/events?limit=-99999999999999999999"))).at("count"), 0);
}

TEST_F(RouterTest, GetEventByIdAndNotFound) {
    const auto id = store->insert(gp::types::Event("r", "a", gp::types::Action::PUSH, "main"));

    const auto found = router.route(makeRequest(verb::get, "/api/events/" + id));
    EXPECT_EQ(found.result(), status::ok);
    EXPECT_EQ(bodyOf(found).at("event").at("id"), id);

    const auto missing = router.route(makeRequest(verb::get, "/api/events/nope"));
    EXPECT_EQ(missing.result(), status::not_found);
    EXPECT_EQ(bodyOf(missing).at("error"), "Event not found");
}

TEST_F(RouterTest, SampleEndpoint) {
    const auto res = router.route(makeRequest(verb::post, "/api/events/sample"));
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(store->size(), 3u);
}

TEST_F(RouterTest, TestEventEndpoint) {
    EXPECT_EQ(router.route(makeRequest(verb::post, "/api/webhook/test")).result(), status::ok);
    EXPECT_EQ(router.route(makeRequest(verb::post, "/api/webhook/test", R"({"action":"NOPE"})")).result(),
              status::bad_request);
}

TEST_F(RouterTest, UnknownPathAndWrongMethod) {
    const auto unknown = router.route(makeRequest(verb::get, "/nowhere"));
    EXPECT_EQ(unknown.result(), status::not_found);
    EXPECT_EQ(bodyOf(unknown).at("error"), "Not found");

    EXPECT_EQ(router.route(makeRequest(verb::get, "/api/webhook")).result(), status::method_not_allowed);
    EXPECT_EQ(router.route(makeRequest(verb::post, "/api/events")).result(), status::method_not_allowed);
    EXPECT_EQ(router.route(makeRequest(verb::get, "/api/events/a/b")).result(), status::not_found);
}

TEST_F(RouterTest, BadPercentEncodingIsBadRequest) {
    EXPECT_EQ(router.route(makeRequest(verb::get, "/api/events?limit=%zz")).result(), status::bad_request);
}

TEST(RouterStatusTest, MapsApiStatuses) {
    using gp::api::Status;
    EXPECT_EQ(Router::toHttpStatus(Status::OK), status::ok);
    EXPECT_EQ(Router::toHttpStatus(Status::IGNORED), status::ok);
    EXPECT_EQ(Router::toHttpStatus(Status::NOT_FOUND), status::not_found);
    EXPECT_EQ(Router::toHttpStatus(Status::BAD_REQUEST), status::bad_request);
    EXPECT_EQ(Router::toHttpStatus(Status::ERROR), status::internal_server_error);
    EXPECT_EQ(gp::api::to_string(Status::NOT_FOUND), "not_found");
    EXPECT_EQ(gp::api::to_string(Status::IGNORED), "ignored");
}

TEST(QueryTest, DecodesAndSplitsParams) {
    const auto params = parse_query_params("/api/events?limit=5&name=a%20b+c&flag");
    EXPECT_EQ(params.at("limit"), "5");
    EXPECT_EQ(params.at("name"), "a b c");
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_TRUE(parse_query_params("/api/events").empty());
    EXPECT_EQ(target_path("/api/events?limit=5"), "/api/events");
}

TEST(QueryTest, ParsesIntegersStrictly) {
    EXPECT_EQ(parse_integer("42"), 42);
    EXPECT_EQ(parse_integer("-3"), -3);
    EXPECT_EQ(parse_integer("+7"), 7);
    EXPECT_FALSE(parse_integer("").has_value());
    EXPECT_FALSE(parse_integer("4x").has_value());
    EXPECT_FALSE(parse_integer("1.5").has_value());
    EXPECT_THROW(url_decode("%4"), std::invalid_argument);
}

TEST(QueryTest, OutOfRangeIntegersSaturate) {
    EXPECT_EQ(parse_integer("99999999999999999999"), std::numeric_limits<long long>::max());
    EXPECT_EQ(parse_integer("-99999999999999999999"), std::numeric_limits<long long>::min());
    EXPECT_FALSE(parse_integer("99999999999999999999x").has_value());
}
