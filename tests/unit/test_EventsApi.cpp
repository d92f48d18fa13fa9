#include <gtest/gtest.h>
#include "api/EventsApi.hpp"
#include "storage/MemoryEventStore.hpp"
#include "types/Event.hpp"

using namespace gp::api;
using namespace gp::storage;
using namespace gp::types;

class EventsApiTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryEventStore> store = std::make_shared<MemoryEventStore>();
    EventsApi api{store};

    void fill(const std::size_t n) {
        for (std::size_t i = 0; i < n; ++i)
            store->insert(Event("r" + std::to_string(i), "alice", Action::PUSH, "main",
                                std::nullopt, "2024-03-07T14:30:00"));
    }
};

TEST_F(EventsApiTest, ClampsLimit) {
    EXPECT_EQ(api.clampLimit(std::nullopt), 50u);
    EXPECT_EQ(api.clampLimit(1000), 100u);
    EXPECT_EQ(api.clampLimit(-5), 0u);
    EXPECT_EQ(api.clampLimit(7), 7u);
}

TEST_F(EventsApiTest, ClampHonorsConfiguredBounds) {
    const EventsApi small(store, gp::config::ApiConfig{.default_limit = 5, .max_limit = 10});
    EXPECT_EQ(small.clampLimit(std::nullopt), 5u);
    EXPECT_EQ(small.clampLimit(1000), 10u);
}

TEST_F(EventsApiTest, ListReturnsFormattedEvents) {
    fill(3);
    const auto res = api.listEvents();
    EXPECT_EQ(res.status, Status::OK);
    EXPECT_EQ(res.body.at("status"), "success");
    EXPECT_EQ(res.body.at("count"), 3);
    ASSERT_EQ(res.body.at("events").size(), 3u);
    EXPECT_EQ(res.body.at("events")[0].at("message"),
              R"("alice" pushed to "main" on 07 March 2024 - 02:30 PM UTC)");
}

TEST_F(EventsApiTest, ListCapsAtMaximum) {
    fill(120);
    const auto res = api.listEvents(1000);
    EXPECT_EQ(res.body.at("count"), 100);
}

TEST_F(EventsApiTest, ZeroLimitIsEmpty) {
    fill(2);
    const auto res = api.listEvents(0);
    EXPECT_EQ(res.status, Status::OK);
    EXPECT_EQ(res.body.at("count"), 0);
    EXPECT_TRUE(res.body.at("events").empty());
}

TEST_F(EventsApiTest, GetEventFoundAndNotFound) {
    const auto id = store->insert(Event("r", "bob", Action::MERGE, "main", "feat", "2024-03-07T14:30:00"));

    const auto found = api.getEvent(id);
    EXPECT_EQ(found.status, Status::OK);
    EXPECT_EQ(found.body.at("event").at("id"), id);

    const auto missing = api.getEvent("unknown");
    EXPECT_EQ(missing.status, Status::NOT_FOUND);
    EXPECT_EQ(missing.body.at("error"), "Event not found");
}

TEST_F(EventsApiTest, SampleEventsReplaceStoreContents) {
    fill(4);
    const auto res = api.createSampleEvents();
    EXPECT_EQ(res.status, Status::OK);
    EXPECT_EQ(res.body.at("message"), "Created 3 sample events");
    EXPECT_EQ(res.body.at("event_ids").size(), 3u);
    EXPECT_EQ(store->size(), 3u);

    const auto merge = store->getById(res.body.at("event_ids")[2].get<std::string>());
    ASSERT_TRUE(merge.has_value());
    EXPECT_EQ(merge->author, "bob_wilson");
    EXPECT_EQ(merge->from_branch, "develop");
}

TEST(EventsApiStaticTest, HealthAndInfo) {
    const auto health = EventsApi::health();
    EXPECT_EQ(health.body.at("status"), "healthy");
    EXPECT_EQ(health.body.at("service"), "Git Ping API");

    const auto info = EventsApi::info();
    EXPECT_EQ(info.body.at("version"), SERVICE_VERSION);
    EXPECT_EQ(info.body.at("endpoints").at("webhook"), "/api/webhook");
}
