#include <gtest/gtest.h>
#include "webhook/Dispatcher.hpp"
#include "storage/MemoryEventStore.hpp"

#include <nlohmann/json.hpp>

using namespace gp::webhook;
using namespace gp::storage;
using namespace gp::types;
using json = nlohmann::json;

namespace {

class FailingEventStore final : public EventStore {
public:
    std::string insert(const Event&) override { throw StoreError("connection refused"); }
    std::vector<StoredEvent> listLatest(std::size_t) const override { return {}; }
    std::optional<StoredEvent> getById(const std::string&) const override { return std::nullopt; }
    std::size_t deleteAll() override { return 0; }
};

const json PUSH = json::parse(R"({
    "ref": "refs/heads/main",
    "pusher": {"name": "alice"},
    "commits": [{"id": "a"}, {"id": "b"}]
})");

json pullRequest(const std::string& action, const bool merged) {
    return {
        {"action", action},
        {"pull_request", {
            {"id", 7},
            {"user", {{"login", "bob"}}},
            {"merged_by", {{"login", "carol"}}},
            {"base", {{"ref", "main"}}},
            {"head", {{"ref", "feat"}}},
            {"merged", merged}
        }}
    };
}

}

class DispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryEventStore> store = std::make_shared<MemoryEventStore>();
    Dispatcher dispatcher{store};
};

TEST_F(DispatcherTest, StoresPush) {
    const auto res = dispatcher.dispatch("push", PUSH);
    EXPECT_EQ(res.outcome, IngestResult::Outcome::Stored);
    ASSERT_TRUE(res.event_id.has_value());

    const auto stored = store->getById(*res.event_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->request_id, "b");
    EXPECT_EQ(stored->action, "PUSH");
}

TEST_F(DispatcherTest, StoresOpenedAndMergedPullRequests) {
    EXPECT_EQ(dispatcher.dispatch("pull_request", pullRequest("opened", false)).outcome,
              IngestResult::Outcome::Stored);
    EXPECT_EQ(dispatcher.dispatch("pull_request", pullRequest("closed", true)).outcome,
              IngestResult::Outcome::Stored);

    const auto latest = store->listLatest(10);
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[0].action, "MERGE");
    EXPECT_EQ(latest[0].author, "carol");
    EXPECT_EQ(latest[1].action, "PULL_REQUEST");
}

TEST_F(DispatcherTest, IgnoresUnhandledDeliveries) {
    const auto unmerged = dispatcher.dispatch("pull_request", pullRequest("closed", false));
    EXPECT_EQ(unmerged.outcome, IngestResult::Outcome::Ignored);
    EXPECT_EQ(unmerged.message, "Event type pull_request not processed");

    EXPECT_EQ(dispatcher.dispatch("pull_request", pullRequest("synchronize", false)).outcome,
              IngestResult::Outcome::Ignored);

    const auto issue = dispatcher.dispatch("issues", json{{"action", "opened"}});
    EXPECT_EQ(issue.message, "Event type issues not processed");

    const auto untyped = dispatcher.dispatch("", PUSH);
    EXPECT_EQ(untyped.outcome, IngestResult::Outcome::Ignored);
    EXPECT_EQ(untyped.message, "Event type none not processed");

    EXPECT_EQ(store->size(), 0u);
}

TEST_F(DispatcherTest, EmptyPushIsIgnored) {
    auto payload = PUSH;
    payload["commits"] = json::array();
    EXPECT_EQ(dispatcher.dispatch("push", payload).outcome, IngestResult::Outcome::Ignored);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(DispatcherTest, MissingPayloadIsMalformed) {
    for (const auto& payload : {json(nullptr), json::object(), json::array({1, 2}), json("text")}) {
        const auto res = dispatcher.dispatch("push", payload);
        EXPECT_EQ(res.outcome, IngestResult::Outcome::Malformed) << payload.dump();
        EXPECT_EQ(res.message, "No payload received");
    }
}

TEST_F(DispatcherTest, NoDeduplicationOfRepeatedDeliveries) {
    const auto first = dispatcher.dispatch("push", PUSH);
    const auto second = dispatcher.dispatch("push", PUSH);
    ASSERT_TRUE(first.event_id && second.event_id);
    EXPECT_NE(*first.event_id, *second.event_id);
    EXPECT_EQ(store->size(), 2u);
}

TEST(DispatcherFailureTest, StoreErrorBecomesFailed) {
    const Dispatcher dispatcher(std::make_shared<FailingEventStore>());
    const auto res = dispatcher.dispatch("push", PUSH);
    EXPECT_EQ(res.outcome, IngestResult::Outcome::Failed);
    EXPECT_EQ(res.message, "Failed to save event");
    EXPECT_FALSE(res.event_id.has_value());
}

TEST(IngestResultTest, OutcomeNames) {
    EXPECT_EQ(to_string(IngestResult::Outcome::Stored), "stored");
    EXPECT_EQ(to_string(IngestResult::Outcome::Malformed), "malformed");
}

TEST(DispatcherFailureTest, RequiresStore) {
    EXPECT_THROW(Dispatcher(nullptr), std::invalid_argument);
}
