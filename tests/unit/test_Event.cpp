#include <gtest/gtest.h>
#include "types/Event.hpp"
#include "types/StoredEvent.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace gp::types;

TEST(ActionTest, ParsesKnownActions) {
    EXPECT_EQ(action_from_string("PUSH"), Action::PUSH);
    EXPECT_EQ(action_from_string("PULL_REQUEST"), Action::PULL_REQUEST);
    EXPECT_EQ(action_from_string("MERGE"), Action::MERGE);
}

TEST(ActionTest, RejectsUnknownAction) {
    EXPECT_THROW(action_from_string("DELETE"), ValidationError);
    EXPECT_THROW(action_from_string("push"), ValidationError);
    EXPECT_THROW(action_from_string(""), ValidationError);
}

TEST(ActionTest, ToStringMatchesWireNames) {
    EXPECT_EQ(to_string(Action::PUSH), "PUSH");
    EXPECT_EQ(to_string(Action::PULL_REQUEST), "PULL_REQUEST");
    EXPECT_EQ(to_string(Action::MERGE), "MERGE");
}

TEST(EventTest, StringActionConstructorValidates) {
    EXPECT_THROW(Event("r1", "alice", std::string("TAG"), "main"), ValidationError);
    EXPECT_NO_THROW(Event("r1", "alice", std::string("MERGE"), "main", "dev"));
}

TEST(EventTest, DefaultsTimestampToNow) {
    const Event e("r1", "alice", Action::PUSH, "main");
    EXPECT_FALSE(e.id.has_value());
    EXPECT_FALSE(e.from_branch.has_value());
    EXPECT_TRUE(gp::util::parseIsoTimestamp(e.timestamp).has_value()) << e.timestamp;
}

TEST(EventTest, StorageFormHasNullFromBranchAndNoId) {
    const Event e("r1", "alice", Action::PUSH, "main", std::nullopt, "2024-03-07T14:30:00");
    const auto j = e.toStorage();

    EXPECT_FALSE(j.contains("id"));
    EXPECT_TRUE(j.at("from_branch").is_null());
    EXPECT_EQ(j.at("action"), "PUSH");
    EXPECT_EQ(j.at("timestamp"), "2024-03-07T14:30:00");
}

TEST(EventTest, StorageRoundTripPreservesEveryField) {
    Event e("7", "bob", Action::PULL_REQUEST, "main", "feat", "2024-03-07T14:30:00.250000");
    e.id = "42";

    EXPECT_EQ(Event::fromStorage(e.toStorage()), e);
}

TEST(EventTest, FromStorageRejectsBadAction) {
    const nlohmann::json j = {
        {"request_id", "r1"}, {"author", "a"}, {"action", "FORK"}, {"to_branch", "main"}
    };
    EXPECT_THROW(Event::fromStorage(j), ValidationError);
}

TEST(StoredEventTest, CopiesEventWithAssignedId) {
    const Event e("7", "bob", Action::MERGE, "main", "feat", "2024-03-07T14:30:00");
    const StoredEvent s("abc", e);

    EXPECT_EQ(s.id, "abc");
    EXPECT_EQ(s.action, "MERGE");
    EXPECT_EQ(s.from_branch, "feat");

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("id"), "abc");
    EXPECT_EQ(j.at("to_branch"), "main");
}
