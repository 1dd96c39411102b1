#include <gtest/gtest.h>
#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/events/event.hpp"

using namespace fedtrust::events;
using fedtrust::json::Value;

class ContentHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        event_json_ = {
            {"room_id", "!room:example.org"},
            {"sender", "@alice:example.org"},
            {"type", "m.room.message"},
            {"content", {{"body", "hello"}, {"msgtype", "m.text"}}},
            {"origin_server_ts", 1700000000000},
            {"prev_events", Value::array({"$prev"})},
            {"auth_events", Value::array({"$create"})},
            {"depth", 5},
            {"unsigned", {{"age", 10}}},
            {"signatures", {{"example.org", {{"ed25519:a", "sig"}}}}},
            {"hashes", {{"sha256", "old"}}},
            {"origin", "example.org"}
        };
    }
    
    Value event_json_;
};

TEST_F(ContentHasherTest, ContentHashOfKnownEvent) {
    EXPECT_EQ(ContentHasher::calculate_content_hash(event_json_),
              "DCfwNerbcW6dBj/CpaD9baMYmPQY4p3IjSI7Q4qiLAg");
}

TEST_F(ContentHasherTest, StructuredAndJsonFormsAgree) {
    auto event = Event::from_json(event_json_);
    
    EXPECT_EQ(ContentHasher::calculate_content_hash(event),
              ContentHasher::calculate_content_hash(event_json_));
    EXPECT_EQ(ContentHasher::calculate_reference_hash(event, RoomVersion::parse("11")),
              ContentHasher::calculate_reference_hash(event_json_, RoomVersion::parse("11")));
}

TEST_F(ContentHasherTest, ContentHashIgnoresSignaturesUnsignedAndHashes) {
    auto baseline = ContentHasher::calculate_content_hash(event_json_);
    
    event_json_["unsigned"]["age"] = 99999;
    event_json_["signatures"]["other.org"] = {{"ed25519:b", "x"}};
    event_json_["hashes"]["sha256"] = "something else";
    
    EXPECT_EQ(ContentHasher::calculate_content_hash(event_json_), baseline);
}

TEST_F(ContentHasherTest, ContentHashCoversUnknownFields) {
    auto baseline = ContentHasher::calculate_content_hash(event_json_);
    
    event_json_["origin"] = "evil.org";
    EXPECT_NE(ContentHasher::calculate_content_hash(event_json_), baseline);
    
    event_json_["origin"] = "example.org";
    event_json_["content"]["body"] = "hellO";
    EXPECT_NE(ContentHasher::calculate_content_hash(event_json_), baseline);
}

TEST_F(ContentHasherTest, ReferenceHashUsesRedactedForm) {
    EXPECT_EQ(ContentHasher::calculate_reference_hash(event_json_, RoomVersion::parse("11")),
              "O7RnO4tFiD9DPcY5wivhIPM3N9yRQolpIWfI1hoXjMc");
    
    // Content of a message does not survive redaction, so editing it leaves the reference hash alone
    event_json_["content"]["body"] = "edited";
    event_json_["unsigned"]["age"] = 1;
    EXPECT_EQ(ContentHasher::calculate_reference_hash(event_json_, RoomVersion::parse("11")),
              "O7RnO4tFiD9DPcY5wivhIPM3N9yRQolpIWfI1hoXjMc");
}

TEST_F(ContentHasherTest, VerifyContentHash) {
    auto event = Event::from_json(event_json_);
    EXPECT_FALSE(ContentHasher::verify_content_hash(event));
    
    event.set_content_hash(ContentHasher::calculate_content_hash(event));
    EXPECT_TRUE(ContentHasher::verify_content_hash(event));
    
    event.depth += 1;
    EXPECT_FALSE(ContentHasher::verify_content_hash(event));
    
    event.hashes.reset();
    EXPECT_FALSE(ContentHasher::verify_content_hash(event));
}

TEST_F(ContentHasherTest, VerifyIsByteExact) {
    auto event = Event::from_json(event_json_);
    auto hash = ContentHasher::calculate_content_hash(event);
    
    event.set_content_hash(hash + "=");
    EXPECT_FALSE(ContentHasher::verify_content_hash(event));
}

TEST_F(ContentHasherTest, EventIdDerivation) {
    Value event_json = {
        {"room_id", "!room:example.org"},
        {"sender", "@alice:example.org"},
        {"type", "m.room.message"},
        {"content", {{"body", "hello"}, {"msgtype", "m.text"}}},
        {"origin_server_ts", 1700000000000},
        {"prev_events", Value::array({"$prev"})},
        {"auth_events", Value::array({"$create"})},
        {"depth", 10},
        {"hashes", {{"sha256", "old"}}}
    };
    auto event = Event::from_json(event_json);
    
    EXPECT_FALSE(ContentHasher::compute_event_id(event, RoomVersion::parse("1")).has_value());
    EXPECT_FALSE(ContentHasher::compute_event_id(event, RoomVersion::parse("2")).has_value());
    
    EXPECT_EQ(ContentHasher::compute_event_id(event, RoomVersion::parse("3")),
              "$ICNyH1bc+WpaEnQ9p+XutZb6BOakVTFUw/321sqkp2U");
    EXPECT_EQ(ContentHasher::compute_event_id(event, RoomVersion::parse("4")),
              "$ICNyH1bc-WpaEnQ9p-XutZb6BOakVTFUw_321sqkp2U");
    
    // A stale event_id on the struct does not feed into its own derivation
    event.event_id = "$stale";
    EXPECT_EQ(ContentHasher::compute_event_id(event, RoomVersion::parse("10")),
              "$ICNyH1bc-WpaEnQ9p-XutZb6BOakVTFUw_321sqkp2U");
}
