// tests/payload_test.cpp
// Unit tests for Fields, Alert and Payload JSON output.

#include <gtest/gtest.h>
#include "pushgate/payload.hpp"
#include <string>

using namespace pushgate;

namespace {

std::string json_of(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ==================== Fields ====================

TEST(FieldsTest, EmptyFields) {
    Fields f;
    EXPECT_EQ(json_of(f.to_json_bytes()), "{}");
    EXPECT_TRUE(f.empty());
}

TEST(FieldsTest, MultipleTypes) {
    Fields f;
    f.add("thread", "inbox")
     .add("unread", 3)
     .add("muted", false)
     .add("score", 0.5)
     .add("since", int64_t(-5));
    EXPECT_EQ(json_of(f.to_json_bytes()),
              R"({"thread":"inbox","unread":3,"muted":false,"score":0.5,"since":-5})");
    EXPECT_EQ(f.size(), 5u);
}

TEST(FieldsTest, StringArray) {
    Fields f;
    f.add("args", std::vector<std::string>{"Jenna", "Frank"});
    EXPECT_EQ(json_of(f.to_json_bytes()), R"({"args":["Jenna","Frank"]})");
}

TEST(FieldsTest, EmptyArray) {
    Fields f;
    f.add("args", std::vector<std::string>{});
    EXPECT_EQ(json_of(f.to_json_bytes()), R"({"args":[]})");
}

TEST(FieldsTest, NestedObject) {
    Fields f;
    f.add("meta", Fields().add("id", 7));
    EXPECT_EQ(json_of(f.to_json_bytes()), R"({"meta":{"id":7}})");
}

TEST(FieldsTest, EscapesQuotesAndBackslash) {
    Fields f;
    f.add("s", "say \"hi\" C:\\tmp");
    EXPECT_EQ(json_of(f.to_json_bytes()), R"({"s":"say \"hi\" C:\\tmp"})");
}

TEST(FieldsTest, EscapesControlCharacters) {
    Fields f;
    f.add("s", std::string("a\nb\tc\x01", 6));
    EXPECT_EQ(json_of(f.to_json_bytes()), R"({"s":"a\nb\tc\u0001"})");
}

TEST(FieldsTest, Utf8PassesThrough) {
    Fields f;
    f.add("s", "caf\xc3\xa9");
    EXPECT_EQ(json_of(f.to_json_bytes()), "{\"s\":\"caf\xc3\xa9\"}");
}

// ==================== Payload ====================

TEST(PayloadTest, EmptyPayload) {
    EXPECT_EQ(json_of(Payload().to_json_bytes()), R"({"aps":{}})");
}

TEST(PayloadTest, SimpleAlert) {
    auto p = Payload().alert("New message");
    EXPECT_EQ(json_of(p.to_json_bytes()), R"({"aps":{"alert":"New message"}})");
}

TEST(PayloadTest, FullAps) {
    auto p = Payload()
        .alert("Hello")
        .badge(2)
        .sound("default")
        .content_available(true)
        .category("MESSAGE");
    EXPECT_EQ(json_of(p.to_json_bytes()),
              R"({"aps":{"alert":"Hello","badge":2,"sound":"default","content-available":1,"category":"MESSAGE"}})");
}

TEST(PayloadTest, ZeroBadgeIsKept) {
    // Badge 0 clears the badge and must be sent
    EXPECT_EQ(json_of(Payload().badge(0).to_json_bytes()), R"({"aps":{"badge":0}})");
}

TEST(PayloadTest, ContentAvailableFalseOmitted) {
    EXPECT_EQ(json_of(Payload().content_available(false).to_json_bytes()), R"({"aps":{}})");
}

TEST(PayloadTest, AlertDictionary) {
    Alert alert;
    alert.loc_key = "GAME_PLAY_REQUEST_FORMAT";
    alert.loc_args = {"Jenna", "Frank"};
    alert.action_loc_key = "PLAY";

    EXPECT_EQ(json_of(Payload().alert(alert).to_json_bytes()),
              R"({"aps":{"alert":{"action-loc-key":"PLAY","loc-key":"GAME_PLAY_REQUEST_FORMAT","loc-args":["Jenna","Frank"]}}})");
}

TEST(PayloadTest, AlertDictionaryBodyAndImage) {
    Alert alert;
    alert.body = "Bob wants to play";
    alert.launch_image = "splash.png";
    EXPECT_EQ(json_of(Payload().alert(alert).to_json_bytes()),
              R"({"aps":{"alert":{"body":"Bob wants to play","launch-image":"splash.png"}}})");
}

TEST(PayloadTest, LaterAlertReplacesEarlier) {
    Alert alert;
    alert.body = "dict";
    auto p = Payload().alert(alert).alert("text");
    EXPECT_EQ(json_of(p.to_json_bytes()), R"({"aps":{"alert":"text"}})");
}

TEST(PayloadTest, CustomFieldsAtTopLevel) {
    auto p = Payload().alert("hi").custom(Fields().add("thread", "inbox").add("n", 1));
    EXPECT_EQ(json_of(p.to_json_bytes()), R"({"aps":{"alert":"hi"},"thread":"inbox","n":1})");
}
