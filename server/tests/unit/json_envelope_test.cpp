#include <gtest/gtest.h>

#include "focusroom/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = focusroom::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = focusroom::MakeErrorEnvelope("not_found", "없음");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "없음");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, OutgoingEventFillsEmptyPayload) {
  focusroom::WsEnvelope env{.type = "event", .event = "timer:stopped", .seq = 0, .payload = nullptr};
  auto json = focusroom::ToWsJson(env);
  EXPECT_EQ(json["t"], "event");
  EXPECT_EQ(json["event"], "timer:stopped");
  EXPECT_EQ(json["seq"], 0);
  EXPECT_TRUE(json["p"].is_object());
}

TEST(JsonEnvelopeTest, ParsesIncomingEvent) {
  auto env = focusroom::ParseWsEnvelope(
      {{"t", "event"}, {"seq", 7}, {"event", "room:join"}, {"p", {{"roomCode", "ROOM1"}}}});
  ASSERT_TRUE(env.has_value());
  EXPECT_EQ(env->event, "room:join");
  EXPECT_EQ(env->seq, 7u);
  EXPECT_EQ(env->payload["roomCode"], "ROOM1");
}

TEST(JsonEnvelopeTest, MissingPayloadBecomesEmptyObject) {
  auto env = focusroom::ParseWsEnvelope({{"t", "event"}, {"event", "timer:stop"}});
  ASSERT_TRUE(env.has_value());
  EXPECT_TRUE(env->payload.is_object());
  EXPECT_TRUE(env->payload.empty());
}

TEST(JsonEnvelopeTest, RejectsMalformedEnvelopes) {
  EXPECT_FALSE(focusroom::ParseWsEnvelope(nlohmann::json::array()).has_value());
  EXPECT_FALSE(focusroom::ParseWsEnvelope({{"event", "room:join"}}).has_value());
  EXPECT_FALSE(focusroom::ParseWsEnvelope({{"t", "event"}, {"event", 3}}).has_value());
}
