#include <chrono>

#include <gtest/gtest.h>

#include "focusroom/room.hpp"

namespace {

using namespace std::chrono_literals;

focusroom::TimePoint T0() { return focusroom::TimePoint{} + std::chrono::hours(24 * 365 * 50); }

}  // namespace

TEST(RoomFocusTest, TransitionsReportOnlyRealChanges) {
  focusroom::Room room("ROOM1", {});
  room.AddParticipant("c1", "alpha", std::nullopt, T0());
  EXPECT_FALSE(room.MarkFocused("c1", T0() + 1s));
  EXPECT_TRUE(room.MarkDistracted("c1", T0() + 2s));
  EXPECT_FALSE(room.MarkDistracted("c1", T0() + 3s));
  EXPECT_TRUE(room.MarkFocused("c1", T0() + 4s));
  EXPECT_FALSE(room.MarkDistracted("unknown", T0() + 4s));
}

TEST(RoomFocusTest, RepeatedCallsDoNotDoubleCountIntervals) {
  focusroom::Room once("A", {});
  focusroom::Room twice("B", {});
  once.AddParticipant("c1", "alpha", std::nullopt, T0());
  twice.AddParticipant("c1", "alpha", std::nullopt, T0());

  once.MarkDistracted("c1", T0() + 2s);
  twice.MarkDistracted("c1", T0() + 2s);
  twice.MarkDistracted("c1", T0() + 3s);

  once.MarkFocused("c1", T0() + 5s);
  twice.MarkFocused("c1", T0() + 5s);
  twice.MarkFocused("c1", T0() + 6s);

  const auto now = T0() + 8s;
  EXPECT_EQ(once.FindParticipant("c1")->FocusedTotal(now), twice.FindParticipant("c1")->FocusedTotal(now));
  EXPECT_EQ(once.FindParticipant("c1")->DistractedTotal(now), twice.FindParticipant("c1")->DistractedTotal(now));
  EXPECT_EQ(once.FindParticipant("c1")->DistractedTotal(now), 3s);
  EXPECT_EQ(once.FindParticipant("c1")->FocusedTotal(now), 5s);
}

TEST(RoomFocusTest, DepartureClosesOpenIntervalAndComputesPercentage) {
  focusroom::Room room("ROOM1", {});
  room.AddParticipant("c1", "alpha", std::nullopt, T0());
  room.MarkDistracted("c1", T0() + 1s);

  auto metrics = room.RemoveParticipant("c1", T0() + 2s);
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->focused_ms, 1000);
  EXPECT_EQ(metrics->distracted_ms, 1000);
  EXPECT_DOUBLE_EQ(metrics->focus_percentage, 50.0);
  EXPECT_EQ(metrics->session_duration_ms, 2000);
}

TEST(RoomFocusTest, ZeroLengthSessionHasZeroPercentage) {
  focusroom::Room room("ROOM1", {});
  room.AddParticipant("c1", "alpha", std::nullopt, T0());
  auto metrics = room.RemoveParticipant("c1", T0());
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->focused_ms, 0);
  EXPECT_DOUBLE_EQ(metrics->focus_percentage, 0.0);
}

TEST(RoomFocusTest, DepartureJsonUsesWireFieldNames) {
  focusroom::Room room("ROOM1", {});
  room.AddParticipant("c1", "alpha", std::nullopt, T0());
  room.RecordConfusion("c1");
  auto json = focusroom::ToJson(*room.RemoveParticipant("c1", T0() + 4s));
  EXPECT_EQ(json["displayName"], "alpha");
  EXPECT_EQ(json["focusedMs"], 4000);
  EXPECT_EQ(json["distractedMs"], 0);
  EXPECT_DOUBLE_EQ(json["focusPercentage"].get<double>(), 100.0);
  EXPECT_EQ(json["confusionEventCount"], 1);
  EXPECT_EQ(json["sessionDurationMs"], 4000);
}

TEST(RoomFocusTest, ConfusionCountGrowsAndFlagStaysSet) {
  focusroom::Room room("ROOM1", {});
  room.AddParticipant("c1", "alpha", std::nullopt, T0());
  EXPECT_EQ(room.RecordConfusion("c1").value_or(0), 1u);
  EXPECT_EQ(room.RecordConfusion("c1").value_or(0), 2u);
  EXPECT_TRUE(room.FindParticipant("c1")->confused);
  EXPECT_FALSE(room.RecordConfusion("missing").has_value());
}
