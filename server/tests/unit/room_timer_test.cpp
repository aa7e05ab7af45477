#include <chrono>

#include <gtest/gtest.h>

#include "focusroom/room.hpp"

namespace {

using namespace std::chrono_literals;

focusroom::TimePoint T0() { return focusroom::TimePoint{} + std::chrono::hours(24 * 365 * 50); }

}  // namespace

TEST(RoomTimerTest, StartReportsEndAndDuration) {
  focusroom::Room room("ROOM1", {});
  auto start = room.StartTimer(focusroom::TimerPhase::kFocus, 25min, T0());
  EXPECT_EQ(start.end_at, T0() + 25min);
  EXPECT_DOUBLE_EQ(start.DurationMinutes(), 25.0);
  EXPECT_EQ(start.generation, 1u);
  EXPECT_TRUE(room.TimerRunning());

  auto snapshot = room.Snapshot(T0() + 1s);
  EXPECT_TRUE(snapshot["timerRunning"].get<bool>());
  EXPECT_EQ(snapshot["endTimestamp"], focusroom::ToEpochMillis(T0() + 25min));
  EXPECT_EQ(snapshot["phase"], "focus");
}

TEST(RoomTimerTest, StopInvalidatesPendingCompletion) {
  focusroom::Room room("ROOM1", {});
  auto start = room.StartTimer(focusroom::TimerPhase::kFocus, 25min, T0());
  room.StopTimer();
  EXPECT_FALSE(room.TimerRunning());
  EXPECT_FALSE(room.CompleteTimer(start.generation));
}

TEST(RoomTimerTest, RestartSupersedesEarlierGeneration) {
  focusroom::Room room("ROOM1", {});
  auto first = room.StartTimer(focusroom::TimerPhase::kFocus, 25min, T0());
  auto second = room.StartTimer(focusroom::TimerPhase::kBreak, 5min, T0() + 1s);
  EXPECT_GT(second.generation, first.generation);
  EXPECT_FALSE(room.CompleteTimer(first.generation));
  EXPECT_TRUE(room.TimerRunning());
  EXPECT_TRUE(room.CompleteTimer(second.generation));
  EXPECT_FALSE(room.TimerRunning());
  EXPECT_EQ(room.Phase(), focusroom::TimerPhase::kBreak);
  // 같은 세대는 한 번만 완료된다.
  EXPECT_FALSE(room.CompleteTimer(second.generation));
}

TEST(RoomTimerTest, ExpiredButUncompletedTimerIsNotRunningInSnapshot) {
  focusroom::Room room("ROOM1", {});
  room.StartTimer(focusroom::TimerPhase::kBreak, 5min, T0());
  auto snapshot = room.Snapshot(T0() + 6min);
  EXPECT_FALSE(snapshot["timerRunning"].get<bool>());
  EXPECT_EQ(snapshot["phase"], "break");
}

TEST(RoomTimerTest, ParsesPhaseNames) {
  EXPECT_EQ(focusroom::ParseTimerPhase("focus"), focusroom::TimerPhase::kFocus);
  EXPECT_EQ(focusroom::ParseTimerPhase("break"), focusroom::TimerPhase::kBreak);
  EXPECT_FALSE(focusroom::ParseTimerPhase("lunch").has_value());
  EXPECT_STREQ(focusroom::TimerPhaseToString(focusroom::TimerPhase::kBreak), "break");
}
