#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "focusroom/room_registry.hpp"
#include "focusroom/session_table.hpp"

TEST(RoomRegistryTest, GetOrCreateReturnsSameContext) {
  boost::asio::io_context ioc;
  focusroom::RoomRegistry registry(ioc, {});
  auto first = registry.GetOrCreate("ROOM1");
  auto second = registry.GetOrCreate("ROOM1");
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(first->room.Code(), "ROOM1");
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(registry.Get("ROOM1").get(), first.get());
  EXPECT_EQ(registry.Get("OTHER"), nullptr);
}

TEST(RoomRegistryTest, RoomsUseRegistryScoring) {
  boost::asio::io_context ioc;
  focusroom::RoomRegistry registry(ioc, focusroom::ScoringConfig{.base_rate_per_second = 4.0,
                                                                 .penalty_per_distracted = 0.5});
  auto ctx = registry.GetOrCreate("ROOM1");
  EXPECT_DOUBLE_EQ(ctx->room.GroupDps(), 4.0);
  EXPECT_DOUBLE_EQ(registry.Scoring().penalty_per_distracted, 0.5);
}

TEST(RoomRegistryTest, DeleteIfSameIgnoresReplacedInstance) {
  boost::asio::io_context ioc;
  focusroom::RoomRegistry registry(ioc, {});
  auto stale = registry.GetOrCreate("ROOM1");
  registry.Delete("ROOM1");
  auto fresh = registry.GetOrCreate("ROOM1");
  ASSERT_NE(stale.get(), fresh.get());

  EXPECT_FALSE(registry.DeleteIfSame("ROOM1", stale.get()));
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_TRUE(registry.DeleteIfSame("ROOM1", fresh.get()));
  EXPECT_EQ(registry.Size(), 0u);
  EXPECT_TRUE(registry.List().empty());
}

TEST(SessionTableTest, PutFindRemove) {
  focusroom::SessionTable table;
  table.Put("c1", {"ROOM1", "alpha"});
  auto entry = table.Find("c1");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->room_code, "ROOM1");
  EXPECT_EQ(entry->display_name, "alpha");
  EXPECT_EQ(table.Size(), 1u);

  auto removed = table.Remove("c1");
  ASSERT_TRUE(removed.has_value());
  EXPECT_FALSE(table.Find("c1").has_value());
  EXPECT_FALSE(table.Remove("c1").has_value());
}

TEST(SessionTableTest, RemoveIfKeepsEntryForOtherRoom) {
  focusroom::SessionTable table;
  table.Put("c1", {"ROOM2", "alpha"});
  EXPECT_FALSE(table.RemoveIf("c1", "ROOM1"));
  EXPECT_TRUE(table.Find("c1").has_value());
  EXPECT_TRUE(table.RemoveIf("c1", "ROOM2"));
  EXPECT_EQ(table.Size(), 0u);
}

TEST(SessionTableTest, ExchangeReturnsPreviousEntry) {
  focusroom::SessionTable table;
  EXPECT_FALSE(table.Exchange("c1", {"ROOM1", "alpha"}).has_value());
  auto previous = table.Exchange("c1", {"ROOM2", "alpha"});
  ASSERT_TRUE(previous.has_value());
  EXPECT_EQ(previous->room_code, "ROOM1");
  EXPECT_EQ(table.Find("c1")->room_code, "ROOM2");
  EXPECT_EQ(table.Size(), 1u);
}
