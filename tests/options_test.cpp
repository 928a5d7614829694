#include <gtest/gtest.h>

#include "core/types/Replication.hpp"
#include "core/types/Ttl.hpp"

using namespace weed;

TEST(ReplicationTest, AllAbsentIsZeros) {
  EXPECT_EQ(ReplicationType{}.toString(), "000");
}

TEST(ReplicationTest, SameRackTwoReplicas) {
  ReplicationType r;
  r.same_rack = ReplicaCount::Two;
  EXPECT_EQ(r.toString(), "002");
}

TEST(ReplicationTest, SlotsKeepFixedOrder) {
  ReplicationType r;
  r.data_center = ReplicaCount::One;
  EXPECT_EQ(r.toString(), "100");

  r.other_rack = ReplicaCount::Two;
  EXPECT_EQ(r.toString(), "120");

  r.same_rack = ReplicaCount::One;
  EXPECT_EQ(r.toString(), "121");
  EXPECT_EQ(r.toString().size(), 3u);
}

TEST(TtlTest, MonthAndMinuteDifferByCase) {
  EXPECT_EQ((Ttl{TtlUnit::Month, 5}).toString(), "5M");
  EXPECT_EQ((Ttl{TtlUnit::Minute, 5}).toString(), "5m");
}

TEST(TtlTest, UnitLetters) {
  EXPECT_EQ(unitLetter(TtlUnit::Hour), 'h');
  EXPECT_EQ(unitLetter(TtlUnit::Day), 'd');
  EXPECT_EQ(unitLetter(TtlUnit::Week), 'w');
  EXPECT_EQ(unitLetter(TtlUnit::Year), 'y');
  EXPECT_EQ((Ttl{TtlUnit::Year, 12}).toString(), "12y");
}
