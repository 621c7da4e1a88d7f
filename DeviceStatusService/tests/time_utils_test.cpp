#include <gtest/gtest.h>

#include "core/common/utils/time_utils.hpp"

namespace devstatus::core::common::time {
namespace {

TEST(ParseDurationMsTest, AcceptsUnits) {
  EXPECT_EQ(ParseDurationMs("250ms"), 250);
  EXPECT_EQ(ParseDurationMs("30s"), 30'000);
  EXPECT_EQ(ParseDurationMs("5m"), 300'000);
  EXPECT_EQ(ParseDurationMs("2h"), 7'200'000);
}

TEST(ParseDurationMsTest, BareNumberIsMilliseconds) {
  EXPECT_EQ(ParseDurationMs("1500"), 1500);
  EXPECT_EQ(ParseDurationMs(" 10s "), 10'000);
}

TEST(ParseDurationMsTest, RejectsGarbage) {
  EXPECT_FALSE(ParseDurationMs(""));
  EXPECT_FALSE(ParseDurationMs("s"));
  EXPECT_FALSE(ParseDurationMs("-5s"));
  EXPECT_FALSE(ParseDurationMs("5 minutes"));
  EXPECT_FALSE(ParseDurationMs("1.5s"));
  EXPECT_FALSE(ParseDurationMs("99999999999999999999"));
}

TEST(FormatDurationMsTest, Renders) {
  EXPECT_EQ(FormatDurationMs(0), "0s");
  EXPECT_EQ(FormatDurationMs(-10), "0s");
  EXPECT_EQ(FormatDurationMs(12'345), "12s");
  EXPECT_EQ(FormatDurationMs(240'000), "4m 0s");
  EXPECT_EQ(FormatDurationMs(3'723'000), "1h 2m 3s");
}

}  // namespace
}  // namespace devstatus::core::common::time
