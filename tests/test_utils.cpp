#include "utils/stats_tracker.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <gtest/gtest.h>

// --- Tests for convert_log_time_to_ms ---
TEST(UtilsTest, ConvertLogTimeToMs) {
  // Example from Nginx log format
  auto time1 = Utils::convert_log_time_to_ms("01/Jan/2023:12:00:01 +0000");
  ASSERT_TRUE(time1.has_value());
  EXPECT_EQ(*time1, 1672574401000); // Known UTC epoch in ms

  // Test with a different timezone
  auto time2 = Utils::convert_log_time_to_ms("23/May/2025:08:30:00 -0500");
  ASSERT_TRUE(time2.has_value());
  // 08:30 -0500 is 13:30 UTC
  EXPECT_EQ(*time2, 1748007000000);

  // Apache access logs wrap the field in brackets
  auto time3 = Utils::convert_log_time_to_ms("[01/Jan/2023:12:00:01 +0000]");
  ASSERT_TRUE(time3.has_value());
  EXPECT_EQ(*time3, 1672574401000);

  // Invalid formats
  EXPECT_FALSE(Utils::convert_log_time_to_ms("not a time").has_value());
  EXPECT_FALSE(
      Utils::convert_log_time_to_ms("01/Jann/2023:12:00:01 +0000").has_value());
  EXPECT_FALSE(
      Utils::convert_log_time_to_ms("31/Feb/2023:12:00:01 +0000").has_value());
  EXPECT_FALSE(Utils::convert_log_time_to_ms("").has_value());
  EXPECT_FALSE(Utils::convert_log_time_to_ms("-").has_value());
}

TEST(UtilsTest, ConvertIsoTimeToMs) {
  auto t1 = Utils::convert_iso_time_to_ms("2023-01-01T12:00:01Z");
  ASSERT_TRUE(t1.has_value());
  EXPECT_EQ(*t1, 1672574401000);

  auto t2 = Utils::convert_iso_time_to_ms("2023-01-01 12:00:01");
  ASSERT_TRUE(t2.has_value());
  EXPECT_EQ(*t2, 1672574401000);

  // 12:00:01.250 at +02:00 is 10:00:01.250 UTC
  auto t3 = Utils::convert_iso_time_to_ms("2023-01-01T12:00:01.250+02:00");
  ASSERT_TRUE(t3.has_value());
  EXPECT_EQ(*t3, 1672567201250);

  auto date_only = Utils::convert_iso_time_to_ms("2023-01-01");
  ASSERT_TRUE(date_only.has_value());
  EXPECT_EQ(*date_only, 1672531200000);

  EXPECT_FALSE(Utils::convert_iso_time_to_ms("2023-13-01T00:00:00Z"));
  EXPECT_FALSE(Utils::convert_iso_time_to_ms("2023-01-01T12:00:01Zjunk"));
}

TEST(UtilsTest, ParseTimestampDispatchesOnLayout) {
  EXPECT_EQ(Utils::parse_timestamp_ms("01/Jan/2023:12:00:01 +0000"),
            1672574401000);
  EXPECT_EQ(Utils::parse_timestamp_ms("2023-01-01T12:00:01Z"), 1672574401000);
  EXPECT_EQ(Utils::parse_timestamp_ms("1672574401"), 1672574401000);
  EXPECT_EQ(Utils::parse_timestamp_ms("1672574401.5"), 1672574401500);
  EXPECT_EQ(Utils::parse_timestamp_ms("  1672574401  "), 1672574401000);

  EXPECT_FALSE(Utils::parse_timestamp_ms("yesterday").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("nan").has_value());
}

TEST(UtilsTest, FormatIso8601) {
  EXPECT_EQ(Utils::format_iso8601_ms(1672574401000), "2023-01-01T12:00:01Z");
  EXPECT_EQ(Utils::format_iso8601_ms(0), "1970-01-01T00:00:00Z");
}

TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("404"), 404);
  EXPECT_FALSE(Utils::string_to_number<int>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("40x").has_value());
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("0.25"), 0.25);
}

TEST(UtilsTest, SplitAndTrim) {
  auto parts = Utils::split_string_view("a,b,,c", ',');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(parts[3], "c");

  EXPECT_EQ(Utils::trim_copy("  Status \t"), "Status");
  EXPECT_EQ(Utils::to_lower_copy("Client_IP"), "client_ip");
}

TEST(StatsTrackerTest, WelfordMatchesClosedForm) {
  StatsTracker<2> tracker;
  for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0})
    tracker.update({v, 10.0});

  EXPECT_EQ(tracker.get_count(), 8u);
  EXPECT_DOUBLE_EQ(tracker.get_mean()[0], 5.0);
  EXPECT_DOUBLE_EQ(tracker.get_mean()[1], 10.0);
  EXPECT_DOUBLE_EQ(tracker.get_population_stddev()[0], 2.0);
  EXPECT_DOUBLE_EQ(tracker.get_population_stddev()[1], 0.0);
  EXPECT_NEAR(tracker.get_sample_stddev()[0], std::sqrt(32.0 / 7.0), 1e-12);
}

TEST(StatsTrackerTest, EmptyTrackerIsZero) {
  StatsTracker<3> tracker;
  EXPECT_EQ(tracker.get_count(), 0u);
  EXPECT_DOUBLE_EQ(tracker.get_population_stddev()[0], 0.0);
  EXPECT_DOUBLE_EQ(tracker.get_sample_stddev()[2], 0.0);
}
