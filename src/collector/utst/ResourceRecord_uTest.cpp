/**
 * @file ResourceRecord_uTest.cpp
 * @brief Unit tests for proxwatch::collector::ResourceRecord and the failure rule.
 */

#include "src/collector/inc/ResourceRecord.hpp"
#include "src/collector/inc/SshMetricSource.hpp"

#include <gtest/gtest.h>

#include <string>

using proxwatch::collector::failedRecord;
using proxwatch::collector::InterfaceTraffic;
using proxwatch::collector::isCollectionFailed;
using proxwatch::collector::MetricValue;
using proxwatch::collector::parseMemoryPercent;
using proxwatch::collector::ResourceRecord;
using proxwatch::config::Device;

/* ----------------------------- Failure Rule Tests ----------------------------- */

/** @test Partial success is not a failure; nothing at all is. */
TEST(CollectionFailedTest, Rule) {
  EXPECT_FALSE(isCollectionFailed(7, 3));
  EXPECT_FALSE(isCollectionFailed(7, 7));
  EXPECT_TRUE(isCollectionFailed(7, 0));
  EXPECT_FALSE(isCollectionFailed(0, 0));
}

/* ----------------------------- ResourceRecord Tests ----------------------------- */

/** @test Lookups find present values and report absent ones. */
TEST(ResourceRecordTest, Lookups) {
  ResourceRecord rec;
  rec.metrics = {MetricValue{"cpu", 12.5}, MetricValue{"mem", 40.0}};
  rec.interfaces = {InterfaceTraffic{"eth0", 1000.0, 2000.0}};

  ASSERT_TRUE(rec.metric("cpu").has_value());
  EXPECT_DOUBLE_EQ(*rec.metric("cpu"), 12.5);
  EXPECT_FALSE(rec.metric("http").has_value());

  ASSERT_NE(rec.findInterface("eth0"), nullptr);
  EXPECT_DOUBLE_EQ(rec.findInterface("eth0")->outBps, 2000.0);
  EXPECT_EQ(rec.findInterface("eth9"), nullptr);
}

/** @test failedRecord carries identity and message. */
TEST(ResourceRecordTest, FailedRecord) {
  Device d;
  d.id = 9;
  d.host = "10.0.0.9";
  d.alias = "edge-9";

  const ResourceRecord REC = failedRecord(d, 4, "collection timed out after 8000 ms");

  EXPECT_EQ(REC.deviceId, 9U);
  EXPECT_EQ(REC.displayName(), "edge-9");
  EXPECT_TRUE(REC.failed);
  EXPECT_EQ(REC.configuredMetrics, 4U);
  EXPECT_TRUE(REC.metrics.empty());
  EXPECT_NE(REC.toString().find("FAILED: collection timed out"), std::string::npos);
}

/** @test toString lists metrics, rates and a partial count. */
TEST(ResourceRecordTest, ToString) {
  ResourceRecord rec;
  rec.deviceId = 1;
  rec.host = "h";
  rec.configuredMetrics = 3;
  rec.metrics = {MetricValue{"cpu", 5.0}};
  rec.interfaces = {InterfaceTraffic{"eth0", 1500000.0, 0.0}};

  const std::string S = rec.toString();
  EXPECT_NE(S.find("cpu=5.00"), std::string::npos);
  EXPECT_NE(S.find("eth0=in:1.50 Mbps"), std::string::npos);
  EXPECT_NE(S.find("(1/3 metrics)"), std::string::npos);
}

/* ----------------------------- Memory Output Tests ----------------------------- */

/** @test Command output parses and clamps to 0..100. */
TEST(MemoryPercentTest, ParseAndClamp) {
  double pct = -1.0;
  std::string error;

  ASSERT_TRUE(parseMemoryPercent("42\n", pct, error)) << error;
  EXPECT_DOUBLE_EQ(pct, 42.0);

  ASSERT_TRUE(parseMemoryPercent(" 101.5 ", pct, error));
  EXPECT_DOUBLE_EQ(pct, 100.0);

  ASSERT_TRUE(parseMemoryPercent("-3", pct, error));
  EXPECT_DOUBLE_EQ(pct, 0.0);
}

/** @test Non-numeric output is rejected. */
TEST(MemoryPercentTest, Rejects) {
  double pct = 0.0;
  std::string error;

  EXPECT_FALSE(parseMemoryPercent("", pct, error));
  EXPECT_FALSE(parseMemoryPercent("awk: not found", pct, error));
  EXPECT_NE(error.find("awk: not found"), std::string::npos);
  EXPECT_FALSE(parseMemoryPercent("nan", pct, error));
  EXPECT_FALSE(parseMemoryPercent("42%", pct, error));
}
