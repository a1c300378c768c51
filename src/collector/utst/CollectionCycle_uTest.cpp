/**
 * @file CollectionCycle_uTest.cpp
 * @brief Unit tests for proxwatch::collector::runCollectionCycle and CollectionState.
 */

#include "src/collector/inc/CollectionCycle.hpp"
#include "src/collector/utst/CollectorFakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using proxwatch::collector::CollectionSnapshot;
using proxwatch::collector::CollectionState;
using proxwatch::collector::CollectionStatus;
using proxwatch::collector::fixedGetter;
using proxwatch::collector::Progress;
using proxwatch::collector::RateCache;
using proxwatch::collector::RecordSink;
using proxwatch::collector::ResourceCollector;
using proxwatch::collector::ResourceRecord;
using proxwatch::collector::runCollectionCycle;
using proxwatch::collector::toString;
using proxwatch::collector::test::FakeGetter;
using proxwatch::collector::test::makeDevice;
using proxwatch::config::CollectorConfig;

namespace {

constexpr const char* CPU_OID = "1.3.6.1.4.1.2021.11.9.0";

/// Sink remembering what it was given, optionally failing.
class RecordingSink final : public RecordSink {
public:
  explicit RecordingSink(bool ok = true) : ok_(ok) {}

  bool save(const std::vector<ResourceRecord>& records, std::string& error) override {
    ++calls;
    saved = records;
    if (!ok_) {
      error = "disk full";
      return false;
    }
    return true;
  }

  int calls{0};
  std::vector<ResourceRecord> saved;

private:
  bool ok_;
};

} // namespace

class CollectionCycleTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeGetter> getter_ = std::make_shared<FakeGetter>();
  CollectionState state_;

  ResourceCollector makeCollector() const {
    CollectorConfig cfg;
    cfg.snmpTimeout = std::chrono::milliseconds(50);
    cfg.taskTimeout = std::chrono::milliseconds(150);
    cfg.deviceTimeout = std::chrono::milliseconds(300);
    EXPECT_TRUE(cfg.addMetric("cpu", CPU_OID));
    return ResourceCollector(cfg, fixedGetter(getter_), nullptr, std::make_shared<RateCache>());
  }
};

/* ----------------------------- Status Tests ----------------------------- */

/** @test Status names. */
TEST(CollectionStatusTest, Names) {
  EXPECT_STREQ(toString(CollectionStatus::IDLE), "Idle");
  EXPECT_STREQ(toString(CollectionStatus::COLLECTING), "Collecting");
  EXPECT_STREQ(toString(CollectionStatus::FAILED), "Failed");
}

/** @test Fresh state is idle with nothing recorded. */
TEST(CollectionStateTest, DefaultIdle) {
  const CollectionState STATE;
  const CollectionSnapshot SNAP = STATE.snapshot();

  EXPECT_EQ(SNAP.status, CollectionStatus::IDLE);
  EXPECT_FALSE(SNAP.progress.has_value());
  EXPECT_FALSE(SNAP.collecting);
  EXPECT_FALSE(SNAP.lastCollectionTime.has_value());
}

/** @test tryBegin claims once until released. */
TEST(CollectionStateTest, TryBeginExclusive) {
  CollectionState state;

  ASSERT_TRUE(state.tryBegin(3));
  EXPECT_EQ(state.status(), CollectionStatus::STARTING);
  EXPECT_EQ(state.snapshot().progress, (Progress{0, 3}));
  EXPECT_FALSE(state.tryBegin(3));

  state.release();
  EXPECT_TRUE(state.tryBegin(1));
}

/* ----------------------------- Cycle Tests ----------------------------- */

/** @test Mixed outcome is Success with a partial-failure warning. */
TEST_F(CollectionCycleTest, PartialIsSuccessWithWarning) {
  getter_->set("ok-host", CPU_OID, FakeGetter::value(10.0));

  ASSERT_TRUE(runCollectionCycle(makeCollector(), {makeDevice(2, "bad-host"), makeDevice(1, "ok-host")},
                                 state_));

  const CollectionSnapshot SNAP = state_.snapshot();
  EXPECT_EQ(SNAP.status, CollectionStatus::SUCCESS);
  EXPECT_EQ(SNAP.progress, (Progress{1, 2}));
  EXPECT_EQ(SNAP.lastError, "partial collection failure (1 succeeded, 1 failed)");
  ASSERT_EQ(SNAP.records.size(), 2U);
  EXPECT_EQ(SNAP.records[0].deviceId, 1U);
  EXPECT_TRUE(SNAP.records[1].failed);
  EXPECT_FALSE(SNAP.collecting);
  EXPECT_TRUE(SNAP.lastCollectionTime.has_value());
}

/** @test Full success leaves no warning. */
TEST_F(CollectionCycleTest, FullSuccess) {
  getter_->set(CPU_OID, FakeGetter::value(10.0));

  ASSERT_TRUE(runCollectionCycle(makeCollector(), {makeDevice(1, "a"), makeDevice(2, "b")}, state_));

  const CollectionSnapshot SNAP = state_.snapshot();
  EXPECT_EQ(SNAP.status, CollectionStatus::SUCCESS);
  EXPECT_EQ(SNAP.progress, (Progress{2, 2}));
  EXPECT_TRUE(SNAP.lastError.empty());
}

/** @test Every device failing is Failed, progress cleared, records kept. */
TEST_F(CollectionCycleTest, AllFailed) {
  ASSERT_TRUE(runCollectionCycle(makeCollector(), {makeDevice(1, "a"), makeDevice(2, "b")}, state_));

  const CollectionSnapshot SNAP = state_.snapshot();
  EXPECT_EQ(SNAP.status, CollectionStatus::FAILED);
  EXPECT_FALSE(SNAP.progress.has_value());
  EXPECT_EQ(SNAP.lastError.rfind("all 2 devices failed", 0), 0U);
  EXPECT_EQ(SNAP.records.size(), 2U);
  EXPECT_FALSE(SNAP.collecting);
}

/** @test Sink receives the records; its failure is appended without changing status. */
TEST_F(CollectionCycleTest, SinkFailureAppended) {
  getter_->set("ok-host", CPU_OID, FakeGetter::value(10.0));
  RecordingSink sink(false);

  ASSERT_TRUE(runCollectionCycle(makeCollector(), {makeDevice(1, "ok-host"), makeDevice(2, "x")},
                                 state_, &sink));

  EXPECT_EQ(sink.calls, 1);
  EXPECT_EQ(sink.saved.size(), 2U);

  const CollectionSnapshot SNAP = state_.snapshot();
  EXPECT_EQ(SNAP.status, CollectionStatus::SUCCESS);
  EXPECT_EQ(SNAP.records.size(), 2U);
  EXPECT_EQ(SNAP.lastError,
            "partial collection failure (1 succeeded, 1 failed); CSV save failed: disk full");
}

/** @test A working sink adds nothing to the last error. */
TEST_F(CollectionCycleTest, SinkSuccessSilent) {
  getter_->set(CPU_OID, FakeGetter::value(10.0));
  RecordingSink sink;

  ASSERT_TRUE(runCollectionCycle(makeCollector(), {makeDevice(1, "a")}, state_, &sink));

  EXPECT_EQ(sink.calls, 1);
  EXPECT_TRUE(state_.snapshot().lastError.empty());
}

/** @test A cycle already running refuses re-entry. */
TEST_F(CollectionCycleTest, ReentryRefused) {
  ASSERT_TRUE(state_.tryBegin(1));

  EXPECT_FALSE(runCollectionCycle(makeCollector(), {makeDevice(1, "a")}, state_));
  EXPECT_EQ(state_.status(), CollectionStatus::STARTING);
  EXPECT_TRUE(state_.isCollecting());
}

/** @test No devices is a no-op. */
TEST_F(CollectionCycleTest, EmptyNoOp) {
  EXPECT_FALSE(runCollectionCycle(makeCollector(), {}, state_));
  EXPECT_EQ(state_.status(), CollectionStatus::IDLE);
}
