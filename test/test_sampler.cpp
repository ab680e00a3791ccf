#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <math.h>
#include <thread>

#include "Exporter.h"
#include "FakeLink.h"
#include "Printer.h"
#include "Sampler.h"

namespace {

class CountingSink : public SampleSink {
public:
  void onSample(const Sample& s) override {
    std::lock_guard<std::mutex> lock(mutex);
    samples.push_back(s);
  }
  void onRecord(const Record& rec) override {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back(rec);
  }
  size_t recordCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
  }
  size_t sampleCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return samples.size();
  }

private:
  std::mutex          mutex;
  std::vector<Sample> samples;
  std::vector<Record> records;
};

// Closes the link after a number of records, as an unplugged cable would.
class UnplugSink : public SampleSink {
public:
  UnplugSink(FakeLink& link, size_t after) : link(link), after(after) {}
  void onRecord(const Record&) override {
    if (++seen == after) link.close();
  }

private:
  FakeLink& link;
  size_t    after;
  size_t    seen = 0;
};

bool waitForRecords(const SeriesStore& store, size_t n, int timeout_ms = 2000) {
  for (int i = 0; i < timeout_ms / 5; ++i) {
    if (store.size() >= n) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return store.size() >= n;
}

class SamplerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_EQ(link.open("fake0"), LinkError::Ok);
  }

  FakeLink    link;
  Calibrator  calibrator;
  SeriesStore store;
};

}  // namespace

TEST_F(SamplerTest, RejectsInvalidRates) {
  Sampler sampler(link, calibrator, store);
  EXPECT_EQ(sampler.start(0.0), SamplerError::InvalidRate);
  EXPECT_EQ(sampler.start(-5.0), SamplerError::InvalidRate);
  EXPECT_EQ(sampler.start(1000.5), SamplerError::InvalidRate);
  EXPECT_EQ(sampler.start(NAN), SamplerError::InvalidRate);
  EXPECT_EQ(sampler.start(10.0, true, -1.0), SamplerError::InvalidRate);
  EXPECT_FALSE(sampler.isRunning());
  EXPECT_EQ(link.requests(Channel::Pressure), 0);
}

TEST_F(SamplerTest, RequiresOpenLink) {
  link.close();
  Sampler sampler(link, calibrator, store);
  EXPECT_EQ(sampler.start(10.0), SamplerError::NotConnected);
  EXPECT_FALSE(sampler.isRunning());
}

TEST_F(SamplerTest, SecondStartIsAlreadyRunning) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(20.0, true), SamplerError::Ok);
  EXPECT_EQ(sampler.start(20.0), SamplerError::AlreadyRunning);
  EXPECT_TRUE(sampler.isRunning());
  sampler.stop();
  EXPECT_FALSE(sampler.isRunning());
}

TEST_F(SamplerTest, TenHertzForOneSecondGivesTenRecords) {
  link.setConstant(Channel::Pressure, 2.5f);
  link.setConstant(Channel::Displacement, 1.0f);
  Sampler sampler(link, calibrator, store);

  ASSERT_EQ(sampler.start(10.0, true, 1.0), SamplerError::Ok);
  sampler.waitIdle();
  sampler.stop();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 10u);
  for (size_t i = 1; i < rs.size(); ++i) {
    EXPECT_GT(rs[i].time_s, rs[i - 1].time_s);
    EXPECT_NEAR(rs[i].time_s - rs[i - 1].time_s, 0.1, 0.05);
  }
  for (const Record& r : rs) {
    EXPECT_FLOAT_EQ(r.pressure_kPa, 2.5f);
    EXPECT_FLOAT_EQ(r.displacement_mm, 1.0f);
    EXPECT_FALSE(r.pressure_calibrated);
    EXPECT_FALSE(r.discontinuity);
  }

  const std::string csv = Exporter::toCSV(rs);
  EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 11);
}

TEST_F(SamplerTest, RecordCountFollowsRateTimesDuration) {
  Sampler sampler(link, calibrator, store);
  const auto t0 = std::chrono::steady_clock::now();
  ASSERT_EQ(sampler.start(40.0, true), SamplerError::Ok);
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  sampler.stop();
  const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  const double expected = 40.0 * elapsed;
  EXPECT_NEAR((double)store.size(), expected, 1.5);

  // ticks are anchored to the run start, so there is no accumulated drift
  std::vector<Record> rs = store.snapshot();
  ASSERT_GE(rs.size(), 2u);
  EXPECT_NEAR(rs.back().time_s - rs.front().time_s, (rs.size() - 1) / 40.0, 0.02);
}

TEST_F(SamplerTest, SingleTimeoutIsRecoveredByRetry) {
  link.push(Channel::Pressure, LinkError::Timeout);
  Sampler sampler(link, calibrator, store);

  ASSERT_EQ(sampler.start(50.0, true, 0.06), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 3u);
  EXPECT_TRUE(rs[0].hasPressure());
  EXPECT_EQ(sampler.getStats().retries, 1u);
  EXPECT_EQ(sampler.getStats().missing_pressure, 0u);
}

TEST_F(SamplerTest, RepeatedTimeoutMarksOnlyThatFieldMissing) {
  link.push(Channel::Pressure, LinkError::Timeout);
  link.push(Channel::Pressure, LinkError::Timeout);
  link.setConstant(Channel::Displacement, 3.25f);
  Sampler sampler(link, calibrator, store);

  ASSERT_EQ(sampler.start(50.0, true, 0.06), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 3u);
  EXPECT_FALSE(rs[0].hasPressure());
  EXPECT_TRUE(rs[0].hasDisplacement());
  EXPECT_FLOAT_EQ(rs[0].displacement_mm, 3.25f);
  EXPECT_TRUE(rs[1].hasPressure());
  EXPECT_TRUE(rs[2].hasPressure());

  Sampler::Stats st = sampler.getStats();
  EXPECT_EQ(st.ticks, 3u);
  EXPECT_EQ(st.missing_pressure, 1u);
  EXPECT_EQ(st.missing_displacement, 0u);
}

TEST_F(SamplerTest, MalformedResponseIsRetriedToo) {
  link.push(Channel::Displacement, LinkError::MalformedResponse);
  link.push(Channel::Displacement, LinkError::MalformedResponse);
  Sampler sampler(link, calibrator, store);

  ASSERT_EQ(sampler.start(50.0, true, 0.02), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 1u);
  EXPECT_TRUE(rs[0].hasPressure());
  EXPECT_FALSE(rs[0].hasDisplacement());
  EXPECT_EQ(link.requests(Channel::Displacement), 2);
}

TEST_F(SamplerTest, AppliesCalibrationPerChannel) {
  calibrator.recordPoint(Channel::Pressure, CalPoint::Low, 0.0f, 0.5f);
  calibrator.recordPoint(Channel::Pressure, CalPoint::High, 100.0f, 4.5f);
  link.setConstant(Channel::Pressure, 2.5f);
  link.setConstant(Channel::Displacement, 1.5f);
  Sampler sampler(link, calibrator, store);

  ASSERT_EQ(sampler.start(50.0, true, 0.04), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 2u);
  for (const Record& r : rs) {
    EXPECT_TRUE(r.pressure_calibrated);
    EXPECT_NEAR(r.pressure_kPa, 50.0f, 1e-4);
    EXPECT_FALSE(r.displacement_calibrated);
    EXPECT_FLOAT_EQ(r.displacement_mm, 1.5f);
  }
  EXPECT_FLOAT_EQ(sampler.lastRawVoltage(Channel::Pressure), 2.5f);
}

TEST_F(SamplerTest, StopKeepsRecordsAndIsIdempotent) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(100.0, true), SamplerError::Ok);
  ASSERT_TRUE(waitForRecords(store, 3));
  sampler.stop();
  const size_t n = store.size();
  EXPECT_GE(n, 3u);

  sampler.stop();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(store.size(), n);
}

TEST_F(SamplerTest, StopIsObservedWithinOnePeriod) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(1.0, true), SamplerError::Ok);
  ASSERT_TRUE(waitForRecords(store, 1));

  const auto t0 = std::chrono::steady_clock::now();
  sampler.stop();
  const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  EXPECT_LT(took, 0.5);
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(SamplerTest, ResumeAppendsWithDiscontinuityMarker) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(50.0, true, 0.1), SamplerError::Ok);
  sampler.waitIdle();
  ASSERT_EQ(store.size(), 5u);

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  ASSERT_EQ(sampler.start(50.0, false, 0.1), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 10u);
  for (size_t i = 0; i < rs.size(); ++i) {
    EXPECT_EQ(rs[i].discontinuity, i == 5) << "record " << i;
    if (i > 0) EXPECT_GT(rs[i].time_s, rs[i - 1].time_s);
  }
  // the pause shows up as a timestamp gap
  EXPECT_GT(rs[5].time_s - rs[4].time_s, 0.15);
}

TEST_F(SamplerTest, StartWithResetBeginsNewSession) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(50.0, true, 0.1), SamplerError::Ok);
  sampler.waitIdle();
  ASSERT_EQ(store.size(), 5u);

  ASSERT_EQ(sampler.start(50.0, true, 0.04), SamplerError::Ok);
  sampler.waitIdle();

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 2u);
  EXPECT_FALSE(rs[0].discontinuity);
  EXPECT_LT(rs[0].time_s, 0.05);
}

TEST_F(SamplerTest, ResetSessionRefusedWhileRunning) {
  Sampler sampler(link, calibrator, store);
  ASSERT_EQ(sampler.start(50.0, true), SamplerError::Ok);
  EXPECT_EQ(sampler.resetSession(), SamplerError::AlreadyRunning);
  sampler.stop();
  EXPECT_EQ(sampler.resetSession(), SamplerError::Ok);
  EXPECT_TRUE(store.empty());
}

TEST_F(SamplerTest, LostLinkEndsRunAfterKeepingTheTick) {
  UnplugSink unplug(link, 3);
  Sampler sampler(link, calibrator, store);
  sampler.addSink(&unplug);

  ASSERT_EQ(sampler.start(100.0, true), SamplerError::Ok);
  ASSERT_TRUE(sampler.waitIdleFor(2000));

  std::vector<Record> rs = store.snapshot();
  ASSERT_EQ(rs.size(), 4u);
  EXPECT_FALSE(rs[3].hasPressure());
  EXPECT_FALSE(rs[3].hasDisplacement());
  EXPECT_EQ(sampler.start(10.0), SamplerError::NotConnected);
}

TEST_F(SamplerTest, SinksSeeEveryRecordAndSample) {
  CountingSink sink;
  Sampler sampler(link, calibrator, store);
  sampler.addSink(&sink);

  ASSERT_EQ(sampler.start(50.0, true, 0.1), SamplerError::Ok);
  sampler.waitIdle();
  sampler.removeSink(&sink);

  EXPECT_EQ(sink.recordCount(), 5u);
  EXPECT_EQ(sink.sampleCount(), 10u);
}

TEST_F(SamplerTest, ReadOnceUsesRetryPolicy) {
  link.push(Channel::Pressure, LinkError::Timeout);
  link.setConstant(Channel::Pressure, 0.75f);
  Sampler sampler(link, calibrator, store);

  float v = 0.0f;
  EXPECT_EQ(sampler.readOnce(Channel::Pressure, v), LinkError::Ok);
  EXPECT_FLOAT_EQ(v, 0.75f);

  link.push(Channel::Pressure, LinkError::Timeout);
  link.push(Channel::Pressure, LinkError::Timeout);
  EXPECT_EQ(sampler.readOnce(Channel::Pressure, v), LinkError::Timeout);
  EXPECT_TRUE(store.empty());
}

TEST_F(SamplerTest, ConsolePrinterIsThrottled) {
  ConsolePrinter printer(10000);
  Sampler sampler(link, calibrator, store);
  sampler.addSink(&printer);

  ASSERT_EQ(sampler.start(50.0, true, 0.2), SamplerError::Ok);
  sampler.waitIdle();
  sampler.removeSink(&printer);

  EXPECT_EQ(store.size(), 10u);
  EXPECT_EQ(printer.printed(), 1u);
}
