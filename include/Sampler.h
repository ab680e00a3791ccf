/*************************************************************************
 * @file Sampler.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_SAMPLER_H
#define PDL_SAMPLER_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "Calibrator.h"
#include "Config.h"
#include "Link.h"
#include "Record.h"
#include "SeriesStore.h"

/*************************************************************************
 * Types
 ************************************************************************/
enum class SamplerError : uint8_t {
  Ok = 0,
  InvalidRate,
  NotConnected,
  AlreadyRunning,
};

const char* samplerErrorName(SamplerError e);

// Observer of the acquisition stream. Called on the sampler thread right after the
// record reached the store; implementations must return quickly and must not call
// Sampler::stop().
class SampleSink {
public:
  virtual ~SampleSink() = default;
  virtual void onSample(const Sample& s) { (void)s; }
  virtual void onRecord(const Record& rec) = 0;
};

struct SamplerSettings {
  uint32_t retries     = PDL_READ_RETRIES;
  double   max_rate_hz = PDL_MAX_RATE_HZ;
};

/*************************************************************************
 * Class
 ************************************************************************/
// Periodic acquisition: one thread per run, tick k due at run_start + k/rate.
//
// Session policy on start():
//   reset_session == true  -> store cleared, new session clock.
//   reset_session == false -> if the store holds records, the run resumes that session:
//                             the session clock kept running during the pause, and the
//                             first record of the run has discontinuity == true.
class Sampler {
public:
  struct Stats {
    uint64_t ticks;
    uint64_t retries;
    uint64_t missing_pressure;
    uint64_t missing_displacement;
    uint64_t late_ticks;          // started more than one period after their due time
  };

  Sampler(Link& link, Calibrator& calibrator, SeriesStore& store,
          const SamplerSettings& settings = SamplerSettings());
  ~Sampler();

  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  // duration_s > 0 limits the run to round(rate_hz * duration_s) ticks.
  SamplerError start(double rate_hz, bool reset_session = false, double duration_s = 0.0);

  // Returns once the sampler thread has exited. A tick in progress is completed
  // and its record kept. Safe to call when idle.
  void stop();

  bool isRunning() const;

  // Block until the current run ends (duration reached, stop(), or link lost).
  void waitIdle();
  bool waitIdleFor(uint32_t ms);

  // Drop the session and its clock. Refused while running.
  SamplerError resetSession();

  void addSink(SampleSink* sink);
  void removeSink(SampleSink* sink);

  // One read with the sampler's retry policy, on the caller's thread.
  // Meant for calibration capture while idle; serialized with the sampler thread.
  LinkError readOnce(Channel ch, float& volts);

  // Latest raw voltage read by the sampler thread, NAN before the first good read.
  float lastRawVoltage(Channel ch) const;

  double rateHz() const;
  Stats getStats() const;

private:
  using steady = std::chrono::steady_clock;

  struct RunPlan {
    steady::time_point start;
    double             period_s;
    uint64_t           tick_limit;   // 0 = unbounded
    bool               resumed;
  };

  void run(RunPlan plan);
  Sample sampleChannel(Channel ch, double t, LinkError& err);
  LinkError readWithRetry(Channel ch, float& volts);
  void publish(const Sample& p, const Sample& d, const Record& rec);

  Link&           link;
  Calibrator&     calibrator;
  SeriesStore&    store;
  SamplerSettings settings;

  // start/stop/reset are serialized
  std::mutex control_mutex;

  // worker <-> controller hand-shake
  mutable std::mutex      state_mutex;
  std::condition_variable state_cv;
  bool                    running = false;
  bool                    stop_requested = false;
  std::thread             worker;

  // Link access (sampler thread vs. readOnce)
  std::mutex link_mutex;

  // session clock
  bool               has_epoch = false;
  steady::time_point epoch;
  double             last_time_s = 0.0;

  std::atomic<double> rate_hz {0.0};
  std::atomic<float>  last_raw[PDL_CHANNEL_COUNT];

  std::atomic<uint64_t> n_ticks {0};
  std::atomic<uint64_t> n_retries {0};
  std::atomic<uint64_t> n_missing[PDL_CHANNEL_COUNT];
  std::atomic<uint64_t> n_late {0};

  std::mutex               sinks_mutex;
  std::vector<SampleSink*> sinks;
};

#endif // PDL_SAMPLER_H
