/************************************************************************
 * @file Sampler.cpp
 * @brief Fixed-rate acquisition of pressure and displacement
 *
 * Each tick reads both channels through the Link (one retry on a
 * transient failure), converts them with the Calibrator and appends a
 * Record to the SeriesStore. A failed channel becomes NAN; the record
 * is never dropped.
 ************************************************************************/

#include "Sampler.h"
#include "Log.h"

#include <math.h>

#include <spdlog/fmt/fmt.h>

static const char* TAG_SAMPLER = "SAMPLER";

const char* samplerErrorName(SamplerError e) {
  switch (e) {
    case SamplerError::Ok:             return "Ok";
    case SamplerError::InvalidRate:    return "InvalidRate";
    case SamplerError::NotConnected:   return "NotConnected";
    case SamplerError::AlreadyRunning: return "AlreadyRunning";
  }
  return "Unknown";
}

// ----- ctor / dtor -----
Sampler::Sampler(Link& link, Calibrator& calibrator, SeriesStore& store, const SamplerSettings& settings)
: link(link),
  calibrator(calibrator),
  store(store),
  settings(settings) {
  for (int i = 0; i < PDL_CHANNEL_COUNT; ++i) {
    last_raw[i].store(NAN);
    n_missing[i].store(0);
  }
}

Sampler::~Sampler() {
  stop();
}

// ----- control -----
SamplerError Sampler::start(double rate, bool reset_session, double duration_s) {
  std::lock_guard<std::mutex> control(control_mutex);

  if (!isfinite(rate) || rate <= 0.0 || rate > settings.max_rate_hz ||
      !isfinite(duration_s) || duration_s < 0.0) {
    pdlLog(TAG_SAMPLER)->warn("start refused: rate {} Hz / duration {} s out of range", rate, duration_s);
    return SamplerError::InvalidRate;
  }
  if (!link.isOpen()) {
    pdlLog(TAG_SAMPLER)->warn("start refused: link not open");
    return SamplerError::NotConnected;
  }

  std::unique_lock<std::mutex> lock(state_mutex);
  if (running) {
    pdlLog(TAG_SAMPLER)->warn("start refused: already running");
    return SamplerError::AlreadyRunning;
  }
  // previous run ended on its own (duration, link lost)
  if (worker.joinable()) worker.join();

  const steady::time_point now = steady::now();
  const bool resumed = !reset_session && has_epoch && !store.empty();
  if (!resumed) {
    if (!store.empty()) store.clear();
    has_epoch   = true;
    epoch       = now;
    last_time_s = 0.0;
    n_ticks = 0;
    n_retries = 0;
    n_late = 0;
    for (int i = 0; i < PDL_CHANNEL_COUNT; ++i) {
      n_missing[i] = 0;
      last_raw[i].store(NAN);
    }
  }

  RunPlan plan;
  plan.start      = now;
  plan.period_s   = 1.0 / rate;
  plan.tick_limit = 0;
  if (duration_s > 0.0) {
    plan.tick_limit = (uint64_t)llround(rate * duration_s);
    if (plan.tick_limit == 0) plan.tick_limit = 1;
  }
  plan.resumed = resumed;

  rate_hz        = rate;
  stop_requested = false;
  running        = true;
  worker = std::thread(&Sampler::run, this, plan);

  if (resumed) {
    pdlLog(TAG_SAMPLER)->info("resumed session at {:.3f} s, {} Hz", std::chrono::duration<double>(now - epoch).count(), rate);
  } else {
    pdlLog(TAG_SAMPLER)->info("new session, {} Hz{}", rate,
                              plan.tick_limit ? fmt::format(", {} ticks", plan.tick_limit) : std::string());
  }
  return SamplerError::Ok;
}

void Sampler::stop() {
  std::lock_guard<std::mutex> control(control_mutex);
  {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (!worker.joinable()) return;
    stop_requested = true;
  }
  state_cv.notify_all();
  worker.join();
}

bool Sampler::isRunning() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  return running;
}

void Sampler::waitIdle() {
  std::unique_lock<std::mutex> lock(state_mutex);
  state_cv.wait(lock, [this] { return !running; });
}

bool Sampler::waitIdleFor(uint32_t ms) {
  std::unique_lock<std::mutex> lock(state_mutex);
  return state_cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return !running; });
}

SamplerError Sampler::resetSession() {
  std::lock_guard<std::mutex> control(control_mutex);
  {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (running) return SamplerError::AlreadyRunning;
    has_epoch = false;
  }
  store.clear();
  return SamplerError::Ok;
}

// ----- sinks -----
void Sampler::addSink(SampleSink* sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex);
  sinks.push_back(sink);
}

void Sampler::removeSink(SampleSink* sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex);
  for (auto it = sinks.begin(); it != sinks.end(); ++it) {
    if (*it == sink) { sinks.erase(it); return; }
  }
}

// ----- reads -----
LinkError Sampler::readOnce(Channel ch, float& volts) {
  std::lock_guard<std::mutex> lock(link_mutex);
  return readWithRetry(ch, volts);
}

float Sampler::lastRawVoltage(Channel ch) const {
  return last_raw[channelIndex(ch)].load();
}

double Sampler::rateHz() const {
  return rate_hz.load();
}

Sampler::Stats Sampler::getStats() const {
  Stats s;
  s.ticks                = n_ticks.load();
  s.retries              = n_retries.load();
  s.missing_pressure     = n_missing[channelIndex(Channel::Pressure)].load();
  s.missing_displacement = n_missing[channelIndex(Channel::Displacement)].load();
  s.late_ticks           = n_late.load();
  return s;
}

// Caller holds link_mutex
LinkError Sampler::readWithRetry(Channel ch, float& volts) {
  LinkError e = link.readVoltage(ch, volts);
  for (uint32_t i = 0; i < settings.retries &&
       (e == LinkError::Timeout || e == LinkError::MalformedResponse); ++i) {
    n_retries++;
    pdlLog(TAG_SAMPLER)->debug("{} read {}, retrying", channelName(ch), linkErrorName(e));
    e = link.readVoltage(ch, volts);
  }
  return e;
}

Sample Sampler::sampleChannel(Channel ch, double t, LinkError& err) {
  Sample s;
  s.time_s  = t;
  s.channel = ch;
  s.raw_V   = NAN;
  s.reading = CalibratedReading{NAN, false};

  float v = NAN;
  {
    std::lock_guard<std::mutex> lock(link_mutex);
    err = readWithRetry(ch, v);
  }
  if (err != LinkError::Ok) {
    n_missing[channelIndex(ch)]++;
    pdlLog(TAG_SAMPLER)->warn("t={:.3f} s: {} missing ({})", t, channelName(ch), linkErrorName(err));
    return s;
  }
  s.raw_V   = v;
  s.reading = calibrator.convert(ch, v);
  last_raw[channelIndex(ch)].store(v);
  return s;
}

void Sampler::publish(const Sample& p, const Sample& d, const Record& rec) {
  std::vector<SampleSink*> targets;
  {
    std::lock_guard<std::mutex> lock(sinks_mutex);
    targets = sinks;
  }
  for (SampleSink* sink : targets) {
    sink->onSample(p);
    sink->onSample(d);
    sink->onRecord(rec);
  }
}

// ----- sampler thread -----
void Sampler::run(RunPlan plan) {
  uint64_t k = 0;
  const char* end_reason = "stopped";

  while (true) {
    const steady::time_point due = plan.start +
        std::chrono::duration_cast<steady::duration>(std::chrono::duration<double>((double)k * plan.period_s));
    {
      std::unique_lock<std::mutex> lock(state_mutex);
      state_cv.wait_until(lock, due, [this] { return stop_requested; });
      if (stop_requested) break;
    }

    const steady::time_point now = steady::now();
    if (std::chrono::duration<double>(now - due).count() > plan.period_s) n_late++;

    // strictly increasing even if two ticks land on the same clock value
    double t = std::chrono::duration<double>(now - epoch).count();
    if (t <= last_time_s && n_ticks > 0) t = nextafter(last_time_s, INFINITY);
    last_time_s = t;

    LinkError ep, ed;
    const Sample sp = sampleChannel(Channel::Pressure, t, ep);
    const Sample sd = sampleChannel(Channel::Displacement, t, ed);

    Record rec;
    rec.time_s                  = t;
    rec.pressure_kPa            = sp.reading.value;
    rec.displacement_mm         = sd.reading.value;
    rec.pressure_calibrated     = sp.reading.calibrated;
    rec.displacement_calibrated = sd.reading.calibrated;
    rec.discontinuity           = (k == 0) && plan.resumed;

    store.append(rec);
    n_ticks++;
    publish(sp, sd, rec);
    ++k;

    if (ep == LinkError::NotOpen || ed == LinkError::NotOpen) {
      pdlLog(TAG_SAMPLER)->error("link closed during run");
      end_reason = "link lost";
      break;
    }
    if (plan.tick_limit && k >= plan.tick_limit) {
      end_reason = "duration reached";
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex);
    running = false;
  }
  state_cv.notify_all();
  pdlLog(TAG_SAMPLER)->info("run ended ({}) after {} ticks", end_reason, k);
}
