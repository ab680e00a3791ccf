/*************************************************************************
 * @file AcquisitionEngine.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_ACQUISITION_ENGINE_H
#define PDL_ACQUISITION_ENGINE_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <memory>
#include <string>
#include <vector>

#include "Calibrator.h"
#include "Exporter.h"
#include "Link.h"
#include "Sampler.h"
#include "SeriesStore.h"

/*************************************************************************
 * Class
 ************************************************************************/
// Everything a front end needs: connection, calibration, sampling, views, export.
// Owns the link, the calibration, the session store and the sampler.
class AcquisitionEngine {
public:
  struct CaptureResult {
    LinkError        link;
    CalibrationError calibration;
    float            voltage;      // NAN if no voltage could be obtained
  };

  explicit AcquisitionEngine(std::unique_ptr<Link> link,
                             const SamplerSettings& settings = SamplerSettings());
  ~AcquisitionEngine();

  AcquisitionEngine(const AcquisitionEngine&) = delete;
  AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;

  // --- connection ---
  LinkError open(const std::string& port);
  void close();                                     // stops a running session first
  bool isConnected() const;
  inline const std::string& portName() const { return port_name; }

  // --- sampling ---
  SamplerError start(double rate_hz, bool reset_session = false, double duration_s = 0.0);
  void stop();
  bool isRunning() const { return sampler.isRunning(); }
  void waitIdle() { sampler.waitIdle(); }
  bool waitIdleFor(uint32_t ms) { return sampler.waitIdleFor(ms); }
  SamplerError resetSession() { return sampler.resetSession(); }
  void addSink(SampleSink* sink) { sampler.addSink(sink); }
  void removeSink(SampleSink* sink) { sampler.removeSink(sink); }
  Sampler::Stats samplerStats() const { return sampler.getStats(); }

  // --- calibration ---
  CalibrationError recordPoint(Channel ch, CalPoint which, float reference_value, float measured_V) {
    return calibrator.recordPoint(ch, which, reference_value, measured_V);
  }

  // Measure the channel now and record it as a reference point. While a session is
  // running the sampler's latest voltage is used instead of issuing a request.
  CaptureResult capturePoint(Channel ch, CalPoint which, float reference_value);

  bool isComplete(Channel ch) const { return calibrator.isComplete(ch); }
  ChannelCalibration getCalibration(Channel ch) const { return calibrator.getCalibration(ch); }
  void resetCalibration(Channel ch) { calibrator.resetChannel(ch); }

  // --- views ---
  std::vector<Record> snapshot() const { return store.snapshot(); }
  bool copySince(SeriesCursor& cursor, std::vector<Record>& out, size_t max_count = (size_t)-1) const {
    return store.copySince(cursor, out, max_count);
  }
  std::vector<Record> plotWindow() const { return store.tail(PDL_PLOT_WINDOW); }
  bool latest(Record& out) const { return store.latest(out); }
  size_t recordCount() const { return store.size(); }

  // --- export ---
  IOError exportTo(const std::string& path) const;
  std::string toClipboardText() const;

  // {"type":"status","connected":...,"isRunning":...,"calibration":{...}}
  std::string statusJson() const;

private:
  std::unique_ptr<Link> link;
  Calibrator            calibrator;
  SeriesStore           store;
  Sampler               sampler;
  std::string           port_name;
};

#endif // PDL_ACQUISITION_ENGINE_H
