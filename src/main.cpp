// *************************************************************************
//  @file main.cpp
//  @brief Headless logger: config -> connect -> calibrate -> sample -> CSV
// *************************************************************************

#include <atomic>
#include <memory>
#include <signal.h>
#include <string>
#include <vector>

#include "AcquisitionEngine.h"
#include "Config.h"
#include "Log.h"
#include "Printer.h"
#include "SerialLink.h"

static const char* TAG = "MAIN";

static std::atomic<bool> g_interrupted {false};

static void onSignal(int) {
  g_interrupted = true;
}

static void listPorts() {
  const std::vector<std::string> ports = SerialLink::listPorts();
  if (ports.empty()) {
    pdlLog(TAG)->info("no serial boards found");
    return;
  }
  for (const std::string& p : ports) pdlLog(TAG)->info("available port: {}", p);
}

static bool applyPresets(AcquisitionEngine& engine, const AppConfig& cfg) {
  const Channel channels[] = {Channel::Pressure, Channel::Displacement};
  for (Channel ch : channels) {
    const CalibrationPreset& p = cfg.calibration[channelIndex(ch)];
    if (p.has_low && engine.recordPoint(ch, CalPoint::Low, p.low_value, p.low_V) != CalibrationError::Ok) {
      pdlLog(TAG)->error("{} low calibration preset rejected", channelName(ch));
      return false;
    }
    if (p.has_high && engine.recordPoint(ch, CalPoint::High, p.high_value, p.high_V) != CalibrationError::Ok) {
      pdlLog(TAG)->error("{} high calibration preset rejected", channelName(ch));
      return false;
    }
    if (!engine.isComplete(ch)) {
      pdlLog(TAG)->warn("{} not calibrated, logging raw volts", channelName(ch));
    }
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc != 2) {
    pdlLog(TAG)->error("usage: {} <config.json> | --list-ports", argv[0]);
    return 1;
  }
  if (std::string(argv[1]) == "--list-ports") {
    listPorts();
    return 0;
  }

  AppConfig cfg;
  if (!loadConfig(argv[1], cfg)) return 1;
  pdlSetLogLevel(cfg.log_level);
  if (cfg.port.empty()) {
    pdlLog(TAG)->error("no serial port configured");
    listPorts();
    return 1;
  }

  SamplerSettings settings;
  settings.retries = cfg.retries;
  AcquisitionEngine engine(std::make_unique<SerialLink>(cfg.baud, cfg.timeout_ms), settings);

  if (engine.open(cfg.port) != LinkError::Ok) return 1;
  if (!applyPresets(engine, cfg)) {
    engine.close();
    return 1;
  }

  signal(SIGINT, onSignal);
  signal(SIGTERM, onSignal);

  ConsolePrinter printer(cfg.print_every_ms);
  engine.addSink(&printer);

  SamplerError se = engine.start(cfg.rate_hz, /*reset_session=*/true, cfg.duration_s);
  if (se != SamplerError::Ok) {
    engine.close();
    return 1;
  }

  // nothing else to do here: the sampler thread does the work
  while (!g_interrupted && !engine.waitIdleFor(100)) {
  }
  engine.stop();
  engine.removeSink(&printer);

  const Sampler::Stats st = engine.samplerStats();
  pdlLog(TAG)->info("{} records, {} retries, missing p/d = {}/{}, late ticks {}",
                    engine.recordCount(), st.retries, st.missing_pressure,
                    st.missing_displacement, st.late_ticks);

  int rc = 0;
  if (engine.exportTo(cfg.output) != IOError::Ok) rc = 1;
  engine.close();
  return rc;
}
