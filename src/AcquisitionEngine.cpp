/************************************************************************
 * @file AcquisitionEngine.cpp
 * @brief Front-end facing acquisition engine
 ************************************************************************/

#include "AcquisitionEngine.h"
#include "Log.h"

#include <math.h>

#include <ArduinoJson.h>

static const char* TAG_ENGINE = "ENGINE";

AcquisitionEngine::AcquisitionEngine(std::unique_ptr<Link> link, const SamplerSettings& settings)
: link(std::move(link)),
  sampler(*this->link, calibrator, store, settings) {}

AcquisitionEngine::~AcquisitionEngine() {
  sampler.stop();
}

// ----- connection -----
LinkError AcquisitionEngine::open(const std::string& port) {
  LinkError e = link->open(port);
  if (e == LinkError::Ok) {
    port_name = port;
    pdlLog(TAG_ENGINE)->info("connected to {}", port);
  } else {
    pdlLog(TAG_ENGINE)->warn("connect to {} failed: {}", port, linkErrorName(e));
  }
  return e;
}

void AcquisitionEngine::close() {
  sampler.stop();
  if (link->isOpen()) {
    link->close();
    pdlLog(TAG_ENGINE)->info("disconnected from {}", port_name);
  }
  port_name.clear();
}

bool AcquisitionEngine::isConnected() const {
  return link->isOpen();
}

// ----- sampling -----
SamplerError AcquisitionEngine::start(double rate_hz, bool reset_session, double duration_s) {
  SamplerError e = sampler.start(rate_hz, reset_session, duration_s);
  if (e != SamplerError::Ok) {
    pdlLog(TAG_ENGINE)->warn("start failed: {}", samplerErrorName(e));
  }
  return e;
}

void AcquisitionEngine::stop() {
  sampler.stop();
}

// ----- calibration -----
AcquisitionEngine::CaptureResult AcquisitionEngine::capturePoint(Channel ch, CalPoint which, float reference_value) {
  CaptureResult r {LinkError::Ok, CalibrationError::Ok, NAN};

  if (sampler.isRunning()) {
    r.voltage = sampler.lastRawVoltage(ch);
    // no good read yet in this session
    if (isnan(r.voltage)) r.link = LinkError::Timeout;
  } else {
    r.link = sampler.readOnce(ch, r.voltage);
    if (r.link != LinkError::Ok) r.voltage = NAN;
  }

  if (r.link != LinkError::Ok) {
    pdlLog(TAG_ENGINE)->warn("{} capture failed: {}", channelName(ch), linkErrorName(r.link));
    return r;
  }
  r.calibration = calibrator.recordPoint(ch, which, reference_value, r.voltage);
  return r;
}

// ----- export -----
IOError AcquisitionEngine::exportTo(const std::string& path) const {
  return Exporter::writeFile(path, store.snapshot());
}

std::string AcquisitionEngine::toClipboardText() const {
  return Exporter::toClipboardText(store.snapshot());
}

// ----- status -----
static void fillCalibration(JsonObject obj, const ChannelCalibration& c) {
  obj["complete"] = c.complete();
  obj["hasLow"]   = c.has_low;
  obj["hasHigh"]  = c.has_high;
  if (c.complete()) {
    obj["slope"]  = c.slope;
    obj["offset"] = c.offset;
  }
}

// root: type, connected, port, isRunning, records, rateHz, calibration
// per channel: complete, hasLow, hasHigh, slope, offset
static const size_t STATUS_JSON_CAPACITY =
    JSON_OBJECT_SIZE(7) + JSON_OBJECT_SIZE(PDL_CHANNEL_COUNT) + PDL_CHANNEL_COUNT * JSON_OBJECT_SIZE(5);

std::string AcquisitionEngine::statusJson() const {
  // port is copied into the pool
  DynamicJsonDocument doc(STATUS_JSON_CAPACITY + port_name.size() + 1);
  doc["type"]      = "status";
  doc["connected"] = isConnected();
  doc["port"]      = port_name;
  doc["isRunning"] = sampler.isRunning();
  doc["records"]   = store.size();
  doc["rateHz"]    = sampler.rateHz();

  JsonObject cal = doc.createNestedObject("calibration");
  fillCalibration(cal.createNestedObject(channelName(Channel::Pressure)),
                  calibrator.getCalibration(Channel::Pressure));
  fillCalibration(cal.createNestedObject(channelName(Channel::Displacement)),
                  calibrator.getCalibration(Channel::Displacement));

  if (doc.overflowed()) {
    pdlLog(TAG_ENGINE)->error("status document overflowed ({} bytes)", doc.capacity());
  }

  std::string out;
  serializeJson(doc, out);
  return out;
}
