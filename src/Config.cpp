/************************************************************************
 * @file Config.cpp
 * @brief JSON configuration loading
 *
 * Runtime settings of the logger: serial port, sampling, export and
 * optional calibration presets. Defaults come from the PDL_* macros.
 ************************************************************************/

#include "Config.h"
#include "Log.h"

#include <fstream>
#include <sstream>

#include <ArduinoJson.h>

static const char* TAG_CONFIG = "CONFIG";

// ----- typed field readers (absent key == keep default) -----
static bool readUnsigned(JsonVariantConst v, const char* key, uint32_t& dst) {
  if (v.isNull()) return true;
  if (!v.is<uint32_t>()) {
    pdlLog(TAG_CONFIG)->error("'{}' must be a non-negative integer", key);
    return false;
  }
  dst = v.as<uint32_t>();
  return true;
}

static bool readNumber(JsonVariantConst v, const char* key, double& dst) {
  if (v.isNull()) return true;
  if (!v.is<double>()) {
    pdlLog(TAG_CONFIG)->error("'{}' must be a number", key);
    return false;
  }
  dst = v.as<double>();
  return true;
}

static bool readString(JsonVariantConst v, const char* key, std::string& dst) {
  if (v.isNull()) return true;
  if (!v.is<const char*>()) {
    pdlLog(TAG_CONFIG)->error("'{}' must be a string", key);
    return false;
  }
  dst = v.as<const char*>();
  return true;
}

// { "voltage": 0.5, "value": 0.0 }
static bool readPoint(JsonVariantConst v, const std::string& key, bool& has, float& volts, float& value) {
  if (v.isNull()) return true;
  JsonVariantConst jv = v["voltage"];
  JsonVariantConst jp = v["value"];
  if (!v.is<JsonObjectConst>() || !jv.is<float>() || !jp.is<float>()) {
    pdlLog(TAG_CONFIG)->error("'{}' needs numeric 'voltage' and 'value'", key);
    return false;
  }
  volts = jv.as<float>();
  value = jp.as<float>();
  has = true;
  return true;
}

static bool readPreset(JsonVariantConst v, Channel ch, CalibrationPreset& dst) {
  if (v.isNull()) return true;
  const std::string base = std::string("calibration.") + channelName(ch);
  if (!v.is<JsonObjectConst>()) {
    pdlLog(TAG_CONFIG)->error("'{}' must be an object", base);
    return false;
  }
  return readPoint(v["low"],  base + ".low",  dst.has_low,  dst.low_V,  dst.low_value) &&
         readPoint(v["high"], base + ".high", dst.has_high, dst.high_V, dst.high_value);
}

static bool validLevelName(const std::string& s) {
  static const char* names[] = {"trace", "debug", "info", "warn", "warning",
                                "err", "error", "critical", "off"};
  for (const char* n : names) {
    if (s == n) return true;
  }
  return false;
}

// ----- parse -----
bool parseConfig(const std::string& json, AppConfig& out) {
  StaticJsonDocument<2048> doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    pdlLog(TAG_CONFIG)->error("JSON parse failed: {}", err.c_str());
    return false;
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    pdlLog(TAG_CONFIG)->error("top level must be an object");
    return false;
  }

  AppConfig cfg = out;
  bool ok = readString(root["port"], "port", cfg.port) &&
            readUnsigned(root["baud"], "baud", cfg.baud) &&
            readUnsigned(root["timeout_ms"], "timeout_ms", cfg.timeout_ms) &&
            readUnsigned(root["retries"], "retries", cfg.retries) &&
            readNumber(root["rate_hz"], "rate_hz", cfg.rate_hz) &&
            readNumber(root["duration_s"], "duration_s", cfg.duration_s) &&
            readString(root["output"], "output", cfg.output) &&
            readUnsigned(root["print_every_ms"], "print_every_ms", cfg.print_every_ms) &&
            readString(root["log_level"], "log_level", cfg.log_level);
  if (!ok) return false;

  JsonVariantConst cal = root["calibration"];
  if (!cal.isNull()) {
    if (!cal.is<JsonObjectConst>()) {
      pdlLog(TAG_CONFIG)->error("'calibration' must be an object");
      return false;
    }
    if (!readPreset(cal["pressure"], Channel::Pressure,
                    cfg.calibration[channelIndex(Channel::Pressure)]) ||
        !readPreset(cal["displacement"], Channel::Displacement,
                    cfg.calibration[channelIndex(Channel::Displacement)])) {
      return false;
    }
  }

  // range checks
  if (cfg.baud == 0) {
    pdlLog(TAG_CONFIG)->error("baud must be > 0");
    return false;
  }
  if (cfg.timeout_ms == 0) {
    pdlLog(TAG_CONFIG)->error("timeout_ms must be > 0");
    return false;
  }
  if (!(cfg.rate_hz > 0.0) || cfg.rate_hz > PDL_MAX_RATE_HZ) {
    pdlLog(TAG_CONFIG)->error("rate_hz must be in (0, {}]", PDL_MAX_RATE_HZ);
    return false;
  }
  if (!(cfg.duration_s >= 0.0)) {
    pdlLog(TAG_CONFIG)->error("duration_s must be >= 0");
    return false;
  }
  if (!validLevelName(cfg.log_level)) {
    pdlLog(TAG_CONFIG)->error("unknown log_level '{}'", cfg.log_level);
    return false;
  }

  out = cfg;
  return true;
}

bool loadConfig(const std::string& path, AppConfig& out) {
  std::ifstream in(path);
  if (!in) {
    pdlLog(TAG_CONFIG)->error("cannot open config file {}", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!parseConfig(ss.str(), out)) {
    pdlLog(TAG_CONFIG)->error("invalid config file {}", path);
    return false;
  }
  pdlLog(TAG_CONFIG)->info("loaded {} (port={}, rate={} Hz)", path, out.port, out.rate_hz);
  return true;
}
