/************************************************************************
 * @file Printer.cpp
 * @brief Throttled live readout of the acquisition stream
 ************************************************************************/

#include "Printer.h"
#include "Log.h"

#include <string>

#include <spdlog/fmt/fmt.h>

static const char* TAG_PRINT = "LIVE";

ConsolePrinter::ConsolePrinter(uint32_t every_ms)
: every(every_ms) {}

void ConsolePrinter::onRecord(const Record& rec) {
  const auto now = std::chrono::steady_clock::now();
  if (!first && (now - last) < every) return;
  first = false;
  last = now;
  n_printed++;

  // NAN fields print as "--"; uncalibrated channels show volts
  const std::string p = rec.hasPressure()
      ? fmt::format("{:.3f} {}", rec.pressure_kPa, rec.pressure_calibrated ? "kPa" : "V")
      : std::string("--");
  const std::string d = rec.hasDisplacement()
      ? fmt::format("{:.3f} {}", rec.displacement_mm, rec.displacement_calibrated ? "mm" : "V")
      : std::string("--");
  pdlLog(TAG_PRINT)->info("t={:.2f} s  pressure={}  displacement={}{}", rec.time_s, p, d,
                          rec.discontinuity ? "  (resumed)" : "");
}
