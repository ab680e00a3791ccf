/*************************************************************************
 * @file Config.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_CONFIG_H
#define PDL_CONFIG_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <stdint.h>
#include <string>

#include "Record.h"

/*************************************************************************
 * Defines
 ************************************************************************/
// --- Serial link ---
#ifndef PDL_DEFAULT_BAUD
#define PDL_DEFAULT_BAUD 9600
#endif

#ifndef PDL_LINK_TIMEOUT_MS
#define PDL_LINK_TIMEOUT_MS 200     // per request, reply must be complete by then
#endif

#ifndef PDL_LINE_MAX
#define PDL_LINE_MAX 64             // longest reply line accepted
#endif

// --- Sampler ---
#ifndef PDL_READ_RETRIES
#define PDL_READ_RETRIES 1          // extra attempts after a transient read failure
#endif

#ifndef PDL_MAX_RATE_HZ
#define PDL_MAX_RATE_HZ 1000.0
#endif

#ifndef PDL_DEFAULT_RATE_HZ
#define PDL_DEFAULT_RATE_HZ 10.0
#endif

// --- Display ---
#ifndef PDL_PLOT_WINDOW
#define PDL_PLOT_WINDOW 2000        // points kept by live plot views
#endif

#ifndef PDL_PRINT_EVERY_MS
#define PDL_PRINT_EVERY_MS 1000
#endif

/*************************************************************************
 * Types
 ************************************************************************/
struct CalibrationPreset {
  bool  has_low  = false;
  bool  has_high = false;
  float low_V    = 0.0f;
  float low_value  = 0.0f;
  float high_V   = 0.0f;
  float high_value = 0.0f;
};

struct AppConfig {
  std::string port;
  uint32_t    baud           = PDL_DEFAULT_BAUD;
  uint32_t    timeout_ms     = PDL_LINK_TIMEOUT_MS;
  uint32_t    retries        = PDL_READ_RETRIES;
  double      rate_hz        = PDL_DEFAULT_RATE_HZ;
  double      duration_s     = 0.0;              // 0: until interrupted
  std::string output         = "session.csv";
  uint32_t    print_every_ms = PDL_PRINT_EVERY_MS;
  std::string log_level      = "info";
  CalibrationPreset calibration[PDL_CHANNEL_COUNT];
};

/*************************************************************************
 * Functions
 ************************************************************************/
// Parse a JSON configuration document. Keys that are absent keep their defaults.
// Returns false (and logs why) on syntax errors, wrong types or out-of-range values;
// `out` is only written on success.
bool parseConfig(const std::string& json, AppConfig& out);

// Read and parse a configuration file.
bool loadConfig(const std::string& path, AppConfig& out);

#endif // PDL_CONFIG_H
