/*************************************************************************
 * @file Log.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_LOG_H
#define PDL_LOG_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/*************************************************************************
 * Functions
 ************************************************************************/
// Named logger for a module tag ("LINK", "SAMPLER", ...). Created on first use,
// shared afterwards. Output mimics the firmware log line: "I (12:00:01.250) TAG: msg".
std::shared_ptr<spdlog::logger> pdlLog(const char* tag);

// Applies a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
// to every logger. Returns false and leaves the level untouched on an unknown name.
bool pdlSetLogLevel(const std::string& level);

#endif // PDL_LOG_H
