/************************************************************************
 * @file Log.cpp
 * @brief Tagged console loggers
 *
 * Every module logs through its own spdlog logger so the tag shows up
 * in the line, the way ESP_LOGx(TAG, ...) does on the firmware side.
 ************************************************************************/

#include "Log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

static const char* LOG_PATTERN = "%L (%H:%M:%S.%e) %n: %v";

static std::mutex s_log_mutex;

std::shared_ptr<spdlog::logger> pdlLog(const char* tag) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  std::shared_ptr<spdlog::logger> logger = spdlog::get(tag);
  if (!logger) {
    logger = spdlog::stdout_color_mt(tag);
    logger->set_pattern(LOG_PATTERN);
  }
  return logger;
}

bool pdlSetLogLevel(const std::string& level) {
  const spdlog::level::level_enum lvl = spdlog::level::from_str(level);
  // from_str() maps anything unknown to "off"
  if (lvl == spdlog::level::off && level != "off") {
    return false;
  }
  std::lock_guard<std::mutex> lock(s_log_mutex);
  spdlog::set_level(lvl);
  return true;
}
