/************************************************************************
 * @file Exporter.cpp
 * @brief CSV export of the session records
 ************************************************************************/

#include "Exporter.h"
#include "Log.h"

#include <errno.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>

static const char* TAG_EXPORT = "EXPORT";

const char* const Exporter::CSV_HEADER = "time_s,pressure_kPa,displacement_mm";

const char* ioErrorName(IOError e) {
  switch (e) {
    case IOError::Ok:         return "Ok";
    case IOError::WriteError: return "WriteError";
  }
  return "Unknown";
}

std::string Exporter::formatValue(double v) {
  if (isnan(v)) return std::string();
  return fmt::format("{}", v);
}

std::string Exporter::formatValue(float v) {
  if (isnan(v)) return std::string();
  return fmt::format("{}", v);
}

std::string Exporter::toCSV(const std::vector<Record>& records) {
  std::string out;
  out.reserve(40 * (records.size() + 1));
  out += CSV_HEADER;
  out += '\n';
  for (const Record& r : records) {
    out += formatValue(r.time_s);
    out += ',';
    out += formatValue(r.pressure_kPa);
    out += ',';
    out += formatValue(r.displacement_mm);
    out += '\n';
  }
  return out;
}

// ----- atomic file write -----
static bool writeAll(int fd, const std::string& text) {
  const char* p = text.data();
  size_t left = text.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += n;
    left -= (size_t)n;
  }
  return true;
}

IOError Exporter::writeFile(const std::string& path, const std::vector<Record>& records) {
  const std::string text = toCSV(records);

  std::string tmpl = path + ".tmp.XXXXXX";
  std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
  tmp_path.push_back('\0');

  int fd = mkstemp(tmp_path.data());
  if (fd < 0) {
    pdlLog(TAG_EXPORT)->error("cannot create temporary file for {}: {}", path, strerror(errno));
    return IOError::WriteError;
  }

  // mkstemp() creates 0600
  bool ok = (fchmod(fd, 0644) == 0) && writeAll(fd, text);
  int err = errno;
  if (ok && fsync(fd) != 0) { ok = false; err = errno; }
  if (::close(fd) != 0 && ok) { ok = false; err = errno; }
  if (ok && rename(tmp_path.data(), path.c_str()) != 0) { ok = false; err = errno; }

  if (!ok) {
    unlink(tmp_path.data());
    pdlLog(TAG_EXPORT)->error("writing {} failed: {}", path, strerror(err));
    return IOError::WriteError;
  }
  pdlLog(TAG_EXPORT)->info("wrote {} records to {}", records.size(), path);
  return IOError::Ok;
}
