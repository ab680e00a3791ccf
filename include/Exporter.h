/*************************************************************************
 * @file Exporter.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_EXPORTER_H
#define PDL_EXPORTER_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <string>
#include <vector>

#include "Record.h"

/*************************************************************************
 * Types
 ************************************************************************/
enum class IOError : uint8_t {
  Ok = 0,
  WriteError,
};

const char* ioErrorName(IOError e);

/*************************************************************************
 * Class
 ************************************************************************/
// CSV rendering of a session:
//   time_s,pressure_kPa,displacement_mm
//   0.1,50,-2.5
//   0.2,,-2.5        <- pressure missing
class Exporter {
public:
  static const char* const CSV_HEADER;

  static std::string toCSV(const std::vector<Record>& records);

  // Same text as toCSV(); delivering it to a clipboard is the caller's job.
  static std::string toClipboardText(const std::vector<Record>& records) { return toCSV(records); }

  // Writes through a temporary file in the same directory and renames it over
  // `path`. On failure nothing is left behind and an existing file is untouched.
  static IOError writeFile(const std::string& path, const std::vector<Record>& records);

  // Shortest text that parses back to the same value; empty for NAN.
  static std::string formatValue(double v);
  static std::string formatValue(float v);
};

#endif // PDL_EXPORTER_H
