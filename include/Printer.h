/*************************************************************************
 * @file Printer.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_PRINTER_H
#define PDL_PRINTER_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <chrono>
#include <stdint.h>

#include "Sampler.h"

/*************************************************************************
 * Class
 ************************************************************************/
// Live readout for the console, the headless stand-in for the GUI's
// real-time labels. Logs at most one record per `every_ms`.
class ConsolePrinter : public SampleSink {
public:
  explicit ConsolePrinter(uint32_t every_ms = PDL_PRINT_EVERY_MS);

  void onRecord(const Record& rec) override;

  inline uint64_t printed() const { return n_printed; }

private:
  std::chrono::milliseconds             every;
  std::chrono::steady_clock::time_point last;
  bool                                  first = true;
  uint64_t                              n_printed = 0;
};

#endif // PDL_PRINTER_H
