/*************************************************************************
 * @file Record.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_RECORD_H
#define PDL_RECORD_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <math.h>
#include <stdint.h>

/*************************************************************************
 * Types
 ************************************************************************/
enum class Channel : uint8_t {
  Pressure = 0,
  Displacement = 1,
};

constexpr int PDL_CHANNEL_COUNT = 2;

inline int channelIndex(Channel ch) { return static_cast<int>(ch); }

// Single-byte request understood by the firmware
inline char channelRequestCode(Channel ch) {
  return ch == Channel::Pressure ? 'a' : 'b';
}

inline const char* channelName(Channel ch) {
  return ch == Channel::Pressure ? "pressure" : "displacement";
}

struct CalibratedReading {
  float value;       // physical units, or the raw voltage when !calibrated
  bool  calibrated;
};

// One channel reading of one tick. Never modified after the tick handler builds it.
struct Sample {
  double            time_s;
  Channel           channel;
  float             raw_V;      // NAN if the read failed
  CalibratedReading reading;    // value NAN if the read failed
};

// One acquisition tick: the row unit stored, displayed and exported.
// Missing channel values are NAN.
struct Record {
  double time_s;
  float  pressure_kPa;
  float  displacement_mm;
  bool   pressure_calibrated;
  bool   displacement_calibrated;
  bool   discontinuity;           // first tick after a resumed Start

  bool hasPressure() const     { return !isnan(pressure_kPa); }
  bool hasDisplacement() const { return !isnan(displacement_mm); }
};

#endif // PDL_RECORD_H
