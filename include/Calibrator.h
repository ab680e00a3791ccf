/*************************************************************************
 * @file Calibrator.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_CALIBRATOR_H
#define PDL_CALIBRATOR_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <mutex>

#include "Record.h"

/*************************************************************************
 * Types
 ************************************************************************/
enum class CalibrationError : uint8_t {
  Ok = 0,
  DegenerateCalibration,
};

const char* calibrationErrorName(CalibrationError e);

enum class CalPoint : uint8_t { Low, High };

struct CalibrationPoint {
  float raw_V;
  float value;
};

// Calibration of one channel: physical = slope * V + offset once both points exist.
struct ChannelCalibration {
  bool             has_low  = false;
  bool             has_high = false;
  CalibrationPoint low  {0.0f, 0.0f};
  CalibrationPoint high {0.0f, 0.0f};
  double           slope  = 0.0;
  double           offset = 0.0;

  bool complete() const { return has_low && has_high; }
};

/*************************************************************************
 * Class
 ************************************************************************/
// Two-point linear calibration for both channels. Writers are operator actions,
// the reader is the sampler thread; each channel's state is swapped under one mutex.
class Calibrator {
public:
  // Stores a reference point and recomputes the mapping when both points are known.
  // Fails when measured_V equals the other point's voltage or is not finite;
  // state is unchanged on failure.
  CalibrationError recordPoint(Channel ch, CalPoint which, float reference_value, float measured_V);

  // Raw voltage (calibrated=false) until the channel has both points.
  CalibratedReading convert(Channel ch, float raw_V) const;

  bool isComplete(Channel ch) const;

  // Forget both points of one channel; the other channel is untouched.
  void resetChannel(Channel ch);

  ChannelCalibration getCalibration(Channel ch) const;

private:
  mutable std::mutex cal_mutex;
  ChannelCalibration cal[PDL_CHANNEL_COUNT];
};

#endif // PDL_CALIBRATOR_H
