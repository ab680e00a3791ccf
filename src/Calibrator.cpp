/************************************************************************
 * @file Calibrator.cpp
 * @brief Two-point voltage to physical unit calibration
 *
 *   slope  = (value_high - value_low) / (V_high - V_low)
 *   offset = value_low - slope * V_low
 ************************************************************************/

#include "Calibrator.h"
#include "Log.h"

#include <math.h>

static const char* TAG_CAL = "CAL";

const char* calibrationErrorName(CalibrationError e) {
  switch (e) {
    case CalibrationError::Ok:                    return "Ok";
    case CalibrationError::DegenerateCalibration: return "DegenerateCalibration";
  }
  return "Unknown";
}

CalibrationError Calibrator::recordPoint(Channel ch, CalPoint which, float reference_value, float measured_V) {
  const char* which_name = (which == CalPoint::Low) ? "low" : "high";
  if (!isfinite(measured_V) || !isfinite(reference_value)) {
    pdlLog(TAG_CAL)->warn("{} {} point rejected: non-finite input", channelName(ch), which_name);
    return CalibrationError::DegenerateCalibration;
  }

  std::lock_guard<std::mutex> lock(cal_mutex);
  ChannelCalibration next = cal[channelIndex(ch)];

  const bool  other_set = (which == CalPoint::Low) ? next.has_high : next.has_low;
  const float other_V   = (which == CalPoint::Low) ? next.high.raw_V : next.low.raw_V;
  if (other_set && other_V == measured_V) {
    pdlLog(TAG_CAL)->warn("{} {} point rejected: {:.4f} V equals the other point", channelName(ch), which_name, measured_V);
    return CalibrationError::DegenerateCalibration;
  }

  if (which == CalPoint::Low) {
    next.low = CalibrationPoint{measured_V, reference_value};
    next.has_low = true;
  } else {
    next.high = CalibrationPoint{measured_V, reference_value};
    next.has_high = true;
  }

  if (next.complete()) {
    next.slope  = ((double)next.high.value - (double)next.low.value) /
                  ((double)next.high.raw_V - (double)next.low.raw_V);
    next.offset = (double)next.low.value - next.slope * (double)next.low.raw_V;
    pdlLog(TAG_CAL)->info("{} calibrated: y = {:.4f}*V + {:.4f}", channelName(ch), next.slope, next.offset);
  } else {
    pdlLog(TAG_CAL)->info("{} {} point: {:.4f} V -> {}", channelName(ch), which_name, measured_V, reference_value);
  }

  cal[channelIndex(ch)] = next;
  return CalibrationError::Ok;
}

CalibratedReading Calibrator::convert(Channel ch, float raw_V) const {
  ChannelCalibration c;
  {
    std::lock_guard<std::mutex> lock(cal_mutex);
    c = cal[channelIndex(ch)];
  }
  if (!c.complete()) return CalibratedReading{raw_V, false};
  return CalibratedReading{(float)(c.slope * (double)raw_V + c.offset), true};
}

bool Calibrator::isComplete(Channel ch) const {
  std::lock_guard<std::mutex> lock(cal_mutex);
  return cal[channelIndex(ch)].complete();
}

void Calibrator::resetChannel(Channel ch) {
  std::lock_guard<std::mutex> lock(cal_mutex);
  cal[channelIndex(ch)] = ChannelCalibration();
  pdlLog(TAG_CAL)->info("{} calibration cleared", channelName(ch));
}

ChannelCalibration Calibrator::getCalibration(Channel ch) const {
  std::lock_guard<std::mutex> lock(cal_mutex);
  return cal[channelIndex(ch)];
}
