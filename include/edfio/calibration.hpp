#pragma once

#include "edfio/types.hpp"

#include <cstdint>

namespace edfio {

// Derive scale/offset for every channel:
//   scale  = (physical_max - physical_min) / (digital_max - digital_min)
//   offset = physical_min - scale * digital_min
//
// A channel whose scale is not a finite positive number (digital or physical
// range empty or inverted) gets scale 1, offset 0 and fallback = true.
//
// Throws RecordShapeError if the numeric channel arrays differ in length.
Calibration derive_calibration(const ChannelHeader& channels);

inline double to_physical(int32_t digital, const ChannelCalibration& c) {
  return static_cast<double>(digital) * c.scale + c.offset;
}

// Inverse transform, rounded to the nearest integer. No clipping: the caller
// decides how the value is stored.
long long to_digital(double physical, const ChannelCalibration& c);

} // namespace edfio
