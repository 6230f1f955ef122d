#include "edfio/calibration.hpp"

#include "edfio/errors.hpp"

#include <cmath>
#include <string>

namespace edfio {

Calibration derive_calibration(const ChannelHeader& channels) {
  const size_t n = channels.n_samps.size();
  if (channels.physical_min.size() != n || channels.physical_max.size() != n ||
      channels.digital_min.size() != n || channels.digital_max.size() != n) {
    throw RecordShapeError("Calibration: channel arrays differ in length (n_samps has " +
                           std::to_string(n) + " entries)");
  }

  Calibration cal(n);
  for (size_t ch = 0; ch < n; ++ch) {
    const double pmin = channels.physical_min[ch];
    const double pmax = channels.physical_max[ch];
    const double dmin = static_cast<double>(channels.digital_min[ch]);
    const double dmax = static_cast<double>(channels.digital_max[ch]);

    const double scale = (pmax - pmin) / (dmax - dmin);
    if (!std::isfinite(scale) || !(scale > 0.0)) {
      cal[ch].scale = 1.0;
      cal[ch].offset = 0.0;
      cal[ch].fallback = true;
      continue;
    }
    cal[ch].scale = scale;
    cal[ch].offset = pmin - scale * dmin;
  }
  return cal;
}

long long to_digital(double physical, const ChannelCalibration& c) {
  const double d = (physical - c.offset) / c.scale;
  if (!std::isfinite(d)) return 0;
  return std::llround(d);
}

} // namespace edfio
