#include "edfio/calibration.hpp"
#include "edfio/errors.hpp"
#include "edfio/types.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>

static bool nearly(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static edfio::ChannelHeader make_channels() {
  edfio::ChannelHeader ch;
  // 0: standard EEG calibration
  // 1: identity
  // 2: inverted digital range (seen in the wild)
  // 3: empty digital range
  // 4: inverted physical range
  ch.physical_min = {-200.0, -32768.0, -100.0, 0.0, 50.0};
  ch.physical_max = {200.0, 32767.0, 100.0, 1.0, -50.0};
  ch.digital_min = {-2048, -32768, 2047, 5, -2048};
  ch.digital_max = {2047, 32767, -2048, 5, 2047};
  ch.n_samps = {4, 4, 4, 4, 4};
  return ch;
}

int main() {
  using namespace edfio;

  const Calibration cal = derive_calibration(make_channels());
  assert(cal.size() == 5);

  // Well-formed ranges give a positive scale that maps the digital limits onto
  // the physical limits.
  {
    const ChannelCalibration& c = cal[0];
    assert(!c.fallback);
    assert(c.scale > 0.0);
    assert(nearly(c.scale, 400.0 / 4095.0));
    assert(nearly(to_physical(-2048, c), -200.0));
    assert(nearly(to_physical(2047, c), 200.0));
  }
  {
    const ChannelCalibration& c = cal[1];
    assert(!c.fallback);
    assert(nearly(c.scale, 1.0));
    assert(nearly(c.offset, 0.0));
  }

  // Degenerate ranges fall back to the identity mapping and are flagged.
  for (size_t i = 2; i < cal.size(); ++i) {
    assert(cal[i].fallback);
    assert(cal[i].scale == 1.0);
    assert(cal[i].offset == 0.0);
  }

  // Inverse transform rounds to the nearest digital step.
  {
    const ChannelCalibration& c = cal[0];
    const long long d = to_digital(100.0, c);
    assert(std::fabs(to_physical(static_cast<int32_t>(d), c) - 100.0) <= c.scale / 2.0);
    assert(to_digital(-200.0, c) == -2048);
    assert(to_digital(200.0, c) == 2047);
    // Out of range values are not clipped.
    assert(to_digital(400.0, c) > 2047);
  }

  // Mismatched array lengths are a shape error, not a crash.
  {
    ChannelHeader bad = make_channels();
    bad.digital_max.pop_back();
    TEST_THROWS((void)derive_calibration(bad), RecordShapeError);
  }

  std::cout << "Calibration tests passed.\n";
  return 0;
}
