/**
 * @file test_numerics.cpp
 * @brief Interpolation, percentile and histogram helper tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>
#include <vector>

#include <spdlog/spdlog.h>

#include "emsynth/core/numerics.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace emsynth;
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  const std::vector<double> x{1.0, 2.0, 4.0};
  const std::vector<double> y{10.0, 20.0, 30.0};
  if (!approx(core::interp_linear_extrapolate(x, y, 1.5), 15.0) ||
      !approx(core::interp_linear_extrapolate(x, y, 3.0), 25.0)) {
    spdlog::error("interior interpolation failed");
    return 1;
  }
  // Beyond the data the end segments continue linearly.
  if (!approx(core::interp_linear_extrapolate(x, y, 0.0), 0.0) ||
      !approx(core::interp_linear_extrapolate(x, y, 6.0), 40.0)) {
    spdlog::error("linear extrapolation failed");
    return 2;
  }
  if (!std::isnan(core::interp_linear_extrapolate({1.0}, {5.0}, 1.0))) {
    spdlog::error("single-point series must not interpolate");
    return 3;
  }

  const std::vector<double> v{3.0, kNaN, 1.0, 2.0, 4.0};
  if (!approx(core::nan_percentile(v, 50.0), 2.5) || !approx(core::nan_percentile(v, 10.0), 1.3) ||
      !approx(core::nan_percentile(v, 90.0), 3.7) || !approx(core::nan_percentile(v, 100.0), 4.0)) {
    spdlog::error("nan percentile mismatch");
    return 4;
  }
  if (!std::isnan(core::nan_percentile({kNaN, kNaN}, 50.0))) {
    spdlog::error("all-NaN percentile must be NaN");
    return 5;
  }

  const auto edges = core::linspace(-20.0, 1.0, 50);
  if (edges.size() != 50U || !approx(edges.front(), -20.0) || !approx(edges.back(), 1.0) ||
      !approx(edges[1] - edges[0], 21.0 / 49.0)) {
    spdlog::error("linspace mismatch");
    return 6;
  }

  const auto counts = core::histogram_counts({0.0, 0.5, 1.0, 1.0, 2.0, -1.0, kNaN}, {0.0, 1.0, 2.0});
  if (counts.size() != 2U || counts[0] != 2U || counts[1] != 3U) {
    spdlog::error("histogram counts mismatch");
    return 7;
  }

  return 0;
}
