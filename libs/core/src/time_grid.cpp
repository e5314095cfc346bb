/**
 * @file time_grid.cpp
 * @brief Evaluation grid construction.
 * @author Watosn
 */

#include "emsynth/core/time_grid.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace emsynth::core {
namespace {

constexpr double kCountGuard = 1e-9;
constexpr std::size_t kMaxGridPoints = 100000000U;

}  // namespace

TimeGrid make_time_grid(double tmin, double tmax, double step) {
  if (!std::isfinite(tmin) || !std::isfinite(tmax) || !std::isfinite(step) || !(step > 0.0) || tmax < tmin) {
    return TimeGrid{.tmin = tmin, .tmax = tmax, .step = step, .status = Status::InvalidInput};
  }

  const double span_steps = (tmax - tmin) / step;
  const double intervals = std::floor(span_steps + kCountGuard * std::max(1.0, span_steps));
  if (intervals + 1.0 > static_cast<double>(kMaxGridPoints)) {
    return TimeGrid{.tmin = tmin, .tmax = tmax, .step = step, .status = Status::InvalidInput};
  }

  const auto n = static_cast<std::size_t>(intervals) + 1U;
  TimeGrid grid{.tmin = tmin, .tmax = tmax, .step = step};
  grid.times.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    grid.times.push_back(tmin + static_cast<double>(i) * step);
  }
  return grid;
}

}  // namespace emsynth::core
