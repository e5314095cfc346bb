/**
 * @file time_grid.hpp
 * @brief Uniform evaluation grid with arange semantics.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "emsynth/core/types.hpp"

namespace emsynth::core {

/**
 * @brief Ordered evaluation times in days relative to the trigger.
 *
 * `times.size() == floor((tmax - tmin) / step) + 1`. The last time may differ
 * from `tmax` by floating-point error; callers must not rely on an exact endpoint.
 */
struct TimeGrid {
  double tmin{};
  double tmax{};
  double step{};
  std::vector<double> times{};
  Status status{Status::Ok};
};

/**
 * @brief Build a grid from `[tmin, tmax]` sampled every `step` days.
 * @return Grid with `status` set; `InvalidInput` for a non-positive step or `tmax < tmin`.
 */
[[nodiscard]] TimeGrid make_time_grid(double tmin, double tmax, double step);

}  // namespace emsynth::core
