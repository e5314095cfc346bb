/**
 * @file aggregation.hpp
 * @brief Per-filter percentile bands and magnitude histograms over all injections.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "emsynth/core/time_grid.hpp"
#include "emsynth/core/types.hpp"

namespace emsynth::analysis {

/**
 * @brief Histogram binning over the magnitude axis.
 */
struct AggregationConfig {
  double hist_min{-20.0};
  double hist_max{1.0};
  std::size_t n_edges{50};
};

/**
 * @brief Plot data for one filter.
 *
 * `stacked` is injections x times (row order follows `indices`). `histogram`
 * is times x bins. Percentile vectors have one entry per time and are NaN
 * where a column has no finite value.
 */
struct AggregationSummary {
  std::string filter{};
  std::vector<emsynth::core::InjectionIndex> indices{};
  std::vector<double> times{};
  std::vector<double> bin_edges{};
  std::vector<double> bin_centers{};
  Eigen::MatrixXd stacked{};
  std::vector<std::vector<std::size_t>> histogram{};
  std::vector<double> p10{};
  std::vector<double> p50{};
  std::vector<double> p90{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief Stack every injection's `filter` series on `grid` and summarize each time column.
 * @param resample Interpolate irregular series onto the grid (linear, extrapolating
 *        beyond the recorded span). Otherwise each point fills the grid column
 *        at its own time and columns without a point stay NaN.
 * @return `InvalidInput` for a bad grid or binning, `DataUnavailable` for an empty collection.
 */
[[nodiscard]] AggregationSummary aggregate(const emsynth::core::ResultCollection& results,
                                           const std::string& filter,
                                           const emsynth::core::TimeGrid& grid,
                                           bool resample,
                                           const AggregationConfig& config = {});

/**
 * @brief Export percentile bands and the histogram as CSV.
 *
 * One row per time: the percentiles followed by one count column per bin,
 * headed `bin_<center>`.
 */
[[nodiscard]] emsynth::core::Status write_aggregation_csv(const AggregationSummary& summary,
                                                          const std::filesystem::path& path);

}  // namespace emsynth::analysis
