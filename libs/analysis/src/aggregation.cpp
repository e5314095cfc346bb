/**
 * @file aggregation.cpp
 * @brief Per-filter percentile bands and magnitude histograms over all injections.
 * @author Watosn
 */

#include "emsynth/analysis/aggregation.hpp"

#include <cmath>
#include <fstream>
#include <limits>

#include <fmt/format.h>

#include "emsynth/core/numerics.hpp"

namespace emsynth::analysis {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kGridTimeTolerance = 1e-6;

std::vector<double> series_on_grid(const std::vector<emsynth::core::LightCurvePoint>& series,
                                   const emsynth::core::TimeGrid& grid,
                                   const bool resample) {
  if (resample) {
    std::vector<double> t;
    std::vector<double> m;
    t.reserve(series.size());
    m.reserve(series.size());
    for (const auto& p : series) {
      t.push_back(p.time);
      m.push_back(p.mag);
    }
    return emsynth::core::interp_linear_extrapolate(t, m, grid.times);
  }
  // Raw series are subsets of the grid (non-finite samples are dropped), so
  // each point goes to the grid column at its own time.
  std::vector<double> row(grid.times.size(), kNaN);
  const double tol = kGridTimeTolerance * grid.step;
  for (const auto& p : series) {
    const double k = std::round((p.time - grid.tmin) / grid.step);
    if (!(k >= 0.0) || k >= static_cast<double>(row.size())) {
      continue;
    }
    const auto j = static_cast<std::size_t>(k);
    if (std::abs(grid.times[j] - p.time) <= tol) {
      row[j] = p.mag;
    }
  }
  return row;
}

}  // namespace

AggregationSummary aggregate(const emsynth::core::ResultCollection& results,
                             const std::string& filter,
                             const emsynth::core::TimeGrid& grid,
                             const bool resample,
                             const AggregationConfig& config) {
  if (grid.status != emsynth::core::Status::Ok || grid.times.empty() || !(grid.step > 0.0) || config.n_edges < 2U ||
      !(config.hist_max > config.hist_min)) {
    return AggregationSummary{.filter = filter, .status = emsynth::core::Status::InvalidInput};
  }
  if (results.empty()) {
    return AggregationSummary{.filter = filter, .status = emsynth::core::Status::DataUnavailable};
  }

  AggregationSummary out{.filter = filter, .times = grid.times};
  const auto n_times = grid.times.size();
  out.stacked = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(results.size()),
                                          static_cast<Eigen::Index>(n_times), kNaN);
  Eigen::Index r = 0;
  for (const auto& [index, light_curve] : results) {
    out.indices.push_back(index);
    const auto it = light_curve.find(filter);
    if (it != light_curve.end()) {
      const auto row = series_on_grid(it->second, grid, resample);
      for (std::size_t j = 0; j < n_times; ++j) {
        out.stacked(r, static_cast<Eigen::Index>(j)) = row[j];
      }
    }
    ++r;
  }

  out.bin_edges = emsynth::core::linspace(config.hist_min, config.hist_max, config.n_edges);
  out.bin_centers.reserve(config.n_edges - 1U);
  for (std::size_t b = 0; b + 1U < out.bin_edges.size(); ++b) {
    out.bin_centers.push_back(0.5 * (out.bin_edges[b] + out.bin_edges[b + 1U]));
  }

  out.histogram.reserve(n_times);
  out.p10.reserve(n_times);
  out.p50.reserve(n_times);
  out.p90.reserve(n_times);
  for (std::size_t j = 0; j < n_times; ++j) {
    const Eigen::VectorXd col = out.stacked.col(static_cast<Eigen::Index>(j));
    const std::vector<double> column(col.data(), col.data() + col.size());
    out.histogram.push_back(emsynth::core::histogram_counts(column, out.bin_edges));
    out.p10.push_back(emsynth::core::nan_percentile(column, 10.0));
    out.p50.push_back(emsynth::core::nan_percentile(column, 50.0));
    out.p90.push_back(emsynth::core::nan_percentile(column, 90.0));
  }
  return out;
}

emsynth::core::Status write_aggregation_csv(const AggregationSummary& summary, const std::filesystem::path& path) {
  if (summary.status != emsynth::core::Status::Ok) {
    return summary.status;
  }
  std::ofstream out(path);
  if (!out) {
    return emsynth::core::Status::DataUnavailable;
  }
  out << "time,p10,p50,p90";
  for (std::size_t b = 0; b < summary.bin_centers.size(); ++b) {
    out << fmt::format(",bin_{:.4f}", summary.bin_centers[b]);
  }
  out << "\n";
  for (std::size_t j = 0; j < summary.times.size(); ++j) {
    out << fmt::format("{:.10g},{:.10g},{:.10g},{:.10g}", summary.times[j], summary.p10[j], summary.p50[j],
                       summary.p90[j]);
    for (const auto count : summary.histogram[j]) {
      out << "," << count;
    }
    out << "\n";
  }
  out.flush();
  return out ? emsynth::core::Status::Ok : emsynth::core::Status::DataUnavailable;
}

}  // namespace emsynth::analysis
