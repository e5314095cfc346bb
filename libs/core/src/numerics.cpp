/**
 * @file numerics.cpp
 * @brief Interpolation, percentile and histogram helpers.
 * @author Watosn
 */

#include "emsynth/core/numerics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace emsynth::core {

double interp_linear_extrapolate(const std::vector<double>& x, const std::vector<double>& y, double xq) {
  const std::size_t n = std::min(x.size(), y.size());
  if (n < 2U || !std::isfinite(xq)) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  const auto last = x.begin() + static_cast<std::ptrdiff_t>(n);
  auto it = std::upper_bound(x.begin(), last, xq);
  std::size_t hi = static_cast<std::size_t>(std::distance(x.begin(), it));
  hi = std::clamp<std::size_t>(hi, 1U, n - 1U);
  const std::size_t lo = hi - 1U;

  const double dx = x[hi] - x[lo];
  if (dx == 0.0) {
    return y[lo];
  }
  const double slope = (y[hi] - y[lo]) / dx;
  return y[lo] + slope * (xq - x[lo]);
}

std::vector<double> interp_linear_extrapolate(const std::vector<double>& x,
                                              const std::vector<double>& y,
                                              const std::vector<double>& xq) {
  std::vector<double> out;
  out.reserve(xq.size());
  for (const double q : xq) {
    out.push_back(interp_linear_extrapolate(x, y, q));
  }
  return out;
}

double nan_percentile(std::vector<double> values, double q) {
  values.erase(std::remove_if(values.begin(), values.end(), [](double v) { return !std::isfinite(v); }), values.end());
  if (values.empty() || !(q >= 0.0 && q <= 100.0)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  std::sort(values.begin(), values.end());

  const double rank = q / 100.0 * static_cast<double>(values.size() - 1U);
  const auto lo = static_cast<std::size_t>(std::floor(rank));
  const std::size_t hi = std::min(lo + 1U, values.size() - 1U);
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + frac * (values[hi] - values[lo]);
}

std::vector<double> linspace(double lo, double hi, std::size_t n) {
  std::vector<double> out;
  if (n == 0U) {
    return out;
  }
  out.reserve(n);
  if (n == 1U) {
    out.push_back(lo);
    return out;
  }
  const double step = (hi - lo) / static_cast<double>(n - 1U);
  for (std::size_t i = 0; i + 1U < n; ++i) {
    out.push_back(lo + static_cast<double>(i) * step);
  }
  out.push_back(hi);
  return out;
}

std::vector<std::size_t> histogram_counts(const std::vector<double>& values, const std::vector<double>& edges) {
  if (edges.size() < 2U) {
    return {};
  }
  std::vector<std::size_t> counts(edges.size() - 1U, 0U);
  for (const double v : values) {
    if (!std::isfinite(v) || v < edges.front() || v > edges.back()) {
      continue;
    }
    if (v == edges.back()) {
      counts.back() += 1U;
      continue;
    }
    const auto it = std::upper_bound(edges.begin(), edges.end(), v);
    const auto bin = static_cast<std::size_t>(std::distance(edges.begin(), it)) - 1U;
    counts[std::min(bin, counts.size() - 1U)] += 1U;
  }
  return counts;
}

}  // namespace emsynth::core
