/**
 * @file numerics.hpp
 * @brief Interpolation, percentile and histogram helpers on sampled series.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

namespace emsynth::core {

/**
 * @brief Piecewise-linear interpolant over strictly sorted abscissae.
 *
 * Outside `[x.front(), x.back()]` the first/last segment is continued linearly.
 * Returns NaN when fewer than two samples are available.
 */
[[nodiscard]] double interp_linear_extrapolate(const std::vector<double>& x, const std::vector<double>& y, double xq);

/**
 * @brief Vector form of `interp_linear_extrapolate`.
 */
[[nodiscard]] std::vector<double> interp_linear_extrapolate(const std::vector<double>& x,
                                                            const std::vector<double>& y,
                                                            const std::vector<double>& xq);

/**
 * @brief Percentile of the finite values using linear interpolation between order statistics.
 * @param values Samples; NaN and infinities are ignored.
 * @param q Percentile in [0, 100].
 * @return NaN if no finite value is present.
 */
[[nodiscard]] double nan_percentile(std::vector<double> values, double q);

/**
 * @brief `n` evenly spaced values over `[lo, hi]` inclusive.
 */
[[nodiscard]] std::vector<double> linspace(double lo, double hi, std::size_t n);

/**
 * @brief Count finite values per bin.
 *
 * Bins are `[e_i, e_{i+1})` except the last, which also includes its right edge.
 * Values outside the edges are not counted.
 */
[[nodiscard]] std::vector<std::size_t> histogram_counts(const std::vector<double>& values,
                                                        const std::vector<double>& edges);

}  // namespace emsynth::core
