/**
 * @file realism.hpp
 * @brief Realism pipeline turning a dense model evaluation into observed photometry.
 * @author Watosn
 */
#pragma once

#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "emsynth/core/interfaces.hpp"
#include "emsynth/core/types.hpp"
#include "emsynth/realism/realism_config.hpp"

namespace emsynth::realism {

/**
 * @brief Evaluates the model at arbitrary times (used for augmentation epochs).
 */
using EvaluateAt = std::function<emsynth::core::ModelEvaluation(const std::vector<double>&)>;

/**
 * @brief Observed light curve after the realism transforms.
 */
struct RealismOutcome {
  emsynth::core::LightCurve light_curve{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief ZTF single-epoch 5-sigma depths (AB mag, median conditions).
 */
namespace ztf_depth {
inline constexpr double kG = 20.8;
inline constexpr double kR = 20.6;
inline constexpr double kI = 19.9;
inline constexpr double kErrorFloor = 0.01;
}  // namespace ztf_depth

/**
 * @brief Magnitude-dependent ZTF uncertainty for `mag` in a ZTF band.
 *
 * `sigma = hypot(floor, 1.0857 / 5 * 10^(0.4 (mag - m5)))`, i.e. SNR 5 at the
 * band depth `m5`. Accepts `g`, `r`, `i` and their `ztf`-prefixed names.
 * @return false if `filter` is not a ZTF band.
 */
[[nodiscard]] bool ztf_magnitude_error(const std::string& filter, double mag, double* sigma);

/**
 * @brief Replace detections fainter than the per-filter limit by upper limits
 *        and perturb the remaining magnitudes with Gaussian noise.
 *
 * A point with `mag >= limit` becomes `(t, limit, +inf)`. Other points get
 * `N(0, sigma)` noise and `mag_error = sigma`, where `sigma` is
 * `photometric_error`, or the ZTF error model for ZTF bands when
 * `ztf_uncertainties` is set.
 */
void apply_detection_limits(emsynth::core::LightCurve& light_curve,
                            const std::map<std::string, double>& limits,
                            double photometric_error,
                            bool ztf_uncertainties,
                            std::mt19937_64& rng);

/**
 * @brief Augmentation epochs for the window `[tmin, tmax]`.
 */
std::vector<double> augmentation_times(const AugmentationConfig& config, double tmin, double tmax);

/**
 * @brief Insert model magnitudes at the augmentation epochs.
 * @return `ModelEvaluationError` if the model fails at the extra epochs.
 */
emsynth::core::Status augment_photometry(emsynth::core::LightCurve& light_curve,
                                         const AugmentationConfig& config,
                                         double tmin,
                                         double tmax,
                                         const EvaluateAt& evaluate_at);

/**
 * @brief Remove non-finite magnitudes and sort every series by time.
 */
void finalize_light_curve(emsynth::core::LightCurve& light_curve);

/**
 * @brief Full pipeline: cadence sampling, augmentation, detection limits, cleanup.
 * @param dense Model magnitudes on `grid_times`.
 * @param rng Generator for cadence and photometric noise; advanced in place.
 */
RealismOutcome apply_realism(const emsynth::core::FilterMagnitudes& dense,
                             const std::vector<double>& grid_times,
                             const RealismConfig& config,
                             const EvaluateAt& evaluate_at,
                             std::mt19937_64& rng);

}  // namespace emsynth::realism
