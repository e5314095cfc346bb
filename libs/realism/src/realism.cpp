/**
 * @file realism.cpp
 * @brief Realism pipeline implementation.
 * @author Watosn
 */

#include "emsynth/realism/realism.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "emsynth/realism/cadence.hpp"

namespace emsynth::realism {
namespace {

// 2.5 / ln(10): magnitude error per unit fractional flux error.
constexpr double kMagnitudePerFluxRatio = 1.0857362047581294;

emsynth::core::LightCurve dense_light_curve(const emsynth::core::FilterMagnitudes& dense,
                                            const std::vector<double>& grid_times) {
  emsynth::core::LightCurve out;
  for (const auto& [filter, mags] : dense) {
    auto& series = out[filter];
    const std::size_t n = std::min(mags.size(), grid_times.size());
    series.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      series.push_back(emsynth::core::LightCurvePoint{.time = grid_times[i], .mag = mags[i]});
    }
  }
  return out;
}

}  // namespace

bool ztf_magnitude_error(const std::string& filter, const double mag, double* sigma) {
  const std::string band = filter.rfind("ztf", 0) == 0 ? filter.substr(3) : filter;
  double depth = 0.0;
  if (band == "g") {
    depth = ztf_depth::kG;
  } else if (band == "r") {
    depth = ztf_depth::kR;
  } else if (band == "i") {
    depth = ztf_depth::kI;
  } else {
    return false;
  }
  const double at_depth = kMagnitudePerFluxRatio / 5.0;
  *sigma = std::hypot(ztf_depth::kErrorFloor, at_depth * std::pow(10.0, 0.4 * (mag - depth)));
  return true;
}

void apply_detection_limits(emsynth::core::LightCurve& light_curve,
                            const std::map<std::string, double>& limits,
                            double photometric_error,
                            bool ztf_uncertainties,
                            std::mt19937_64& rng) {
  std::normal_distribution<double> unit(0.0, 1.0);
  for (auto& [filter, series] : light_curve) {
    const auto lim = limits.find(filter);
    for (auto& p : series) {
      if (!std::isfinite(p.mag)) {
        continue;
      }
      if (lim != limits.end() && p.mag >= lim->second) {
        p.mag = lim->second;
        p.mag_error = std::numeric_limits<double>::infinity();
        continue;
      }
      double sigma = photometric_error;
      if (ztf_uncertainties && !ztf_magnitude_error(filter, p.mag, &sigma)) {
        sigma = photometric_error;
      }
      if (sigma > 0.0) {
        p.mag += sigma * unit(rng);
      }
      p.mag_error = sigma;
    }
  }
}

std::vector<double> augmentation_times(const AugmentationConfig& config, double tmin, double tmax) {
  if (!config.times.empty()) {
    std::vector<double> times = config.times;
    std::sort(times.begin(), times.end());
    return times;
  }
  std::mt19937_64 rng(config.seed);
  std::uniform_real_distribution<double> uniform(tmin, tmax);
  std::vector<double> times;
  times.reserve(static_cast<std::size_t>(std::max(config.n_points, 0)));
  for (int i = 0; i < config.n_points; ++i) {
    times.push_back(uniform(rng));
  }
  std::sort(times.begin(), times.end());
  return times;
}

emsynth::core::Status augment_photometry(emsynth::core::LightCurve& light_curve,
                                         const AugmentationConfig& config,
                                         double tmin,
                                         double tmax,
                                         const EvaluateAt& evaluate_at) {
  if (!config.enabled) {
    return emsynth::core::Status::Ok;
  }
  const auto times = augmentation_times(config, tmin, tmax);
  if (times.empty()) {
    return emsynth::core::Status::Ok;
  }
  const auto eval = evaluate_at(times);
  if (eval.status != emsynth::core::Status::Ok) {
    return emsynth::core::Status::ModelEvaluationError;
  }

  for (const auto& [filter, mags] : eval.magnitudes) {
    if (!config.filters.empty() && std::find(config.filters.begin(), config.filters.end(), filter) == config.filters.end()) {
      continue;
    }
    auto& series = light_curve[filter];
    for (std::size_t i = 0; i < times.size() && i < mags.size(); ++i) {
      series.push_back(emsynth::core::LightCurvePoint{.time = times[i], .mag = mags[i]});
    }
  }
  return emsynth::core::Status::Ok;
}

void finalize_light_curve(emsynth::core::LightCurve& light_curve) {
  for (auto& [filter, series] : light_curve) {
    series.erase(std::remove_if(series.begin(), series.end(),
                                [](const emsynth::core::LightCurvePoint& p) { return !std::isfinite(p.mag); }),
                 series.end());
    std::stable_sort(series.begin(), series.end(),
                     [](const emsynth::core::LightCurvePoint& a, const emsynth::core::LightCurvePoint& b) {
                       return a.time < b.time;
                     });
  }
}

RealismOutcome apply_realism(const emsynth::core::FilterMagnitudes& dense,
                             const std::vector<double>& grid_times,
                             const RealismConfig& config,
                             const EvaluateAt& evaluate_at,
                             std::mt19937_64& rng) {
  const auto status = validate_realism_config(config);
  if (status != emsynth::core::Status::Ok) {
    return RealismOutcome{.status = status};
  }
  if (grid_times.empty()) {
    return RealismOutcome{.status = emsynth::core::Status::InvalidInput};
  }
  const double tmin = grid_times.front();
  const double tmax = grid_times.back();

  RealismOutcome out{};
  if (config.cadence_active()) {
    out.light_curve = sample_on_cadence(dense, grid_times, build_cadence_plan(config, tmin, tmax, rng));
  } else {
    out.light_curve = dense_light_curve(dense, grid_times);
  }

  out.status = augment_photometry(out.light_curve, config.augmentation, tmin, tmax, evaluate_at);
  if (out.status != emsynth::core::Status::Ok) {
    return out;
  }

  apply_detection_limits(out.light_curve, config.detection_limits, config.photometric_error,
                         config.ztf_uncertainties, rng);
  finalize_light_curve(out.light_curve);
  return out;
}

}  // namespace emsynth::realism
