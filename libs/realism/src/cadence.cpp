/**
 * @file cadence.cpp
 * @brief Survey cadence plans and cadence resampling.
 * @author Watosn
 */

#include "emsynth/realism/cadence.hpp"

#include <algorithm>
#include <initializer_list>

#include "emsynth/core/numerics.hpp"

namespace emsynth::realism {
namespace {

constexpr double kZtfCadenceDays = 2.0;
constexpr double kZtfJitterDays = 0.1;
constexpr double kZtfWeatherLoss = 0.3;
constexpr double kZtfPairSeparationDays = 0.02;

void add_visits(std::vector<CadenceEpoch>& out, std::initializer_list<double> times, std::initializer_list<const char*> filters) {
  for (const double t : times) {
    for (const char* f : filters) {
      out.push_back(CadenceEpoch{.time = t, .filter = f});
    }
  }
}

}  // namespace

std::vector<CadenceEpoch> ztf_survey_epochs(double tmin, double tmax, std::mt19937_64& rng) {
  std::uniform_real_distribution<double> phase(0.0, kZtfCadenceDays);
  std::uniform_real_distribution<double> jitter(-kZtfJitterDays, kZtfJitterDays);
  std::bernoulli_distribution lost(kZtfWeatherLoss);

  std::vector<CadenceEpoch> out;
  for (double night = tmin + phase(rng); night <= tmax; night += kZtfCadenceDays) {
    const double t = night + jitter(rng);
    if (lost(rng)) {
      continue;
    }
    out.push_back(CadenceEpoch{.time = t, .filter = "g"});
    out.push_back(CadenceEpoch{.time = t + kZtfPairSeparationDays, .filter = "r"});
  }
  return out;
}

std::vector<CadenceEpoch> ztf_too_epochs(ZtfTooExposure exposure) {
  std::vector<CadenceEpoch> out;
  switch (exposure) {
    case ZtfTooExposure::Exposure180s:
      add_visits(out, {0.05, 0.10, 0.15, 1.05, 1.10, 1.15}, {"g", "r"});
      break;
    case ZtfTooExposure::Exposure300s:
      add_visits(out, {0.05, 0.15, 1.05, 1.15}, {"g", "r"});
      break;
    default:
      break;
  }
  return out;
}

std::vector<CadenceEpoch> rubin_too_epochs(RubinTooType type) {
  std::vector<CadenceEpoch> out;
  switch (type) {
    case RubinTooType::Bns:
      add_visits(out, {1.0 / 24.0, 2.0 / 24.0, 4.0 / 24.0}, {"g", "i"});
      add_visits(out, {1.0, 2.0}, {"g", "r", "i"});
      break;
    case RubinTooType::Nsbh:
      add_visits(out, {1.0 / 24.0, 4.0 / 24.0}, {"g", "i"});
      add_visits(out, {1.0, 2.0, 3.0}, {"g", "i"});
      break;
    default:
      break;
  }
  return out;
}

std::vector<CadenceEpoch> build_cadence_plan(const RealismConfig& config,
                                             double tmin,
                                             double tmax,
                                             std::mt19937_64& rng) {
  std::vector<CadenceEpoch> plan;
  if (config.ztf_sampling) {
    const auto survey = ztf_survey_epochs(tmin, tmax, rng);
    plan.insert(plan.end(), survey.begin(), survey.end());
    const auto too = ztf_too_epochs(config.ztf_too);
    plan.insert(plan.end(), too.begin(), too.end());
  }
  if (config.rubin_too) {
    const auto too = rubin_too_epochs(config.rubin_too_type);
    plan.insert(plan.end(), too.begin(), too.end());
  }

  plan.erase(std::remove_if(plan.begin(), plan.end(),
                            [&](const CadenceEpoch& e) { return e.time < tmin || e.time > tmax; }),
             plan.end());
  std::sort(plan.begin(), plan.end(), [](const CadenceEpoch& a, const CadenceEpoch& b) {
    return a.time < b.time || (a.time == b.time && a.filter < b.filter);
  });
  return plan;
}

emsynth::core::LightCurve sample_on_cadence(const emsynth::core::FilterMagnitudes& dense,
                                            const std::vector<double>& grid_times,
                                            const std::vector<CadenceEpoch>& plan) {
  emsynth::core::LightCurve out;
  for (const auto& epoch : plan) {
    const auto it = dense.find(epoch.filter);
    if (it == dense.end()) {
      continue;
    }
    const double mag = emsynth::core::interp_linear_extrapolate(grid_times, it->second, epoch.time);
    out[epoch.filter].push_back(emsynth::core::LightCurvePoint{.time = epoch.time, .mag = mag});
  }
  return out;
}

}  // namespace emsynth::realism
