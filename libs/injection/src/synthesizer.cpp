/**
 * @file synthesizer.cpp
 * @brief Per-injection light-curve synthesis.
 * @author Watosn
 */

#include "emsynth/injection/synthesizer.hpp"

#include <cmath>
#include <utility>

#include "emsynth/realism/realism.hpp"

namespace emsynth::injection {

emsynth::core::Status resolve_trigger_time_gps(const emsynth::core::ParameterSet& parameters, double* gps_seconds) {
  if (gps_seconds == nullptr) {
    return emsynth::core::Status::InvalidInput;
  }
  auto it = parameters.find(kTriggerTimeKey);
  if (it == parameters.end()) {
    it = parameters.find(kFallbackTriggerTimeKey);
  }
  if (it == parameters.end()) {
    return emsynth::core::Status::MissingField;
  }
  if (!std::isfinite(it->second)) {
    return emsynth::core::Status::InvalidInput;
  }
  *gps_seconds = it->second;
  return emsynth::core::Status::Ok;
}

emsynth::core::ParameterSet merge_derived_fields(const emsynth::core::ParameterSet& parameters,
                                                 const DerivedFields& derived) {
  emsynth::core::ParameterSet merged = parameters;
  merged[kTriggerTimeMjdKey] = derived.trigger_time_mjd;
  if (derived.absolute) {
    merged[kLuminosityDistanceKey] = emsynth::core::time_constants::kAbsoluteMagnitudeDistanceMpc;
  }
  return merged;
}

std::mt19937_64 injection_generator(const std::uint64_t generation_seed, const emsynth::core::InjectionIndex index) {
  const auto idx = static_cast<std::uint64_t>(index);
  std::seed_seq seq{static_cast<std::uint32_t>(generation_seed & 0xffffffffULL),
                    static_cast<std::uint32_t>(generation_seed >> 32U),
                    static_cast<std::uint32_t>(idx & 0xffffffffULL),
                    static_cast<std::uint32_t>(idx >> 32U)};
  return std::mt19937_64(seq);
}

LightCurveSynthesizer::LightCurveSynthesizer(const emsynth::core::ILightCurveModel& model, SynthesisConfig config)
    : model_(model), config_(std::move(config)) {}

emsynth::core::LightCurveResult LightCurveSynthesizer::synthesize(const emsynth::core::ParameterSet& parameters,
                                                                  std::mt19937_64& rng) const {
  if (config_.grid.status != emsynth::core::Status::Ok || config_.grid.times.empty()) {
    return emsynth::core::LightCurveResult{.status = emsynth::core::Status::InvalidInput};
  }

  double gps = 0.0;
  const auto trigger_status = resolve_trigger_time_gps(parameters, &gps);
  if (trigger_status != emsynth::core::Status::Ok) {
    return emsynth::core::LightCurveResult{.status = trigger_status};
  }

  const DerivedFields derived{
      .trigger_time_mjd = emsynth::core::gps_to_mjd(gps, config_.time_scale),
      .absolute = config_.absolute,
  };
  const auto merged = merge_derived_fields(parameters, derived);

  const auto dense = model_.evaluate(merged, config_.grid.times);
  if (dense.status != emsynth::core::Status::Ok) {
    return emsynth::core::LightCurveResult{.trigger_time_mjd = derived.trigger_time_mjd,
                                           .status = emsynth::core::Status::ModelEvaluationError};
  }

  const emsynth::realism::EvaluateAt evaluate_at = [this, &merged](const std::vector<double>& times) {
    return model_.evaluate(merged, times);
  };
  auto observed = emsynth::realism::apply_realism(dense.magnitudes, config_.grid.times, config_.realism,
                                                  evaluate_at, rng);
  if (observed.status != emsynth::core::Status::Ok) {
    return emsynth::core::LightCurveResult{.trigger_time_mjd = derived.trigger_time_mjd, .status = observed.status};
  }

  return emsynth::core::LightCurveResult{
      .light_curve = std::move(observed.light_curve),
      .trigger_time_mjd = derived.trigger_time_mjd,
      .status = emsynth::core::Status::Ok,
  };
}

}  // namespace emsynth::injection
