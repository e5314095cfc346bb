/**
 * @file synthesizer.hpp
 * @brief Per-injection light-curve synthesis.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <random>

#include "emsynth/core/interfaces.hpp"
#include "emsynth/core/time_grid.hpp"
#include "emsynth/core/time_systems.hpp"
#include "emsynth/core/types.hpp"
#include "emsynth/realism/realism_config.hpp"

namespace emsynth::injection {

inline constexpr const char* kTriggerTimeKey = "geocent_time_x";
inline constexpr const char* kFallbackTriggerTimeKey = "geocent_time";
inline constexpr const char* kTriggerTimeMjdKey = "kilonova_trigger_time";
inline constexpr const char* kLuminosityDistanceKey = "luminosity_distance";

/**
 * @brief Invocation-wide synthesis settings.
 */
struct SynthesisConfig {
  emsynth::core::TimeGrid grid{};
  bool absolute{};
  emsynth::core::TimeScale time_scale{emsynth::core::TimeScale::Tai};
  emsynth::realism::RealismConfig realism{};
};

/**
 * @brief Values derived per injection before model evaluation.
 */
struct DerivedFields {
  double trigger_time_mjd{};
  bool absolute{};
};

/**
 * @brief Look up the GPS trigger time, preferring `geocent_time_x`.
 * @return `MissingField` if neither key is present.
 */
emsynth::core::Status resolve_trigger_time_gps(const emsynth::core::ParameterSet& parameters, double* gps_seconds);

/**
 * @brief Copy of `parameters` with the derived fields merged in.
 *
 * Adds `kilonova_trigger_time`; in absolute mode also overrides
 * `luminosity_distance` with 10 pc.
 */
emsynth::core::ParameterSet merge_derived_fields(const emsynth::core::ParameterSet& parameters,
                                                 const DerivedFields& derived);

/**
 * @brief Generator for one injection, a pure function of the seed and the index.
 */
std::mt19937_64 injection_generator(std::uint64_t generation_seed, emsynth::core::InjectionIndex index);

/**
 * @brief Turns one injection row into an observed light curve.
 *
 * Holds a reference to the model; the model must outlive the synthesizer.
 */
class LightCurveSynthesizer final {
 public:
  LightCurveSynthesizer(const emsynth::core::ILightCurveModel& model, SynthesisConfig config);

  /**
   * @brief Synthesize the light curve of one injection.
   * @param rng Source of all randomness; advanced in place.
   * @return `MissingField` without a trigger time, `ModelEvaluationError` when
   *         the model fails, otherwise series sorted by time with finite magnitudes.
   */
  [[nodiscard]] emsynth::core::LightCurveResult synthesize(const emsynth::core::ParameterSet& parameters,
                                                           std::mt19937_64& rng) const;

  [[nodiscard]] const SynthesisConfig& config() const { return config_; }

 private:
  const emsynth::core::ILightCurveModel& model_;
  SynthesisConfig config_{};
};

}  // namespace emsynth::injection
