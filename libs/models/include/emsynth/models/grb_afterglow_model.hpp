/**
 * @file grb_afterglow_model.hpp
 * @brief Closed-form GRB jet afterglow light-curve model.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "emsynth/core/interfaces.hpp"

namespace emsynth::models {

/**
 * @brief Jet structure codes (afterglowpy numbering).
 */
enum class JetType : int {
  TopHat = -1,
  Gaussian = 0,
  PowerLawCore = 1,
  GaussianCore = 2,
  Spherical = 3,
  PowerLaw = 4,
};

/**
 * @brief Map an integer jet-type code onto `JetType`.
 * @return False for unsupported codes.
 */
bool jet_type_from_code(int code, JetType* out);

/**
 * @brief Synchrotron afterglow of a decelerating relativistic jet.
 *
 * Uses the slow/fast cooling broken power-law spectrum with standard
 * adiabatic ISM scalings for the break frequencies and peak flux, a smooth
 * jet-break steepening, line-of-sight energy for structured jets and a
 * phenomenological rise for observers outside the jet edge.
 *
 * Parameters: `inclination_EM`, `log10_E0`, `thetaCore`, `thetaWing`,
 * `log10_n0`, `p`, `log10_epsilon_e`, `log10_epsilon_B`,
 * `luminosity_distance` (Mpc), optional `redshift`.
 */
class GrbAfterglowModel final : public emsynth::core::ILightCurveModel {
 public:
  /**
   * @brief Afterglow configuration.
   */
  struct Config {
    double resolution{5.0};
    int jet_type{0};
    std::vector<std::string> filters{};
  };

  /**
   * @brief Factory helper validating jet type, resolution and filters.
   * @note On failure the model is returned unusable and `load_status()` reports why.
   */
  static std::unique_ptr<GrbAfterglowModel> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return "TrPi2018"; }

  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& parameters,
                                                        const std::vector<double>& sample_times) const override;

  [[nodiscard]] emsynth::core::Status load_status() const { return load_status_; }

 private:
  explicit GrbAfterglowModel(Config config) : config_(std::move(config)) {}

  Config config_{};
  JetType jet_type_{JetType::Gaussian};
  std::vector<std::pair<std::string, double>> filter_frequencies_hz_{};
  emsynth::core::Status load_status_{emsynth::core::Status::ConfigurationError};
};

}  // namespace emsynth::models
