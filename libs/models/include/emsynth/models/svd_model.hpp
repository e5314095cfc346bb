/**
 * @file svd_model.hpp
 * @brief SVD-surrogate kilonova light-curve model.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "emsynth/core/interfaces.hpp"

namespace emsynth::models {

/**
 * @brief Scheme used to predict SVD coefficients at a parameter point.
 */
enum class CoefficientInterpolation : unsigned char { GaussianProcess, Nearest };

/**
 * @brief Parse an interpolation scheme name (`sklearn_gp`, `nearest`).
 * @return False for unsupported schemes.
 */
bool parse_coefficient_interpolation(const std::string& name, CoefficientInterpolation* out);

/**
 * @brief Kilonova model reconstructing magnitudes from a reduced SVD basis.
 *
 * The surrogate file `<svd_path>/<model>.json` stores normalized training
 * points, a shared RBF kernel, and per filter the SVD basis over a reference
 * time grid with per-coefficient GP weights. Magnitudes are reconstructed on
 * the reference grid, interpolated to the sample times with linear
 * extrapolation and shifted by the distance modulus of `luminosity_distance`.
 */
class SvdLightCurveModel final : public emsynth::core::ILightCurveModel {
 public:
  /**
   * @brief SVD model configuration.
   */
  struct Config {
    std::string model{};
    std::filesystem::path svd_path{};
    int mag_ncoeff{10};
    int lbol_ncoeff{10};
    CoefficientInterpolation interpolation{CoefficientInterpolation::GaussianProcess};
    std::vector<std::string> filters{};
  };

  /**
   * @brief Factory helper that loads the surrogate file.
   * @note On failure the model is returned unloaded and `load_status()` reports why.
   */
  static std::unique_ptr<SvdLightCurveModel> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return config_.model; }

  /**
   * @brief Evaluate magnitudes and bolometric luminosity.
   */
  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& parameters,
                                                        const std::vector<double>& sample_times) const override;

  /**
   * @brief Result of loading the surrogate file.
   */
  [[nodiscard]] emsynth::core::Status load_status() const { return load_status_; }

  /**
   * @brief Filters evaluated by this model.
   */
  [[nodiscard]] std::vector<std::string> filters() const;

 private:
  class Impl;
  explicit SvdLightCurveModel(Config config) : config_(std::move(config)) {}

  Config config_{};
  std::shared_ptr<const Impl> impl_{};
  emsynth::core::Status load_status_{emsynth::core::Status::DataUnavailable};
};

}  // namespace emsynth::models
