/**
 * @file realism_config.hpp
 * @brief Observational-realism settings for synthetic light curves.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "emsynth/core/types.hpp"

namespace emsynth::realism {

/**
 * @brief ZTF target-of-opportunity exposure preset.
 */
enum class ZtfTooExposure : std::uint8_t { None, Exposure180s, Exposure300s };

/**
 * @brief Rubin target-of-opportunity strategy preset.
 */
enum class RubinTooType : std::uint8_t { None, Bns, Nsbh };

/**
 * @brief Extra photometric epochs added to the sampled light curve.
 *
 * With explicit `times` every listed time is added; otherwise `n_points`
 * uniform random times in the grid window are drawn from a generator seeded
 * with `seed`. An empty `filters` list augments every filter.
 */
struct AugmentationConfig {
  bool enabled{};
  int n_points{10};
  std::vector<std::string> filters{};
  std::vector<double> times{};
  std::uint64_t seed{0};
};

/**
 * @brief Realism transforms applied after model evaluation.
 */
struct RealismConfig {
  std::map<std::string, double> detection_limits{};
  double photometric_error{};
  bool ztf_uncertainties{};
  bool ztf_sampling{};
  ZtfTooExposure ztf_too{ZtfTooExposure::None};
  bool rubin_too{};
  RubinTooType rubin_too_type{RubinTooType::None};
  AugmentationConfig augmentation{};

  /**
   * @brief True if any survey cadence replaces the dense grid sampling.
   */
  [[nodiscard]] bool cadence_active() const {
    return ztf_sampling || ztf_too != ZtfTooExposure::None || rubin_too;
  }

  /**
   * @brief True if the stored series may differ from the plain evaluation grid.
   */
  [[nodiscard]] bool any_active() const {
    return cadence_active() || augmentation.enabled || !detection_limits.empty();
  }
};

/**
 * @brief Check option combinations.
 * @return `ConfigurationError` for ZTF ToO without ZTF sampling, Rubin ToO
 *         without a strategy type, a non-positive augmentation count or a
 *         negative photometric error.
 */
emsynth::core::Status validate_realism_config(const RealismConfig& config);

}  // namespace emsynth::realism
