/**
 * @file realism_config.cpp
 * @brief Realism option validation.
 * @author Watosn
 */

#include "emsynth/realism/realism_config.hpp"

#include <cmath>

namespace emsynth::realism {

emsynth::core::Status validate_realism_config(const RealismConfig& config) {
  if (config.ztf_too != ZtfTooExposure::None && !config.ztf_sampling) {
    return emsynth::core::Status::ConfigurationError;
  }
  if (config.rubin_too && config.rubin_too_type == RubinTooType::None) {
    return emsynth::core::Status::ConfigurationError;
  }
  if (!(config.photometric_error >= 0.0) || !std::isfinite(config.photometric_error)) {
    return emsynth::core::Status::ConfigurationError;
  }
  if (config.augmentation.enabled && config.augmentation.times.empty() && config.augmentation.n_points <= 0) {
    return emsynth::core::Status::ConfigurationError;
  }
  for (const auto& [filter, limit] : config.detection_limits) {
    if (std::isnan(limit)) {
      return emsynth::core::Status::ConfigurationError;
    }
  }
  return emsynth::core::Status::Ok;
}

}  // namespace emsynth::realism
