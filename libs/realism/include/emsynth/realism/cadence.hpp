/**
 * @file cadence.hpp
 * @brief Survey cadence plans and resampling of dense light curves.
 * @author Watosn
 */
#pragma once

#include <random>
#include <string>
#include <vector>

#include "emsynth/core/types.hpp"
#include "emsynth/realism/realism_config.hpp"

namespace emsynth::realism {

/**
 * @brief One planned observation in days since the trigger.
 */
struct CadenceEpoch {
  double time{};
  std::string filter{};
};

/**
 * @brief ZTF public-survey cadence: g/r pairs every ~2 nights.
 *
 * The first night is offset uniformly within one cadence period, each visit
 * is jittered and weather losses drop visits at random.
 */
std::vector<CadenceEpoch> ztf_survey_epochs(double tmin, double tmax, std::mt19937_64& rng);

/**
 * @brief ZTF ToO visits during the first two nights for an exposure preset.
 */
std::vector<CadenceEpoch> ztf_too_epochs(ZtfTooExposure exposure);

/**
 * @brief Rubin ToO visits for a BNS or NSBH strategy preset.
 */
std::vector<CadenceEpoch> rubin_too_epochs(RubinTooType type);

/**
 * @brief Union of all cadence plans enabled in `config`, restricted to `[tmin, tmax]`.
 */
std::vector<CadenceEpoch> build_cadence_plan(const RealismConfig& config,
                                             double tmin,
                                             double tmax,
                                             std::mt19937_64& rng);

/**
 * @brief Keep only planned epochs, linearly interpolating the dense series.
 *
 * Filters without any planned epoch are dropped from the result.
 */
emsynth::core::LightCurve sample_on_cadence(const emsynth::core::FilterMagnitudes& dense,
                                            const std::vector<double>& grid_times,
                                            const std::vector<CadenceEpoch>& plan);

}  // namespace emsynth::realism
