/**
 * @file interfaces.hpp
 * @brief Light-curve model interface consumed by the synthesis pipeline.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "emsynth/core/types.hpp"

namespace emsynth::core {

/**
 * @brief Output of one model evaluation.
 *
 * Each magnitude vector has the length of the requested sample times.
 * `lbol_erg_s` is empty for models without a bolometric prediction.
 */
struct ModelEvaluation {
  FilterMagnitudes magnitudes{};
  std::vector<double> lbol_erg_s{};
  Status status{Status::Ok};
};

/**
 * @brief Interface for transient emission models.
 */
class ILightCurveModel {
 public:
  virtual ~ILightCurveModel() = default;
  /**
   * @brief Model identifier used in logs and output names.
   */
  [[nodiscard]] virtual std::string name() const = 0;
  /**
   * @brief Evaluate apparent AB magnitudes at the given times.
   * @param parameters Injection parameters, including derived fields.
   * @param sample_times Days relative to the trigger.
   * @return Per-filter magnitudes with `status` set.
   */
  [[nodiscard]] virtual ModelEvaluation evaluate(const ParameterSet& parameters,
                                                 const std::vector<double>& sample_times) const = 0;
};

}  // namespace emsynth::core
