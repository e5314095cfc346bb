/**
 * @file joint_model.hpp
 * @brief Additive composition of light-curve models.
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
 * @brief Sums the fluxes of several models filter by filter.
 *
 * A filter missing from one component contributes zero flux from it.
 * Bolometric luminosities are summed over the components that report one.
 */
class JointLightCurveModel final : public emsynth::core::ILightCurveModel {
 public:
  explicit JointLightCurveModel(std::string name) : name_(std::move(name)) {}

  /**
   * @brief Add one component to the composition.
   */
  void add(std::unique_ptr<emsynth::core::ILightCurveModel> model);

  [[nodiscard]] std::string name() const override { return name_; }

  /**
   * @brief Evaluate all components and combine them.
   * @return First non-Ok component status, else the combined magnitudes.
   */
  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& parameters,
                                                        const std::vector<double>& sample_times) const override;

  [[nodiscard]] std::size_t size() const { return models_.size(); }

  [[nodiscard]] const emsynth::core::ILightCurveModel& component(std::size_t i) const { return *models_.at(i); }

 private:
  std::string name_{};
  std::vector<std::unique_ptr<emsynth::core::ILightCurveModel>> models_{};
};

}  // namespace emsynth::models
