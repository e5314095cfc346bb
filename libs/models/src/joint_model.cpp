/**
 * @file joint_model.cpp
 * @brief Additive light-curve composition implementation.
 * @author Watosn
 */

#include "emsynth/models/joint_model.hpp"

#include <map>

#include "emsynth/models/photometry.hpp"

namespace emsynth::models {

void JointLightCurveModel::add(std::unique_ptr<emsynth::core::ILightCurveModel> model) {
  if (!model) {
    return;
  }
  models_.push_back(std::move(model));
}

emsynth::core::ModelEvaluation JointLightCurveModel::evaluate(const emsynth::core::ParameterSet& parameters,
                                                              const std::vector<double>& sample_times) const {
  if (models_.empty()) {
    return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::InvalidInput};
  }

  const std::size_t n = sample_times.size();
  std::map<std::string, std::vector<double>> flux{};
  std::vector<double> lbol{};
  for (const auto& model : models_) {
    const auto part = model->evaluate(parameters, sample_times);
    if (part.status != emsynth::core::Status::Ok) {
      return emsynth::core::ModelEvaluation{.status = part.status};
    }
    for (const auto& [filter, mags] : part.magnitudes) {
      if (mags.size() != n) {
        return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::NumericalError};
      }
      auto& acc = flux.try_emplace(filter, n, 0.0).first->second;
      for (std::size_t i = 0; i < n; ++i) {
        acc[i] += flux_from_mag(mags[i]);
      }
    }
    if (part.lbol_erg_s.size() == n) {
      lbol.resize(n, 0.0);
      for (std::size_t i = 0; i < n; ++i) {
        lbol[i] += part.lbol_erg_s[i];
      }
    }
  }

  emsynth::core::ModelEvaluation out{};
  for (auto& [filter, f] : flux) {
    std::vector<double> mags;
    mags.reserve(n);
    for (const double v : f) {
      mags.push_back(mag_from_flux(v));
    }
    out.magnitudes.emplace(filter, std::move(mags));
  }
  out.lbol_erg_s = std::move(lbol);
  out.status = emsynth::core::Status::Ok;
  return out;
}

}  // namespace emsynth::models
