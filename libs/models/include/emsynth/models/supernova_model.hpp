/**
 * @file supernova_model.hpp
 * @brief Supernova template light-curve model.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "emsynth/core/interfaces.hpp"

namespace emsynth::models {

/**
 * @brief True for the supernova template identifiers (`nugent-hyper`, `salt2`).
 */
bool is_supernova_template(const std::string& name);

/**
 * @brief Supernova model built from a tabulated absolute-magnitude template.
 *
 * `<template_dir>/<template>.csv` has a `phase` column in days since the
 * trigger followed by one absolute AB magnitude column per filter. The
 * template is stretched in time by `supernova_mag_stretch`, shifted by
 * `supernova_mag_boost` and by the distance modulus of `luminosity_distance`.
 * Outside the tabulated phase range no emission is reported (`+inf`).
 */
class SupernovaTemplateModel final : public emsynth::core::ILightCurveModel {
 public:
  /**
   * @brief Template model configuration.
   */
  struct Config {
    std::string template_name{};
    std::filesystem::path template_dir{};
    std::vector<std::string> filters{};
  };

  /**
   * @brief Factory helper that reads the template table.
   */
  static std::unique_ptr<SupernovaTemplateModel> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return config_.template_name; }

  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& parameters,
                                                        const std::vector<double>& sample_times) const override;

  [[nodiscard]] emsynth::core::Status load_status() const { return load_status_; }

 private:
  explicit SupernovaTemplateModel(Config config) : config_(std::move(config)) {}

  Config config_{};
  std::vector<double> phases_{};
  std::map<std::string, std::vector<double>> abs_mags_{};
  emsynth::core::Status load_status_{emsynth::core::Status::DataUnavailable};
};

}  // namespace emsynth::models
