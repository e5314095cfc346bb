/**
 * @file model_factory.hpp
 * @brief Model selection from a model name and single/joint mode.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "emsynth/core/interfaces.hpp"

namespace emsynth::models {

/**
 * @brief GRB-afterglow-only model identifier.
 */
inline constexpr const char* kGrbOnlyModelName = "TrPi2018";

/**
 * @brief Single transient model or transient plus GRB afterglow.
 */
enum class ModelMode : std::uint8_t { Single, Joint };

/**
 * @brief Model composition derived from name and mode.
 */
enum class Composition : std::uint8_t { Kilonova, Grb, Supernova, KilonovaGrb, SupernovaGrb };

const char* composition_to_string(Composition c);

/**
 * @brief Everything needed to select and construct a light-curve model.
 *
 * `svd_path`, coefficient counts and `interpolation_type` configure the
 * kilonova surrogate (alone or nested in a joint model); `template_dir`
 * locates supernova templates; `grb_resolution` and `jet_type` configure the
 * afterglow component.
 */
struct ModelSpec {
  std::string name{};
  ModelMode mode{ModelMode::Single};
  std::filesystem::path svd_path{};
  std::filesystem::path template_dir{};
  int mag_ncoeff{10};
  int lbol_ncoeff{10};
  std::string interpolation_type{"sklearn_gp"};
  double grb_resolution{5.0};
  int jet_type{0};
  std::vector<std::string> filters{};
};

/**
 * @brief Apply the selection rule without loading any model resources.
 * @return `ConfigurationError` for an empty name or the GRB-only model in joint mode.
 */
emsynth::core::Status resolve_composition(const std::string& name, ModelMode mode, Composition* out);

/**
 * @brief Constructed model with the composition it realizes.
 */
struct ModelBuild {
  std::unique_ptr<emsynth::core::ILightCurveModel> model{};
  Composition composition{Composition::Kilonova};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief Build the model selected by `spec`.
 *
 * Joint mode: supernova templates pair with the afterglow, any other
 * transient name is treated as a kilonova surrogate paired with the
 * afterglow. Single mode: the GRB-only name builds the bare afterglow,
 * supernova templates build the template model, everything else the SVD
 * surrogate.
 * @return `model` is null unless `status` is `Ok`.
 */
ModelBuild build_light_curve_model(const ModelSpec& spec);

}  // namespace emsynth::models
