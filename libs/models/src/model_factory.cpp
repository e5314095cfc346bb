/**
 * @file model_factory.cpp
 * @brief Model selection implementation.
 * @author Watosn
 */

#include "emsynth/models/model_factory.hpp"

#include <utility>

#include "emsynth/models/grb_afterglow_model.hpp"
#include "emsynth/models/joint_model.hpp"
#include "emsynth/models/supernova_model.hpp"
#include "emsynth/models/svd_model.hpp"

namespace emsynth::models {
namespace {

struct Component {
  std::unique_ptr<emsynth::core::ILightCurveModel> model{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

Component make_kilonova(const ModelSpec& spec) {
  SvdLightCurveModel::Config config{.model = spec.name,
                                    .svd_path = spec.svd_path,
                                    .mag_ncoeff = spec.mag_ncoeff,
                                    .lbol_ncoeff = spec.lbol_ncoeff,
                                    .filters = spec.filters};
  if (!parse_coefficient_interpolation(spec.interpolation_type, &config.interpolation)) {
    return Component{.status = emsynth::core::Status::ConfigurationError};
  }
  auto model = SvdLightCurveModel::Create(config);
  const auto status = model->load_status();
  return Component{.model = std::move(model), .status = status};
}

Component make_grb(const ModelSpec& spec) {
  auto model = GrbAfterglowModel::Create(
      GrbAfterglowModel::Config{.resolution = spec.grb_resolution, .jet_type = spec.jet_type, .filters = spec.filters});
  const auto status = model->load_status();
  return Component{.model = std::move(model), .status = status};
}

Component make_supernova(const ModelSpec& spec) {
  auto model = SupernovaTemplateModel::Create(SupernovaTemplateModel::Config{
      .template_name = spec.name, .template_dir = spec.template_dir, .filters = spec.filters});
  const auto status = model->load_status();
  return Component{.model = std::move(model), .status = status};
}

ModelBuild make_joint(Component transient, Component grb, const std::string& name, Composition composition) {
  if (transient.status != emsynth::core::Status::Ok) {
    return ModelBuild{.composition = composition, .status = transient.status};
  }
  if (grb.status != emsynth::core::Status::Ok) {
    return ModelBuild{.composition = composition, .status = grb.status};
  }
  auto joint = std::make_unique<JointLightCurveModel>(name + "+" + kGrbOnlyModelName);
  joint->add(std::move(transient.model));
  joint->add(std::move(grb.model));
  return ModelBuild{.model = std::move(joint), .composition = composition, .status = emsynth::core::Status::Ok};
}

ModelBuild make_single(Component c, Composition composition) {
  if (c.status != emsynth::core::Status::Ok) {
    return ModelBuild{.composition = composition, .status = c.status};
  }
  return ModelBuild{.model = std::move(c.model), .composition = composition, .status = emsynth::core::Status::Ok};
}

}  // namespace

const char* composition_to_string(Composition c) {
  switch (c) {
    case Composition::Kilonova:
      return "kilonova";
    case Composition::Grb:
      return "grb";
    case Composition::Supernova:
      return "supernova";
    case Composition::KilonovaGrb:
      return "kilonova+grb";
    case Composition::SupernovaGrb:
      return "supernova+grb";
    default:
      return "unknown";
  }
}

emsynth::core::Status resolve_composition(const std::string& name, ModelMode mode, Composition* out) {
  if (out == nullptr || name.empty()) {
    return emsynth::core::Status::ConfigurationError;
  }
  const bool grb_only = name == kGrbOnlyModelName;
  if (mode == ModelMode::Joint) {
    if (grb_only) {
      return emsynth::core::Status::ConfigurationError;
    }
    *out = is_supernova_template(name) ? Composition::SupernovaGrb : Composition::KilonovaGrb;
    return emsynth::core::Status::Ok;
  }
  if (grb_only) {
    *out = Composition::Grb;
  } else if (is_supernova_template(name)) {
    *out = Composition::Supernova;
  } else {
    *out = Composition::Kilonova;
  }
  return emsynth::core::Status::Ok;
}

ModelBuild build_light_curve_model(const ModelSpec& spec) {
  Composition composition{};
  const auto status = resolve_composition(spec.name, spec.mode, &composition);
  if (status != emsynth::core::Status::Ok) {
    return ModelBuild{.status = status};
  }

  switch (composition) {
    case Composition::KilonovaGrb:
      return make_joint(make_kilonova(spec), make_grb(spec), spec.name, composition);
    case Composition::SupernovaGrb:
      return make_joint(make_supernova(spec), make_grb(spec), spec.name, composition);
    case Composition::Grb:
      return make_single(make_grb(spec), composition);
    case Composition::Supernova:
      return make_single(make_supernova(spec), composition);
    case Composition::Kilonova:
      return make_single(make_kilonova(spec), composition);
    default:
      return ModelBuild{.status = emsynth::core::Status::ConfigurationError};
  }
}

}  // namespace emsynth::models
