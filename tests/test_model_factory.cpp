/**
 * @file test_model_factory.cpp
 * @brief Model selection, composition and surrogate reconstruction tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "emsynth/models/joint_model.hpp"
#include "emsynth/models/model_factory.hpp"
#include "emsynth/models/photometry.hpp"
#include "emsynth/models/svd_model.hpp"
#include "test_fixtures.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace emsynth;
  namespace fs = std::filesystem;

  const auto dir = testing::make_temp_dir("factory");
  const std::vector<std::string> filters{"g", "r"};
  if (!testing::write_svd_fixture(dir, "Bu2019lm", filters) || !testing::write_supernova_fixture(dir, "nugent-hyper") ||
      !testing::write_supernova_fixture(dir, "salt2")) {
    spdlog::error("failed to write fixtures");
    return 100;
  }

  const auto spec_for = [&](const std::string& name, models::ModelMode mode) {
    return models::ModelSpec{.name = name, .mode = mode, .svd_path = dir, .template_dir = dir, .filters = filters};
  };

  struct Case {
    std::string name;
    models::ModelMode mode;
    models::Composition expected;
    std::size_t components;
  };
  const std::vector<Case> cases{
      {"Bu2019lm", models::ModelMode::Single, models::Composition::Kilonova, 0U},
      {"TrPi2018", models::ModelMode::Single, models::Composition::Grb, 0U},
      {"nugent-hyper", models::ModelMode::Single, models::Composition::Supernova, 0U},
      {"salt2", models::ModelMode::Single, models::Composition::Supernova, 0U},
      {"Bu2019lm", models::ModelMode::Joint, models::Composition::KilonovaGrb, 2U},
      {"nugent-hyper", models::ModelMode::Joint, models::Composition::SupernovaGrb, 2U},
      {"salt2", models::ModelMode::Joint, models::Composition::SupernovaGrb, 2U},
  };
  int code = 1;
  for (const auto& c : cases) {
    const auto build = models::build_light_curve_model(spec_for(c.name, c.mode));
    if (build.status != core::Status::Ok || !build.model || build.composition != c.expected) {
      spdlog::error("{} ({}) built {} with {}", c.name, c.mode == models::ModelMode::Joint ? "joint" : "single",
                    models::composition_to_string(build.composition), core::status_to_string(build.status));
      return code;
    }
    const auto* joint = dynamic_cast<const models::JointLightCurveModel*>(build.model.get());
    if ((c.components == 0U) != (joint == nullptr) || (joint != nullptr && joint->size() != c.components)) {
      spdlog::error("{} has the wrong component structure", c.name);
      return code + 10;
    }
    if (joint != nullptr && joint->component(1).name() != models::kGrbOnlyModelName) {
      spdlog::error("joint model must pair with the afterglow");
      return code + 20;
    }
    ++code;
  }

  const auto forbidden = models::build_light_curve_model(spec_for("TrPi2018", models::ModelMode::Joint));
  if (forbidden.status != core::Status::ConfigurationError || forbidden.model) {
    spdlog::error("GRB-only model in joint mode must be a configuration error");
    return 40;
  }
  const auto empty = models::build_light_curve_model(spec_for("", models::ModelMode::Single));
  if (empty.status != core::Status::ConfigurationError) {
    spdlog::error("empty model name must be a configuration error");
    return 41;
  }
  const auto missing = models::build_light_curve_model(spec_for("NoSuchSurrogate", models::ModelMode::Single));
  if (missing.status != core::Status::DataUnavailable) {
    spdlog::error("missing surrogate file must be reported, got {}", core::status_to_string(missing.status));
    return 42;
  }
  auto bad_interp = spec_for("Bu2019lm", models::ModelMode::Single);
  bad_interp.interpolation_type = "tensorflow";
  if (models::build_light_curve_model(bad_interp).status != core::Status::ConfigurationError) {
    spdlog::error("unsupported interpolation scheme must be rejected");
    return 43;
  }

  // Surrogate reconstruction at the first training point (normalized origin).
  const core::ParameterSet params{{"log10_mej", -3.0}, {"vej", 0.05}, {"luminosity_distance", 40.0}};
  const double dm = models::distance_modulus(40.0);
  for (const auto scheme : {models::CoefficientInterpolation::GaussianProcess, models::CoefficientInterpolation::Nearest}) {
    const auto svd = models::SvdLightCurveModel::Create(
        {.model = "Bu2019lm", .svd_path = dir, .interpolation = scheme, .filters = filters});
    if (svd->load_status() != core::Status::Ok) {
      spdlog::error("surrogate load failed: {}", core::status_to_string(svd->load_status()));
      return 50;
    }
    const auto eval = svd->evaluate(params, {0.0, 3.5, 14.0, 21.0});
    if (eval.status != core::Status::Ok || eval.magnitudes.size() != 2U) {
      spdlog::error("surrogate evaluation failed");
      return 51;
    }
    const auto& g = eval.magnitudes.at("g");
    if (!approx(g[0], -7.2 + dm) || !approx(g[1], -6.4 + dm) || !approx(g[2], -4.0 + dm) ||
        !approx(g[3], -2.4 + dm)) {
      spdlog::error("surrogate reconstruction mismatch: {} {} {} {}", g[0], g[1], g[2], g[3]);
      return 52;
    }
    if (eval.lbol_erg_s.size() != 4U || !approx(std::log10(eval.lbol_erg_s[0]), 42.0)) {
      spdlog::error("bolometric reconstruction mismatch");
      return 53;
    }
  }

  const auto svd = models::SvdLightCurveModel::Create({.model = "Bu2019lm", .svd_path = dir, .filters = filters});
  if (svd->evaluate({{"log10_mej", -3.0}, {"vej", 0.05}}, {1.0}).status != core::Status::InvalidInput) {
    spdlog::error("missing luminosity distance must be rejected");
    return 54;
  }

  // GRB afterglow: finite on axis, no emission for unresolved wings.
  const auto grb = models::build_light_curve_model(spec_for("TrPi2018", models::ModelMode::Single));
  core::ParameterSet grb_params{{"inclination_EM", 0.0},     {"log10_E0", 52.0},        {"thetaCore", 0.1},
                                {"log10_n0", -2.0},          {"p", 2.2},                {"log10_epsilon_e", -1.0},
                                {"log10_epsilon_B", -2.0},   {"luminosity_distance", 40.0}};
  const auto on_axis = grb.model->evaluate(grb_params, {0.5, 1.0, 5.0});
  if (on_axis.status != core::Status::Ok || !std::isfinite(on_axis.magnitudes.at("g")[0]) ||
      !(on_axis.magnitudes.at("g")[2] > on_axis.magnitudes.at("g")[0])) {
    spdlog::error("on-axis afterglow must be finite and fading");
    return 60;
  }
  grb_params["thetaWing"] = 0.6;
  const auto unresolved = grb.model->evaluate(grb_params, {0.5, 1.0});
  if (unresolved.status != core::Status::Ok || !std::isinf(unresolved.magnitudes.at("r")[1])) {
    spdlog::error("wing beyond resolution must give no emission");
    return 61;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
