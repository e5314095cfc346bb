/**
 * @file test_joint_model.cpp
 * @brief Additive composition of light-curve models.
 * @author Watosn
 */

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "emsynth/models/joint_model.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

class ConstantModel final : public emsynth::core::ILightCurveModel {
 public:
  ConstantModel(std::string filter, double mag, emsynth::core::Status status = emsynth::core::Status::Ok)
      : filter_(std::move(filter)), mag_(mag), status_(status) {}

  [[nodiscard]] std::string name() const override { return "constant_" + filter_; }

  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& /*parameters*/,
                                                        const std::vector<double>& sample_times) const override {
    if (status_ != emsynth::core::Status::Ok) {
      return emsynth::core::ModelEvaluation{.status = status_};
    }
    return emsynth::core::ModelEvaluation{
        .magnitudes = {{filter_, std::vector<double>(sample_times.size(), mag_)}},
        .lbol_erg_s = std::vector<double>(sample_times.size(), 1.0e40),
        .status = emsynth::core::Status::Ok};
  }

 private:
  std::string filter_{};
  double mag_{};
  emsynth::core::Status status_{};
};

}  // namespace

int main() {
  using namespace emsynth;
  constexpr double kInf = std::numeric_limits<double>::infinity();

  models::JointLightCurveModel joint("sum");
  joint.add(std::make_unique<ConstantModel>("g", 20.0));
  joint.add(std::make_unique<ConstantModel>("g", 20.0));
  joint.add(std::make_unique<ConstantModel>("r", kInf));

  const auto eval = joint.evaluate({}, {0.0, 1.0});
  if (eval.status != core::Status::Ok || eval.magnitudes.size() != 2U) {
    spdlog::error("joint evaluation failed");
    return 1;
  }
  // Two equal sources are 2.5 log10(2) brighter than one.
  if (!approx(eval.magnitudes.at("g")[0], 20.0 - 2.5 * std::log10(2.0), 1e-10)) {
    spdlog::error("flux addition mismatch: {}", eval.magnitudes.at("g")[0]);
    return 2;
  }
  if (!std::isinf(eval.magnitudes.at("r")[1])) {
    spdlog::error("zero total flux must map to infinite magnitude");
    return 3;
  }
  if (eval.lbol_erg_s.size() != 2U || !approx(eval.lbol_erg_s[0], 3.0e40, 1.0e28)) {
    spdlog::error("bolometric luminosities must add");
    return 4;
  }

  models::JointLightCurveModel failing("failing");
  failing.add(std::make_unique<ConstantModel>("g", 20.0));
  failing.add(std::make_unique<ConstantModel>("g", 20.0, core::Status::NumericalError));
  if (failing.evaluate({}, {0.0}).status != core::Status::NumericalError) {
    spdlog::error("component failure must propagate");
    return 5;
  }

  if (models::JointLightCurveModel("empty").evaluate({}, {0.0}).status != core::Status::InvalidInput) {
    spdlog::error("empty composition must be rejected");
    return 6;
  }

  return 0;
}
