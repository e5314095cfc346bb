/**
 * @file test_synthesizer.cpp
 * @brief Trigger-time resolution, derived fields and model invocation tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "emsynth/core/time_systems.hpp"
#include "emsynth/injection/synthesizer.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

/**
 * @brief Linear light curve that records the parameters of every call.
 */
class RecordingModel final : public emsynth::core::ILightCurveModel {
 public:
  explicit RecordingModel(emsynth::core::Status status = emsynth::core::Status::Ok) : status_(status) {}

  [[nodiscard]] std::string name() const override { return "recording"; }

  [[nodiscard]] emsynth::core::ModelEvaluation evaluate(const emsynth::core::ParameterSet& parameters,
                                                        const std::vector<double>& sample_times) const override {
    ++calls;
    last_parameters = parameters;
    if (status_ != emsynth::core::Status::Ok) {
      return emsynth::core::ModelEvaluation{.status = status_};
    }
    emsynth::core::ModelEvaluation out{};
    auto& g = out.magnitudes["g"];
    auto& r = out.magnitudes["r"];
    for (const double t : sample_times) {
      g.push_back(-16.0 + 0.5 * t);
      r.push_back(t > 1.0 ? std::numeric_limits<double>::quiet_NaN() : -15.0);
    }
    return out;
  }

  mutable int calls{0};
  mutable emsynth::core::ParameterSet last_parameters{};

 private:
  emsynth::core::Status status_{};
};

}  // namespace

int main() {
  using namespace emsynth;

  const injection::SynthesisConfig config{.grid = core::make_time_grid(0.0, 2.0, 0.5)};
  RecordingModel model;
  const injection::LightCurveSynthesizer synth(model, config);
  std::mt19937_64 rng(7);

  const core::ParameterSet no_trigger{{"luminosity_distance", 40.0}};
  const auto missing = synth.synthesize(no_trigger, rng);
  if (missing.status != core::Status::MissingField || model.calls != 0) {
    spdlog::error("missing trigger time must fail before evaluation");
    return 1;
  }

  const double gps = 1187008882.43;
  const core::ParameterSet row{{"geocent_time", gps}, {"luminosity_distance", 40.0}};
  const auto res = synth.synthesize(row, rng);
  if (res.status != core::Status::Ok || model.calls != 1) {
    spdlog::error("synthesis failed: {}", core::status_to_string(res.status));
    return 2;
  }
  const double expected_mjd = core::gps_to_mjd(gps, core::TimeScale::Tai);
  if (!approx(res.trigger_time_mjd, expected_mjd) ||
      !approx(model.last_parameters.at(injection::kTriggerTimeMjdKey), expected_mjd) ||
      !approx(model.last_parameters.at("luminosity_distance"), 40.0)) {
    spdlog::error("derived trigger time not merged");
    return 3;
  }
  if (row.count(injection::kTriggerTimeMjdKey) != 0U || row.size() != 2U) {
    spdlog::error("caller row must not be mutated");
    return 4;
  }

  const auto& g = res.light_curve.at("g");
  if (g.size() != 5U || !approx(g[4].time, 2.0) || !approx(g[4].mag, -15.0)) {
    spdlog::error("g series mismatch");
    return 5;
  }
  // Non-finite samples are dropped.
  if (res.light_curve.at("r").size() != 3U) {
    spdlog::error("non-finite magnitudes must be dropped");
    return 6;
  }

  // The primary key wins over the fallback.
  const core::ParameterSet both{{"geocent_time_x", 1.0e9}, {"geocent_time", gps}, {"luminosity_distance", 40.0}};
  const auto primary = synth.synthesize(both, rng);
  if (primary.status != core::Status::Ok || !approx(primary.trigger_time_mjd, core::gps_to_mjd(1.0e9))) {
    spdlog::error("geocent_time_x must take precedence");
    return 7;
  }

  auto absolute_config = config;
  absolute_config.absolute = true;
  absolute_config.time_scale = core::TimeScale::Utc;
  const injection::LightCurveSynthesizer absolute(model, absolute_config);
  const auto abs_res = absolute.synthesize(row, rng);
  if (abs_res.status != core::Status::Ok ||
      !approx(model.last_parameters.at("luminosity_distance"), core::time_constants::kAbsoluteMagnitudeDistanceMpc) ||
      !approx(abs_res.trigger_time_mjd, core::gps_to_mjd(gps, core::TimeScale::Utc))) {
    spdlog::error("absolute mode must place the source at 10 pc");
    return 8;
  }

  RecordingModel broken(core::Status::NumericalError);
  const injection::LightCurveSynthesizer failing(broken, config);
  if (failing.synthesize(row, rng).status != core::Status::ModelEvaluationError) {
    spdlog::error("model failure must surface as a model evaluation error");
    return 9;
  }

  // Per-injection generators depend only on the seed and the index.
  auto a = injection::injection_generator(42, 3);
  auto b = injection::injection_generator(42, 3);
  auto c = injection::injection_generator(42, 4);
  const auto va = a();
  if (va != b() || va == c()) {
    spdlog::error("injection generator must be a function of seed and index");
    return 10;
  }

  const injection::LightCurveSynthesizer bad_grid(model, injection::SynthesisConfig{.grid = core::make_time_grid(1.0, 0.0, 0.1)});
  if (bad_grid.synthesize(row, rng).status != core::Status::InvalidInput) {
    spdlog::error("invalid grid must be rejected");
    return 11;
  }

  return 0;
}
