/**
 * @file test_end_to_end.cpp
 * @brief Injection file to aggregated bands through the full pipeline.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "emsynth/analysis/aggregation.hpp"
#include "emsynth/injection/config_fingerprint.hpp"
#include "emsynth/injection/injection_cache.hpp"
#include "emsynth/injection/injection_table.hpp"
#include "emsynth/injection/synthesizer.hpp"
#include "emsynth/models/model_factory.hpp"
#include "emsynth/models/photometry.hpp"
#include "test_fixtures.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

struct RunSummary {
  emsynth::core::ResultCollection results{};
  int computed{};
  int loaded{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

RunSummary run_batch(const emsynth::models::ModelSpec& spec,
                     const emsynth::injection::SynthesisConfig& synthesis,
                     const emsynth::injection::InjectionTable& table,
                     const std::filesystem::path& outdir) {
  RunSummary out{};
  auto build = emsynth::models::build_light_curve_model(spec);
  if (build.status != emsynth::core::Status::Ok) {
    out.status = build.status;
    return out;
  }
  const emsynth::injection::LightCurveSynthesizer synthesizer(*build.model, synthesis);
  const emsynth::injection::InjectionCache cache(
      {.directory = outdir, .config_hash = emsynth::injection::config_fingerprint(spec, synthesis, 42)});
  for (const auto& row : table.rows) {
    auto entry = cache.get_or_compute(row.index, row.parameters, [&](const emsynth::core::ParameterSet& p) {
      auto rng = emsynth::injection::injection_generator(42, row.index);
      return synthesizer.synthesize(p, rng);
    });
    if (entry.status != emsynth::core::Status::Ok) {
      out.status = entry.status;
      return out;
    }
    if (entry.outcome == emsynth::injection::CacheOutcome::Loaded) {
      ++out.loaded;
    } else {
      ++out.computed;
    }
    out.results.emplace(row.index, std::move(entry.light_curve));
  }
  return out;
}

}  // namespace

int main() {
  using namespace emsynth;
  namespace fs = std::filesystem;

  const auto dir = testing::make_temp_dir("e2e");
  const auto outdir = dir / "out";
  fs::create_directories(outdir);
  if (!testing::write_svd_fixture(dir, "Bu2019lm", {"g", "r"})) {
    spdlog::error("failed to write surrogate fixture");
    return 100;
  }
  {
    std::ofstream out(dir / "injection.json");
    out << R"({"injections": {"__dataframe__": true, "content": {
      "geocent_time": [1187008882.43, 1187008882.43, 1187008882.43],
      "log10_mej": [-3.0, -3.0, -3.0],
      "vej": [0.05, 0.05, 0.05],
      "luminosity_distance": [40.0, 40.0, 40.0]}}})";
  }
  const auto table = injection::load_injection_table(dir / "injection.json");
  if (table.status != core::Status::Ok || table.rows.size() != 3U) {
    spdlog::error("injection table failed to load");
    return 1;
  }

  const models::ModelSpec spec{.name = "Bu2019lm", .svd_path = dir, .filters = {"g", "r"}};
  const auto grid = core::make_time_grid(0.0, 14.0, 1.0);
  const injection::SynthesisConfig synthesis{.grid = grid};

  const auto first = run_batch(spec, synthesis, table, outdir);
  if (first.status != core::Status::Ok || first.computed != 3 || first.loaded != 0) {
    spdlog::error("first batch failed: {}", core::status_to_string(first.status));
    return 2;
  }
  const auto second = run_batch(spec, synthesis, table, outdir);
  if (second.status != core::Status::Ok || second.computed != 0 || second.loaded != 3) {
    spdlog::error("resumed batch must load every artifact");
    return 3;
  }

  const double dm = models::distance_modulus(40.0);
  const auto summary = analysis::aggregate(second.results, "g", grid, synthesis.realism.any_active());
  if (summary.status != core::Status::Ok || summary.times.size() != 15U) {
    spdlog::error("aggregation failed");
    return 4;
  }
  for (std::size_t j = 0; j < summary.times.size(); ++j) {
    const double expected = -7.2 + 1.6 / 7.0 * summary.times[j] + dm;
    if (!approx(summary.p50[j], expected) || !approx(summary.p10[j], expected)) {
      spdlog::error("median band mismatch at t={}: {} vs {}", summary.times[j], summary.p50[j], expected);
      return 5;
    }
  }

  // Changing the window invalidates the artifacts.
  injection::SynthesisConfig shorter = synthesis;
  shorter.grid = core::make_time_grid(0.0, 7.0, 1.0);
  const auto third = run_batch(spec, shorter, table, outdir);
  if (third.status != core::Status::Ok || third.computed != 3 || third.results.at(0).at("g").size() != 8U) {
    spdlog::error("changed configuration must recompute every injection");
    return 6;
  }

  // Detection limit with resampled aggregation.
  injection::SynthesisConfig limited = synthesis;
  limited.realism.detection_limits = {{"g", 27.0}};
  const auto fourth = run_batch(spec, limited, table, outdir);
  if (fourth.status != core::Status::Ok) {
    spdlog::error("limited batch failed");
    return 7;
  }
  std::size_t limits = 0;
  for (const auto& p : fourth.results.at(1).at("g")) {
    if (p.is_upper_limit()) {
      ++limits;
      if (!approx(p.mag, 27.0, 0.0)) {
        spdlog::error("upper limit must carry the detection limit");
        return 8;
      }
    }
  }
  if (limits == 0U || limits == fourth.results.at(1).at("g").size()) {
    spdlog::error("expected a mix of detections and upper limits, got {}", limits);
    return 9;
  }
  const auto resampled = analysis::aggregate(fourth.results, "g", grid, limited.realism.any_active());
  if (resampled.status != core::Status::Ok || std::isnan(resampled.p50.back())) {
    spdlog::error("resampled aggregation must cover the full grid");
    return 10;
  }

  auto missing = table;
  missing.rows[2].parameters.erase("geocent_time");
  fs::create_directories(dir / "fresh");
  const auto failing = run_batch(spec, limited, missing, dir / "fresh");
  if (failing.status != core::Status::MissingField || fs::exists(dir / "fresh" / "2.dat")) {
    spdlog::error("missing trigger time must abort the batch");
    return 11;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
