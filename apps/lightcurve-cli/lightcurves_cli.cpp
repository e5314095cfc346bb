/**
 * @file lightcurves_cli.cpp
 * @brief Batch light-curve synthesis over an injection table.
 * @author Watosn
 */

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "emsynth/analysis/aggregation.hpp"
#include "emsynth/core/text_parse.hpp"
#include "emsynth/core/time_grid.hpp"
#include "emsynth/core/time_systems.hpp"
#include "emsynth/injection/artifact.hpp"
#include "emsynth/injection/config_fingerprint.hpp"
#include "emsynth/injection/injection_cache.hpp"
#include "emsynth/injection/injection_table.hpp"
#include "emsynth/injection/synthesizer.hpp"
#include "emsynth/models/model_factory.hpp"
#include "emsynth/realism/realism_config.hpp"

namespace {

constexpr const char* kDefaultFilters = "u,g,r,i,z,y,J,H,K";

struct CliOptions {
  emsynth::models::ModelSpec model{};
  std::filesystem::path outdir{};
  std::string label{};
  std::filesystem::path injection_file{};
  double tmin{0.0};
  double tmax{14.0};
  double dt{0.1};
  std::uint64_t generation_seed{42};
  bool absolute{};
  emsynth::core::TimeScale time_scale{emsynth::core::TimeScale::Tai};
  emsynth::realism::RealismConfig realism{};
  bool trust_stale_cache{};
  int worker_index{0};
  int worker_count{1};
  bool plot{};
  bool verbose{};
};

bool parse_double_list(const std::string& text, std::vector<double>& out) {
  out.clear();
  for (const auto& item : emsynth::core::split_list(text)) {
    double v = 0.0;
    if (!emsynth::core::parse_double(item, v)) {
      return false;
    }
    out.push_back(v);
  }
  return true;
}

void print_usage() {
  spdlog::error(
      "usage: emsynth_lightcurves --model <name> --outdir <dir> --label <label> --injection <file> "
      "[--svd-path <dir>] [--template-dir <dir>] [--tmin 0] [--tmax 14] [--dt 0.1] [--svd-mag-ncoeff 10] "
      "[--svd-lbol-ncoeff 10] [--filters {}] [--grb-resolution 5] [--jet-type 0] [--generation-seed 42] "
      "[--joint-light-curve] [--injection-detection-limit <list>] [--interpolation-type sklearn_gp] [--absolute] "
      "[--ztf-sampling] [--ztf-uncertainties] [--ztf-ToO 180|300] [--rubin-ToO] [--rubin-ToO-type BNS|NSBH] [--photometric-error 0] "
      "[--photometry-augmentation] [--photometry-augmentation-seed 0] [--photometry-augmentation-N-points 10] "
      "[--photometry-augmentation-filters <list>] [--photometry-augmentation-times <list>] "
      "[--trigger-time-scale tai|utc] [--trust-stale-cache] [--worker-index 0] [--worker-count 1] [--plot] "
      "[--verbose]",
      kDefaultFilters);
}

bool parse_args(int argc, char** argv, CliOptions& opt) {
  std::string filters = kDefaultFilters;
  std::string detection_limits{};
  for (int i = 1; i < argc; ++i) {
    const std::string key = argv[i];
    const auto next = [&](std::string& value) {
      if (i + 1 >= argc) {
        spdlog::error("missing value for {}", key);
        return false;
      }
      value = argv[++i];
      return true;
    };
    std::string v;
    bool ok = true;
    if (key == "--joint-light-curve") {
      opt.model.mode = emsynth::models::ModelMode::Joint;
    } else if (key == "--absolute") {
      opt.absolute = true;
    } else if (key == "--ztf-uncertainties") {
      opt.realism.ztf_uncertainties = true;
    } else if (key == "--ztf-sampling") {
      opt.realism.ztf_sampling = true;
    } else if (key == "--rubin-ToO") {
      opt.realism.rubin_too = true;
    } else if (key == "--photometry-augmentation") {
      opt.realism.augmentation.enabled = true;
    } else if (key == "--trust-stale-cache") {
      opt.trust_stale_cache = true;
    } else if (key == "--plot") {
      opt.plot = true;
    } else if (key == "--verbose") {
      opt.verbose = true;
    } else if (!next(v)) {
      return false;
    } else if (key == "--model") {
      opt.model.name = v;
    } else if (key == "--svd-path") {
      opt.model.svd_path = v;
    } else if (key == "--template-dir") {
      opt.model.template_dir = v;
    } else if (key == "--outdir") {
      opt.outdir = v;
    } else if (key == "--label") {
      opt.label = v;
    } else if (key == "--injection") {
      opt.injection_file = v;
    } else if (key == "--tmin") {
      ok = emsynth::core::parse_double(v, opt.tmin);
    } else if (key == "--tmax") {
      ok = emsynth::core::parse_double(v, opt.tmax);
    } else if (key == "--dt") {
      ok = emsynth::core::parse_double(v, opt.dt);
    } else if (key == "--svd-mag-ncoeff") {
      ok = emsynth::core::parse_int(v, opt.model.mag_ncoeff);
    } else if (key == "--svd-lbol-ncoeff") {
      ok = emsynth::core::parse_int(v, opt.model.lbol_ncoeff);
    } else if (key == "--filters") {
      filters = v;
    } else if (key == "--grb-resolution") {
      ok = emsynth::core::parse_double(v, opt.model.grb_resolution);
    } else if (key == "--jet-type") {
      ok = emsynth::core::parse_int(v, opt.model.jet_type);
    } else if (key == "--generation-seed") {
      ok = emsynth::core::parse_uint64(v, opt.generation_seed);
    } else if (key == "--injection-detection-limit") {
      detection_limits = v;
    } else if (key == "--interpolation-type") {
      opt.model.interpolation_type = v;
    } else if (key == "--ztf-ToO") {
      if (v == "180") {
        opt.realism.ztf_too = emsynth::realism::ZtfTooExposure::Exposure180s;
      } else if (v == "300") {
        opt.realism.ztf_too = emsynth::realism::ZtfTooExposure::Exposure300s;
      } else {
        ok = false;
      }
    } else if (key == "--rubin-ToO-type") {
      if (v == "BNS") {
        opt.realism.rubin_too_type = emsynth::realism::RubinTooType::Bns;
      } else if (v == "NSBH") {
        opt.realism.rubin_too_type = emsynth::realism::RubinTooType::Nsbh;
      } else {
        ok = false;
      }
    } else if (key == "--photometric-error") {
      ok = emsynth::core::parse_double(v, opt.realism.photometric_error);
    } else if (key == "--photometry-augmentation-seed") {
      ok = emsynth::core::parse_uint64(v, opt.realism.augmentation.seed);
    } else if (key == "--photometry-augmentation-N-points") {
      ok = emsynth::core::parse_int(v, opt.realism.augmentation.n_points);
    } else if (key == "--photometry-augmentation-filters") {
      opt.realism.augmentation.filters = emsynth::core::split_list(v);
    } else if (key == "--photometry-augmentation-times") {
      ok = parse_double_list(v, opt.realism.augmentation.times);
    } else if (key == "--trigger-time-scale") {
      if (v == "tai") {
        opt.time_scale = emsynth::core::TimeScale::Tai;
      } else if (v == "utc") {
        opt.time_scale = emsynth::core::TimeScale::Utc;
      } else {
        ok = false;
      }
    } else if (key == "--worker-index") {
      ok = emsynth::core::parse_int(v, opt.worker_index);
    } else if (key == "--worker-count") {
      ok = emsynth::core::parse_int(v, opt.worker_count);
    } else {
      spdlog::error("unknown option: {}", key);
      return false;
    }
    if (!ok) {
      spdlog::error("invalid value for {}: {}", key, v);
      return false;
    }
  }

  opt.model.filters = emsynth::core::split_list(filters);
  for (const auto& filter : opt.model.filters) {
    if (emsynth::injection::is_reserved_filter_name(filter)) {
      spdlog::error("filter name '{}' is reserved", filter);
      return false;
    }
  }
  if (!detection_limits.empty()) {
    std::vector<double> limits;
    if (!parse_double_list(detection_limits, limits) || limits.size() != opt.model.filters.size()) {
      spdlog::error("--injection-detection-limit must list one value per filter");
      return false;
    }
    for (std::size_t k = 0; k < limits.size(); ++k) {
      if (std::isfinite(limits[k])) {
        opt.realism.detection_limits[opt.model.filters[k]] = limits[k];
      }
    }
  }

  if (opt.model.name.empty() || opt.outdir.empty() || opt.label.empty() || opt.injection_file.empty()) {
    spdlog::error("--model, --outdir, --label and --injection are required");
    return false;
  }
  if (opt.worker_count < 1 || opt.worker_index < 0 || opt.worker_index >= opt.worker_count) {
    spdlog::error("require 0 <= --worker-index < --worker-count");
    return false;
  }
  return true;
}

void setup_logging(const CliOptions& opt) {
  const auto log_path = opt.outdir / (opt.label + ".log");
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  try {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), false));
  } catch (const spdlog::spdlog_ex& e) {
    spdlog::warn("file logging disabled ({}): {}", log_path.string(), e.what());
  }
  auto logger = std::make_shared<spdlog::logger>("emsynth", sinks.begin(), sinks.end());
  logger->set_level(opt.verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(logger);
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opt{};
  if (!parse_args(argc, argv, opt)) {
    print_usage();
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(opt.outdir, ec);
  if (ec) {
    spdlog::error("failed to create output directory {}: {}", opt.outdir.string(), ec.message());
    return 2;
  }
  setup_logging(opt);

  const auto realism_status = emsynth::realism::validate_realism_config(opt.realism);
  if (realism_status != emsynth::core::Status::Ok) {
    spdlog::error("invalid observational realism options: {}", emsynth::core::status_to_string(realism_status));
    return 1;
  }

  const auto grid = emsynth::core::make_time_grid(opt.tmin, opt.tmax, opt.dt);
  if (grid.status != emsynth::core::Status::Ok) {
    spdlog::error("invalid time window tmin={} tmax={} dt={}", opt.tmin, opt.tmax, opt.dt);
    return 1;
  }

  auto build = emsynth::models::build_light_curve_model(opt.model);
  if (build.status != emsynth::core::Status::Ok) {
    spdlog::error("failed to build model '{}': {}", opt.model.name, emsynth::core::status_to_string(build.status));
    return 3;
  }
  spdlog::info("model {} ({})", build.model->name(), emsynth::models::composition_to_string(build.composition));

  const auto table = emsynth::injection::load_injection_table(opt.injection_file);
  if (table.status != emsynth::core::Status::Ok) {
    spdlog::error("failed to load injection file {}: {}", opt.injection_file.string(),
                  emsynth::core::status_to_string(table.status));
    return 4;
  }
  spdlog::info("{} injections, {} grid points", table.rows.size(), grid.times.size());

  const emsynth::injection::SynthesisConfig synthesis{
      .grid = grid,
      .absolute = opt.absolute,
      .time_scale = opt.time_scale,
      .realism = opt.realism,
  };
  const emsynth::injection::LightCurveSynthesizer synthesizer(*build.model, synthesis);
  const std::uint64_t config_hash =
      emsynth::injection::config_fingerprint(opt.model, synthesis, opt.generation_seed);
  spdlog::debug("generation config hash {:016x}", config_hash);

  const emsynth::injection::InjectionCache cache(emsynth::injection::InjectionCache::Config{
      .directory = opt.outdir,
      .config_hash = config_hash,
      .validate_config_hash = !opt.trust_stale_cache,
  });

  emsynth::core::ResultCollection results{};
  for (const auto& row : table.rows) {
    if (row.index % opt.worker_count != opt.worker_index) {
      continue;
    }
    const auto synthesize = [&](const emsynth::core::ParameterSet& parameters) {
      auto rng = emsynth::injection::injection_generator(opt.generation_seed, row.index);
      return synthesizer.synthesize(parameters, rng);
    };
    auto entry = cache.get_or_compute(row.index, row.parameters, synthesize);
    if (entry.status != emsynth::core::Status::Ok) {
      spdlog::error("injection {} failed: {}", row.index, emsynth::core::status_to_string(entry.status));
      return 5;
    }
    if (entry.outcome == emsynth::injection::CacheOutcome::RecomputedCorrupt ||
        entry.outcome == emsynth::injection::CacheOutcome::RecomputedStale) {
      spdlog::warn("injection {}: {}", row.index, emsynth::injection::cache_outcome_to_string(entry.outcome));
    } else {
      spdlog::debug("injection {}: {}", row.index, emsynth::injection::cache_outcome_to_string(entry.outcome));
    }
    results.emplace(row.index, std::move(entry.light_curve));
  }
  spdlog::info("{} light curves ready in {}", results.size(), opt.outdir.string());

  if (!opt.plot) {
    return 0;
  }

  std::set<std::string> filters(opt.model.filters.begin(), opt.model.filters.end());
  for (const auto& [index, light_curve] : results) {
    for (const auto& [filter, series] : light_curve) {
      filters.insert(filter);
    }
  }
  const bool resample = opt.realism.any_active();
  for (const auto& filter : filters) {
    const auto summary = emsynth::analysis::aggregate(results, filter, grid, resample);
    if (summary.status == emsynth::core::Status::DataUnavailable) {
      spdlog::warn("no light curves to aggregate for filter {}", filter);
      continue;
    }
    const auto csv_path = opt.outdir / fmt::format("{}_{}_aggregate.csv", opt.label, filter);
    const auto status = emsynth::analysis::write_aggregation_csv(summary, csv_path);
    if (status != emsynth::core::Status::Ok) {
      spdlog::error("failed to write {}: {}", csv_path.string(), emsynth::core::status_to_string(status));
      return 6;
    }
    spdlog::info("wrote {}", csv_path.string());
  }
  return 0;
}
