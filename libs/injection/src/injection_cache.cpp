/**
 * @file injection_cache.cpp
 * @brief Resumable per-injection artifact cache.
 * @author Watosn
 */

#include "emsynth/injection/injection_cache.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace emsynth::injection {

const char* cache_outcome_to_string(const CacheOutcome outcome) {
  switch (outcome) {
    case CacheOutcome::Loaded:
      return "loaded";
    case CacheOutcome::Computed:
      return "computed";
    case CacheOutcome::RecomputedCorrupt:
      return "recomputed_corrupt";
    case CacheOutcome::RecomputedStale:
      return "recomputed_stale";
    default:
      return "unknown";
  }
}

InjectionCache::InjectionCache(Config config) : config_(std::move(config)) {}

std::filesystem::path InjectionCache::artifact_path(const emsynth::core::InjectionIndex index) const {
  return config_.directory / (std::to_string(index) + config_.extension);
}

ArtifactReadResult InjectionCache::load(const emsynth::core::InjectionIndex index) const {
  const auto path = artifact_path(index);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return ArtifactReadResult{.status = emsynth::core::Status::DataUnavailable};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ArtifactReadResult{.status = emsynth::core::Status::CacheIoError};
  }
  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  return parse_artifact(text);
}

emsynth::core::Status InjectionCache::store(const emsynth::core::InjectionIndex index,
                                            const emsynth::core::LightCurveResult& result) const {
  for (const auto& [filter, series] : result.light_curve) {
    if (is_reserved_filter_name(filter)) {
      return emsynth::core::Status::InvalidInput;
    }
  }
  const ArtifactMeta meta{
      .index = index,
      .config_hash = config_.config_hash,
      .trigger_time_mjd = result.trigger_time_mjd,
  };
  return write_file_atomic(artifact_path(index), serialize_artifact(result.light_curve, meta));
}

CacheEntry InjectionCache::get_or_compute(const emsynth::core::InjectionIndex index,
                                          const emsynth::core::ParameterSet& parameters,
                                          const SynthesizeFn& synthesize) const {
  CacheOutcome outcome = CacheOutcome::Computed;
  auto cached = load(index);
  if (cached.status == emsynth::core::Status::Ok) {
    const bool stale =
        config_.validate_config_hash && (!cached.has_meta || cached.meta.config_hash != config_.config_hash);
    if (!stale) {
      return CacheEntry{
          .light_curve = std::move(cached.light_curve),
          .trigger_time_mjd = cached.meta.trigger_time_mjd,
          .outcome = CacheOutcome::Loaded,
      };
    }
    outcome = CacheOutcome::RecomputedStale;
  } else if (cached.status == emsynth::core::Status::CacheIoError) {
    outcome = CacheOutcome::RecomputedCorrupt;
  }

  auto result = synthesize(parameters);
  if (result.status != emsynth::core::Status::Ok) {
    return CacheEntry{.outcome = outcome, .status = result.status};
  }
  const auto stored = store(index, result);
  if (stored != emsynth::core::Status::Ok) {
    return CacheEntry{.outcome = outcome, .status = stored};
  }
  return CacheEntry{
      .light_curve = std::move(result.light_curve),
      .trigger_time_mjd = result.trigger_time_mjd,
      .outcome = outcome,
  };
}

}  // namespace emsynth::injection
