/**
 * @file injection_cache.hpp
 * @brief Resumable per-injection artifact cache.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "emsynth/core/types.hpp"
#include "emsynth/injection/artifact.hpp"

namespace emsynth::injection {

/**
 * @brief How a cache entry was obtained.
 */
enum class CacheOutcome : std::uint8_t { Loaded, Computed, RecomputedCorrupt, RecomputedStale };

const char* cache_outcome_to_string(CacheOutcome outcome);

struct CacheEntry {
  emsynth::core::LightCurve light_curve{};
  double trigger_time_mjd{};
  CacheOutcome outcome{CacheOutcome::Computed};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief Synthesizes the light curve of one injection row.
 */
using SynthesizeFn = std::function<emsynth::core::LightCurveResult(const emsynth::core::ParameterSet&)>;

/**
 * @brief Artifact directory keyed by injection index.
 *
 * Artifacts are `<directory>/<index><extension>`. An artifact whose stored
 * config hash differs from `config_hash` is stale and recomputed unless
 * `validate_config_hash` is off. The cache holds no mutable state, so
 * processes working on disjoint indices may share a directory.
 */
class InjectionCache final {
 public:
  struct Config {
    std::filesystem::path directory{};
    std::string extension{".dat"};
    std::uint64_t config_hash{};
    bool validate_config_hash{true};
  };

  explicit InjectionCache(Config config);

  [[nodiscard]] std::filesystem::path artifact_path(emsynth::core::InjectionIndex index) const;

  /**
   * @brief Read the artifact of `index`.
   * @return `DataUnavailable` if absent, `CacheIoError` if unreadable or malformed.
   */
  [[nodiscard]] ArtifactReadResult load(emsynth::core::InjectionIndex index) const;

  /**
   * @brief Persist `result` for `index` atomically.
   * @return `InvalidInput` if a filter uses the reserved `_meta` name,
   *         `CacheIoError` if the write or rename fails.
   */
  [[nodiscard]] emsynth::core::Status store(emsynth::core::InjectionIndex index,
                                            const emsynth::core::LightCurveResult& result) const;

  /**
   * @brief Return the cached light curve of `index`, synthesizing and persisting it when needed.
   *
   * `synthesize` is not called for a valid artifact. A synthesis failure is
   * returned unchanged and nothing is written.
   */
  [[nodiscard]] CacheEntry get_or_compute(emsynth::core::InjectionIndex index,
                                          const emsynth::core::ParameterSet& parameters,
                                          const SynthesizeFn& synthesize) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace emsynth::injection
