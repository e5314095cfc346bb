/**
 * @file artifact.hpp
 * @brief On-disk light-curve artifact format.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "emsynth/core/types.hpp"

namespace emsynth::injection {

inline constexpr const char* kArtifactSchema = "emsynth_lightcurve_v1";
inline constexpr const char* kArtifactMetaKey = "_meta";

/**
 * @brief True for names that cannot be used as filters in an artifact.
 */
[[nodiscard]] inline bool is_reserved_filter_name(const std::string& filter) { return filter == kArtifactMetaKey; }

/**
 * @brief Provenance block stored under `_meta`.
 */
struct ArtifactMeta {
  std::string schema{kArtifactSchema};
  emsynth::core::InjectionIndex index{};
  std::uint64_t config_hash{};
  double trigger_time_mjd{};
};

struct ArtifactReadResult {
  emsynth::core::LightCurve light_curve{};
  ArtifactMeta meta{};
  bool has_meta{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief JSON text: `{filter: [[t, mag, err|null], ...], "_meta": {...}}`.
 *
 * Upper limits are written with a `null` error. Doubles are written with
 * round-trip precision.
 */
[[nodiscard]] std::string serialize_artifact(const emsynth::core::LightCurve& light_curve, const ArtifactMeta& meta);

/**
 * @brief Parse artifact text; `[t, mag]` pairs are accepted as detections with zero error.
 * @return `CacheIoError` for anything that is not a well-formed artifact.
 */
[[nodiscard]] ArtifactReadResult parse_artifact(const std::string& text);

/**
 * @brief Write `contents` to `path + ".tmp"` and rename it over `path`.
 * @return `CacheIoError` on any write or rename failure; no partial file remains.
 */
[[nodiscard]] emsynth::core::Status write_file_atomic(const std::filesystem::path& path, const std::string& contents);

}  // namespace emsynth::injection
