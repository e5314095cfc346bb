/**
 * @file config_fingerprint.cpp
 * @brief Hash of the generating configuration stored with cached artifacts.
 * @author Watosn
 */

#include "emsynth/injection/config_fingerprint.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace emsynth::injection {

std::uint64_t fnv1a64(const std::string_view text) {
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (const char c : text) {
    hash ^= static_cast<std::uint8_t>(c);
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string describe_generation_config(const emsynth::models::ModelSpec& model,
                                       const SynthesisConfig& synthesis,
                                       const std::uint64_t generation_seed) {
  const auto& realism = synthesis.realism;
  std::string text = fmt::format(
      "model={};mode={};svd={};templates={};mag_ncoeff={};lbol_ncoeff={};interp={};grb_res={:.17g};jet={};"
      "filters={};",
      model.name, model.mode == emsynth::models::ModelMode::Joint ? "joint" : "single", model.svd_path.string(),
      model.template_dir.string(), model.mag_ncoeff, model.lbol_ncoeff, model.interpolation_type,
      model.grb_resolution, model.jet_type, fmt::join(model.filters, ","));
  text += fmt::format("tmin={:.17g};tmax={:.17g};dt={:.17g};absolute={};scale={};seed={};",
                      synthesis.grid.tmin, synthesis.grid.tmax, synthesis.grid.step, synthesis.absolute ? 1 : 0,
                      synthesis.time_scale == emsynth::core::TimeScale::Tai ? "tai" : "utc", generation_seed);
  for (const auto& [filter, limit] : realism.detection_limits) {
    text += fmt::format("limit[{}]={:.17g};", filter, limit);
  }
  text += fmt::format("phot_err={:.17g};ztf={};ztf_too={};rubin={};rubin_type={};",
                      realism.photometric_error, realism.ztf_sampling ? 1 : 0, static_cast<int>(realism.ztf_too),
                      realism.rubin_too ? 1 : 0, static_cast<int>(realism.rubin_too_type));
  if (realism.ztf_uncertainties) {
    text += "ztf_unc=1;";
  }
  const auto& aug = realism.augmentation;
  if (aug.enabled) {
    text += fmt::format("aug_n={};aug_seed={};aug_filters={};aug_times={:.17g};", aug.n_points, aug.seed,
                        fmt::join(aug.filters, ","), fmt::join(aug.times, ","));
  }
  return text;
}

std::uint64_t config_fingerprint(const emsynth::models::ModelSpec& model,
                                 const SynthesisConfig& synthesis,
                                 const std::uint64_t generation_seed) {
  return fnv1a64(describe_generation_config(model, synthesis, generation_seed));
}

}  // namespace emsynth::injection
