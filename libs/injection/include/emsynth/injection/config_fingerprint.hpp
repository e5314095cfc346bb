/**
 * @file config_fingerprint.hpp
 * @brief Hash of the generating configuration stored with cached artifacts.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "emsynth/injection/synthesizer.hpp"
#include "emsynth/models/model_factory.hpp"

namespace emsynth::injection {

/**
 * @brief 64-bit FNV-1a hash.
 */
[[nodiscard]] std::uint64_t fnv1a64(std::string_view text);

/**
 * @brief Canonical text form of every setting that influences a light curve.
 */
[[nodiscard]] std::string describe_generation_config(const emsynth::models::ModelSpec& model,
                                                     const SynthesisConfig& synthesis,
                                                     std::uint64_t generation_seed);

/**
 * @brief `fnv1a64(describe_generation_config(...))`.
 */
[[nodiscard]] std::uint64_t config_fingerprint(const emsynth::models::ModelSpec& model,
                                               const SynthesisConfig& synthesis,
                                               std::uint64_t generation_seed);

}  // namespace emsynth::injection
