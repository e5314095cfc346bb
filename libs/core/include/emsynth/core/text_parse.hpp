/**
 * @file text_parse.hpp
 * @brief Strict numeric parsing of option and CSV fields.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace emsynth::core {

/**
 * @brief Parse the whole of `text` as a double.
 */
[[nodiscard]] bool parse_double(const std::string& text, double& out);

/**
 * @brief Parse the whole of `text` as a base-10 int; out-of-range values fail.
 */
[[nodiscard]] bool parse_int(const std::string& text, int& out);

/**
 * @brief Parse the whole of `text` as a base-10 unsigned 64-bit value.
 *
 * A leading minus sign and values above `UINT64_MAX` fail.
 */
[[nodiscard]] bool parse_uint64(const std::string& text, std::uint64_t& out);

/**
 * @brief Split a comma separated list, skipping empty items.
 */
[[nodiscard]] std::vector<std::string> split_list(const std::string& text);

}  // namespace emsynth::core
