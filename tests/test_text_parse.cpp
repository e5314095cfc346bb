/**
 * @file test_text_parse.cpp
 * @brief Strict option-field parsing tests.
 * @author Watosn
 */

#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "emsynth/core/text_parse.hpp"

int main() {
  using namespace emsynth;

  std::uint64_t seed = 0;
  if (!core::parse_uint64("5000000000", seed) || seed != 5000000000ULL) {
    spdlog::error("seed above INT_MAX must be kept exactly");
    return 1;
  }
  if (!core::parse_uint64("18446744073709551615", seed) || seed != UINT64_MAX) {
    spdlog::error("largest 64-bit seed must parse");
    return 2;
  }
  seed = 7;
  if (core::parse_uint64("18446744073709551616", seed) || core::parse_uint64("-1", seed) ||
      core::parse_uint64("12x", seed) || core::parse_uint64("", seed)) {
    spdlog::error("overflowing, negative or malformed seeds must be rejected");
    return 3;
  }

  int n = 0;
  if (!core::parse_int("-12", n) || n != -12) {
    spdlog::error("negative int must parse");
    return 4;
  }
  if (core::parse_int("5000000000", n) || core::parse_int("-5000000000", n) || core::parse_int("3.5", n)) {
    spdlog::error("ints outside the int range must be rejected");
    return 5;
  }

  double d = 0.0;
  if (!core::parse_double("0.1", d) || d != 0.1 || core::parse_double("0.1abc", d)) {
    spdlog::error("double parsing mismatch");
    return 6;
  }

  const auto items = core::split_list("g,,r,i");
  if (items.size() != 3U || items[0] != "g" || items[2] != "i") {
    spdlog::error("list splitting mismatch");
    return 7;
  }
  return 0;
}
