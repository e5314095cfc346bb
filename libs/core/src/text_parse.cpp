/**
 * @file text_parse.cpp
 * @brief Strict numeric parsing of option and CSV fields.
 * @author Watosn
 */

#include "emsynth/core/text_parse.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace emsynth::core {

bool parse_double(const std::string& text, double& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

bool parse_int(const std::string& text, int& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

bool parse_uint64(const std::string& text, std::uint64_t& out) {
  // strtoull accepts "-1" and wraps it.
  if (text.empty() || text.find('-') != std::string::npos) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
    return false;
  }
  out = static_cast<std::uint64_t>(v);
  return true;
}

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> items;
  std::stringstream ss(text);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    if (!tok.empty()) {
      items.push_back(tok);
    }
  }
  return items;
}

}  // namespace emsynth::core
