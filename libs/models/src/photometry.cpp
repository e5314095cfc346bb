/**
 * @file photometry.cpp
 * @brief Filter effective wavelength table.
 * @author Watosn
 */

#include "emsynth/models/photometry.hpp"

#include <array>

namespace emsynth::models {
namespace {

struct FilterEntry {
  const char* name;
  double lambda_nm;
};

constexpr std::array<FilterEntry, 24> kFilters{{
    {"u", 354.3},       {"g", 477.0},        {"r", 623.1},       {"i", 762.5},        {"z", 913.4},
    {"y", 1004.0},      {"J", 1250.0},       {"H", 1650.0},      {"K", 2200.0},       {"ztfg", 472.3},
    {"ztfr", 633.3},    {"ztfi", 788.6},     {"ps1__g", 481.0},  {"ps1__r", 617.0},   {"ps1__i", 752.0},
    {"ps1__z", 866.0},  {"ps1__y", 962.0},   {"2massj", 1235.0}, {"2massh", 1662.0},  {"2massks", 2159.0},
    {"sdssu", 355.1},   {"bessellux", 366.3}, {"bessellv", 545.0}, {"uvot__uvw1", 260.0},
}};

}  // namespace

std::optional<double> filter_wavelength_nm(const std::string& filter) {
  for (const auto& f : kFilters) {
    if (filter == f.name) {
      return f.lambda_nm;
    }
  }
  return std::nullopt;
}

}  // namespace emsynth::models
