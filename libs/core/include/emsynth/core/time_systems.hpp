/**
 * @file time_systems.hpp
 * @brief GPS/MJD trigger-time conversion and leap-second table.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace emsynth::core {

/**
 * @brief Continuous time scale used for the MJD trigger time.
 */
enum class TimeScale : unsigned char { Tai, Utc };

namespace time_constants {

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kMjdGpsEpoch = 44244.0;      // 1980-01-06T00:00:00 UTC
inline constexpr double kMjdUnixEpoch = 40587.0;     // 1970-01-01T00:00:00 UTC
inline constexpr double kUnixMinusGpsEpochS = 315964800.0;
inline constexpr double kTaiMinusGpsS = 19.0;
/** @brief Luminosity distance of 10 pc in Mpc, used for absolute magnitudes. */
inline constexpr double kAbsoluteMagnitudeDistanceMpc = 1.0e-5;

}  // namespace time_constants

namespace leap_seconds {

/**
 * @brief TAI-UTC offset effective from a UTC Unix epoch.
 */
struct Step {
  double utc_unix_s{};
  double tai_minus_utc_s{};
};

using Table = std::vector<Step>;

inline const Table& builtin_table() {
  static const Table table = {
      {63072000.0, 10.0},    {78796800.0, 11.0},    {94694400.0, 12.0},    {126230400.0, 13.0},
      {157766400.0, 14.0},   {189302400.0, 15.0},   {220924800.0, 16.0},   {252460800.0, 17.0},
      {283996800.0, 18.0},   {315532800.0, 19.0},   {362793600.0, 20.0},   {394329600.0, 21.0},
      {425865600.0, 22.0},   {489024000.0, 23.0},   {567993600.0, 24.0},   {631152000.0, 25.0},
      {662688000.0, 26.0},   {709948800.0, 27.0},   {741484800.0, 28.0},   {773020800.0, 29.0},
      {820454400.0, 30.0},   {867715200.0, 31.0},   {915148800.0, 32.0},   {1136073600.0, 33.0},
      {1230768000.0, 34.0},  {1341100800.0, 35.0},  {1435708800.0, 36.0},  {1483228800.0, 37.0},
  };
  return table;
}

/**
 * @brief Parse "utc_unix_s tai_minus_utc_s" rows (comma or space separated, '#' comments).
 * @return False if the file is unreadable, malformed or empty.
 */
inline bool parse_table(std::istream& in, Table* out) {
  if (out == nullptr) {
    return false;
  }
  Table parsed{};
  std::string line{};
  while (std::getline(in, line)) {
    std::replace(line.begin(), line.end(), ',', ' ');
    const auto first = std::find_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) == 0; });
    if (first == line.end() || *first == '#') {
      continue;
    }
    std::istringstream iss(line);
    Step s{};
    if (!(iss >> s.utc_unix_s >> s.tai_minus_utc_s)) {
      return false;
    }
    parsed.push_back(s);
  }
  if (parsed.empty()) {
    return false;
  }
  std::sort(parsed.begin(), parsed.end(), [](const Step& a, const Step& b) { return a.utc_unix_s < b.utc_unix_s; });
  *out = std::move(parsed);
  return true;
}

/**
 * @brief Table in effect: `EMSYNTH_LEAP_SECONDS_FILE` if it parses, else the built-in one.
 */
inline const Table& active_table() {
  static const Table table = []() {
    const char* env = std::getenv("EMSYNTH_LEAP_SECONDS_FILE");
    if (env != nullptr && env[0] != '\0') {
      std::ifstream in(env);
      Table loaded{};
      if (in && parse_table(in, &loaded)) {
        return loaded;
      }
    }
    return builtin_table();
  }();
  return table;
}

inline double tai_minus_utc_at(const double utc_unix_s, const Table& table) {
  const auto it = std::upper_bound(table.begin(), table.end(), utc_unix_s,
                                   [](double t, const Step& s) { return t < s.utc_unix_s; });
  if (it == table.begin()) {
    return table.front().tai_minus_utc_s;
  }
  return (it - 1)->tai_minus_utc_s;
}

}  // namespace leap_seconds

/**
 * @brief Convert GPS seconds to a UTC Unix epoch using the leap-second table.
 */
inline double gps_to_utc_unix_seconds(const double gps_seconds, const leap_seconds::Table& table) {
  using namespace time_constants;
  const double unix_no_leap = gps_seconds + kUnixMinusGpsEpochS;
  // GPS-UTC is the leap count accrued since 1980; resolve it at the UTC estimate.
  double utc = unix_no_leap - (leap_seconds::tai_minus_utc_at(unix_no_leap, table) - kTaiMinusGpsS);
  utc = unix_no_leap - (leap_seconds::tai_minus_utc_at(utc, table) - kTaiMinusGpsS);
  return utc;
}

/**
 * @brief Convert GPS seconds to a Modified Julian Date in the requested scale.
 *
 * The TAI scale is the native scale of GPS time and needs no leap seconds.
 */
inline double gps_to_mjd(const double gps_seconds, const TimeScale scale, const leap_seconds::Table& table) {
  using namespace time_constants;
  if (scale == TimeScale::Tai) {
    return kMjdGpsEpoch + (gps_seconds + kTaiMinusGpsS) / kSecondsPerDay;
  }
  return kMjdUnixEpoch + gps_to_utc_unix_seconds(gps_seconds, table) / kSecondsPerDay;
}

inline double gps_to_mjd(const double gps_seconds, const TimeScale scale = TimeScale::Tai) {
  return gps_to_mjd(gps_seconds, scale, leap_seconds::active_table());
}

}  // namespace emsynth::core
