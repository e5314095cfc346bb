/**
 * @file photometry.hpp
 * @brief AB magnitude conversions and filter effective frequencies.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace emsynth::models {

namespace photometry_constants {

inline constexpr double kSpeedOfLightCmS = 2.99792458e10;
inline constexpr double kMpcCm = 3.0856775814913673e24;
inline constexpr double kAbZeroPoint = -48.6;

}  // namespace photometry_constants

/**
 * @brief Distance modulus for a luminosity distance in Mpc.
 */
inline double distance_modulus(double luminosity_distance_mpc) {
  return 5.0 * std::log10(luminosity_distance_mpc * 1.0e6 / 10.0);
}

/**
 * @brief AB magnitude from flux density in erg/s/cm^2/Hz; +inf for non-positive flux.
 */
inline double ab_mag_from_fnu(double fnu_cgs) {
  if (!(fnu_cgs > 0.0)) {
    return std::numeric_limits<double>::infinity();
  }
  return -2.5 * std::log10(fnu_cgs) + photometry_constants::kAbZeroPoint;
}

/**
 * @brief Relative flux `10^(-0.4 m)`; zero for an infinite magnitude.
 */
inline double flux_from_mag(double mag) {
  if (std::isinf(mag) && mag > 0.0) {
    return 0.0;
  }
  return std::pow(10.0, -0.4 * mag);
}

/**
 * @brief Magnitude of a relative flux; +inf for zero flux.
 */
inline double mag_from_flux(double flux) {
  if (!(flux > 0.0)) {
    return std::numeric_limits<double>::infinity();
  }
  return -2.5 * std::log10(flux);
}

/**
 * @brief Effective wavelength in nm of a named optical/NIR filter.
 *
 * Accepts bare band names (u, g, r, i, z, y, J, H, K) and survey-prefixed
 * names such as `ztfg`, `ps1__r` or `2massks`.
 */
std::optional<double> filter_wavelength_nm(const std::string& filter);

/**
 * @brief Effective frequency in Hz of a named filter.
 */
inline std::optional<double> filter_frequency_hz(const std::string& filter) {
  const auto lambda_nm = filter_wavelength_nm(filter);
  if (!lambda_nm) {
    return std::nullopt;
  }
  return photometry_constants::kSpeedOfLightCmS / (*lambda_nm * 1.0e-7);
}

}  // namespace emsynth::models
