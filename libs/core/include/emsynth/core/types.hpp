/**
 * @file types.hpp
 * @brief Core domain types for emsynth.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace emsynth::core {

/**
 * @brief Standard status code used by every library output.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  NotImplemented,
  DataUnavailable,
  NumericalError,
  ConfigurationError,
  MissingField,
  ModelEvaluationError,
  CacheIoError
};

/**
 * @brief Human-readable status tag for diagnostics.
 */
inline const char* status_to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::NotImplemented:
      return "not_implemented";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
    case Status::ConfigurationError:
      return "configuration_error";
    case Status::MissingField:
      return "missing_field";
    case Status::ModelEvaluationError:
      return "model_evaluation_error";
    case Status::CacheIoError:
      return "cache_io_error";
    default:
      return "unknown";
  }
}

/**
 * @brief Injection row identifier, used as cache key and artifact stem.
 */
using InjectionIndex = std::int64_t;

/**
 * @brief Named scalar parameters of one injection.
 */
using ParameterSet = std::map<std::string, double>;

/**
 * @brief Per-filter magnitude series sampled on a shared time vector.
 */
using FilterMagnitudes = std::map<std::string, std::vector<double>>;

/**
 * @brief One photometric sample.
 *
 * `time` is in days relative to the trigger. A non-detection carries the
 * detection limit in `mag` and an infinite `mag_error`.
 */
struct LightCurvePoint {
  double time{};
  double mag{};
  double mag_error{};

  [[nodiscard]] bool is_upper_limit() const { return mag_error == std::numeric_limits<double>::infinity(); }
};

/**
 * @brief Per-filter time series, each sorted by time.
 */
using LightCurve = std::map<std::string, std::vector<LightCurvePoint>>;

/**
 * @brief Synthesized light curve for one injection.
 */
struct LightCurveResult {
  LightCurve light_curve{};
  double trigger_time_mjd{};
  Status status{Status::Ok};
};

/**
 * @brief All light curves of one invocation keyed by injection index.
 */
using ResultCollection = std::map<InjectionIndex, LightCurve>;

}  // namespace emsynth::core
