/**
 * @file grb_afterglow_model.cpp
 * @brief Closed-form GRB afterglow implementation.
 * @author Watosn
 */

#include "emsynth/models/grb_afterglow_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#include "emsynth/models/photometry.hpp"

namespace emsynth::models {
namespace {

constexpr double kMicroJanskyCgs = 1.0e-29;
constexpr double kJetBreakScaleDays = 6.2 / 24.0;
constexpr double kJetBreakSharpness = 2.0;
constexpr double kPowerLawIndex = 2.0;

/**
 * @brief Physical inputs resolved from the parameter set.
 */
struct AfterglowInputs {
  double theta_obs{};
  double e_iso_erg{};
  double theta_core{};
  double theta_wing{};
  double n0{};
  double p{};
  double epsilon_e{};
  double epsilon_b{};
  double dl_cm{};
  double z{};
};

std::optional<double> lookup(const emsynth::core::ParameterSet& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || !std::isfinite(it->second)) {
    return std::nullopt;
  }
  return it->second;
}

bool resolve_inputs(const emsynth::core::ParameterSet& params, AfterglowInputs* out) {
  const auto theta_obs = lookup(params, "inclination_EM");
  const auto log10_e0 = lookup(params, "log10_E0");
  const auto theta_core = lookup(params, "thetaCore");
  const auto log10_n0 = lookup(params, "log10_n0");
  const auto p = lookup(params, "p");
  const auto log10_ee = lookup(params, "log10_epsilon_e");
  const auto log10_eb = lookup(params, "log10_epsilon_B");
  const auto dl = lookup(params, "luminosity_distance");
  if (!theta_obs || !log10_e0 || !theta_core || !log10_n0 || !p || !log10_ee || !log10_eb || !dl) {
    return false;
  }
  if (!(*theta_core > 0.0) || !(*p > 2.0) || !(*dl > 0.0)) {
    return false;
  }
  *out = AfterglowInputs{
      .theta_obs = std::abs(*theta_obs),
      .e_iso_erg = std::pow(10.0, *log10_e0),
      .theta_core = *theta_core,
      .theta_wing = lookup(params, "thetaWing").value_or(*theta_core),
      .n0 = std::pow(10.0, *log10_n0),
      .p = *p,
      .epsilon_e = std::pow(10.0, *log10_ee),
      .epsilon_b = std::pow(10.0, *log10_eb),
      .dl_cm = *dl * photometry_constants::kMpcCm,
      .z = lookup(params, "redshift").value_or(0.0),
  };
  return true;
}

/**
 * @brief Isotropic-equivalent energy seen along the line of sight.
 */
double line_of_sight_energy(const AfterglowInputs& in, JetType jet) {
  const double th = std::min(in.theta_obs, in.theta_wing);
  const double x = th / in.theta_core;
  switch (jet) {
    case JetType::Gaussian:
    case JetType::GaussianCore:
      return in.e_iso_erg * std::exp(-0.5 * x * x);
    case JetType::PowerLaw:
    case JetType::PowerLawCore:
      return in.e_iso_erg * std::pow(1.0 + x * x / kPowerLawIndex, -0.5 * kPowerLawIndex);
    default:
      return in.e_iso_erg;
  }
}

/**
 * @brief On-axis flux density in microjansky (slow/fast cooling spectrum).
 */
double spectrum_ujy(double nu_hz, double t_days, double e52, const AfterglowInputs& in) {
  const double zf = 1.0 + in.z;
  const double g = std::pow(3.0 * (in.p - 2.0) / (in.p - 1.0), 2.0);
  const double nu_m = 5.7e14 * std::sqrt(in.epsilon_b) * in.epsilon_e * in.epsilon_e * g * std::sqrt(e52) *
                      std::pow(t_days, -1.5) * std::sqrt(zf);
  const double nu_c = 2.7e12 * std::pow(in.epsilon_b, -1.5) / std::sqrt(e52) / in.n0 / std::sqrt(t_days) / std::sqrt(zf);
  const double d28 = in.dl_cm / 1.0e28;
  const double f_max = 1.1e5 * std::sqrt(in.epsilon_b) * e52 * std::sqrt(in.n0) / (d28 * d28) * zf;

  const double nu = nu_hz * zf;
  if (nu_m <= nu_c) {
    if (nu < nu_m) {
      return f_max * std::cbrt(nu / nu_m);
    }
    if (nu < nu_c) {
      return f_max * std::pow(nu / nu_m, -0.5 * (in.p - 1.0));
    }
    return f_max * std::pow(nu_c / nu_m, -0.5 * (in.p - 1.0)) * std::pow(nu / nu_c, -0.5 * in.p);
  }
  if (nu < nu_c) {
    return f_max * std::cbrt(nu / nu_c);
  }
  if (nu < nu_m) {
    return f_max / std::sqrt(nu / nu_c);
  }
  return f_max / std::sqrt(nu_m / nu_c) * std::pow(nu / nu_m, -0.5 * in.p);
}

}  // namespace

bool jet_type_from_code(int code, JetType* out) {
  if (out == nullptr) {
    return false;
  }
  switch (code) {
    case -1:
    case 0:
    case 1:
    case 2:
    case 3:
    case 4:
      *out = static_cast<JetType>(code);
      return true;
    default:
      return false;
  }
}

std::unique_ptr<GrbAfterglowModel> GrbAfterglowModel::Create(const Config& config) {
  auto ptr = std::unique_ptr<GrbAfterglowModel>(new GrbAfterglowModel(config));
  if (!(config.resolution > 0.0) || !jet_type_from_code(config.jet_type, &ptr->jet_type_)) {
    ptr->load_status_ = emsynth::core::Status::ConfigurationError;
    return ptr;
  }
  for (const auto& filter : config.filters) {
    const auto nu = filter_frequency_hz(filter);
    if (!nu) {
      ptr->filter_frequencies_hz_.clear();
      ptr->load_status_ = emsynth::core::Status::ConfigurationError;
      return ptr;
    }
    ptr->filter_frequencies_hz_.emplace_back(filter, *nu);
  }
  ptr->load_status_ = ptr->filter_frequencies_hz_.empty() ? emsynth::core::Status::ConfigurationError
                                                          : emsynth::core::Status::Ok;
  return ptr;
}

emsynth::core::ModelEvaluation GrbAfterglowModel::evaluate(const emsynth::core::ParameterSet& parameters,
                                                           const std::vector<double>& sample_times) const {
  if (load_status_ != emsynth::core::Status::Ok) {
    return emsynth::core::ModelEvaluation{.status = load_status_};
  }
  AfterglowInputs in{};
  if (!resolve_inputs(parameters, &in)) {
    return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::InvalidInput};
  }

  constexpr double kInf = std::numeric_limits<double>::infinity();
  emsynth::core::ModelEvaluation out{};
  out.status = emsynth::core::Status::Ok;

  // Wings wider than the configured resolution are not resolved; report no emission.
  if (in.theta_wing / in.theta_core > config_.resolution) {
    for (const auto& [filter, nu] : filter_frequencies_hz_) {
      out.magnitudes.emplace(filter, std::vector<double>(sample_times.size(), kInf));
    }
    return out;
  }

  const bool structured = jet_type_ != JetType::TopHat && jet_type_ != JetType::Spherical;
  const double edge = structured ? in.theta_wing : in.theta_core;
  const double e52 = line_of_sight_energy(in, jet_type_) / 1.0e52;
  const double zf = 1.0 + in.z;
  const double t_jet = kJetBreakScaleDays * std::cbrt(e52 / in.n0) * std::pow(in.theta_core / 0.1, 8.0 / 3.0) * zf;
  const bool off_axis = jet_type_ != JetType::Spherical && in.theta_obs > edge;
  const double t_peak = t_jet * std::pow(1.0 + (in.theta_obs - edge) / in.theta_core, 8.0 / 3.0);
  const double break_index = (in.p + 3.0) / 4.0;

  for (const auto& [filter, nu] : filter_frequencies_hz_) {
    std::vector<double> mags;
    mags.reserve(sample_times.size());
    for (const double t : sample_times) {
      if (!(t > 0.0) || !(e52 > 0.0)) {
        mags.push_back(kInf);
        continue;
      }
      double f = spectrum_ujy(nu, t, e52, in);
      if (jet_type_ != JetType::Spherical) {
        f *= std::pow(1.0 + std::pow(t / t_jet, kJetBreakSharpness), -break_index / kJetBreakSharpness);
      }
      if (off_axis) {
        const double x3 = std::pow(t / t_peak, 3.0);
        f *= x3 / (1.0 + x3);
      }
      mags.push_back(ab_mag_from_fnu(f * kMicroJanskyCgs));
    }
    out.magnitudes.emplace(filter, std::move(mags));
  }
  return out;
}

}  // namespace emsynth::models
