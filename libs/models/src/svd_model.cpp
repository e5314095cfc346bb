/**
 * @file svd_model.cpp
 * @brief SVD-surrogate kilonova model implementation.
 * @author Watosn
 */

#include "emsynth/models/svd_model.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <utility>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "emsynth/core/numerics.hpp"
#include "emsynth/models/photometry.hpp"

namespace emsynth::models {
namespace {

using json = nlohmann::json;

/**
 * @brief Basis and coefficient data for one reconstructed quantity.
 */
struct SvdBlock {
  double value_min{};
  double value_max{};
  Eigen::MatrixXd basis{};    // n_times x n_coeff
  Eigen::MatrixXd targets{};  // n_train x n_coeff
  Eigen::MatrixXd alpha{};    // n_train x n_coeff
  Eigen::VectorXd offset{};   // n_coeff
};

bool read_matrix(const json& rows, Eigen::MatrixXd* out) {
  const auto n_rows = static_cast<Eigen::Index>(rows.size());
  const auto n_cols = n_rows > 0 ? static_cast<Eigen::Index>(rows.at(0).size()) : Eigen::Index{0};
  Eigen::MatrixXd m(n_rows, n_cols);
  for (Eigen::Index r = 0; r < n_rows; ++r) {
    const auto& row = rows.at(static_cast<std::size_t>(r));
    if (static_cast<Eigen::Index>(row.size()) != n_cols) {
      return false;
    }
    for (Eigen::Index c = 0; c < n_cols; ++c) {
      m(r, c) = row.at(static_cast<std::size_t>(c)).get<double>();
    }
  }
  *out = std::move(m);
  return true;
}

Eigen::VectorXd read_vector(const json& values) {
  Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
  for (Eigen::Index i = 0; i < v.size(); ++i) {
    v(i) = values.at(static_cast<std::size_t>(i)).get<double>();
  }
  return v;
}

bool read_block(const json& j, Eigen::Index n_times, Eigen::Index n_train, SvdBlock* out) {
  SvdBlock b{};
  b.value_min = j.at("min").get<double>();
  b.value_max = j.at("max").get<double>();
  // Stored as one row per coefficient; kept column-wise for the reconstruction product.
  Eigen::MatrixXd rows{};
  if (!read_matrix(j.at("basis"), &rows)) {
    return false;
  }
  b.basis = rows.transpose();
  const auto& coeffs = j.at("coefficients");
  const auto n_coeff = static_cast<Eigen::Index>(coeffs.size());
  if (b.basis.rows() != n_times || b.basis.cols() != n_coeff || n_coeff == 0) {
    return false;
  }
  b.targets.resize(n_train, n_coeff);
  b.alpha.resize(n_train, n_coeff);
  b.offset = Eigen::VectorXd::Zero(n_coeff);
  for (Eigen::Index k = 0; k < n_coeff; ++k) {
    const auto& c = coeffs.at(static_cast<std::size_t>(k));
    const Eigen::VectorXd y = read_vector(c.at("targets"));
    const Eigen::VectorXd a = read_vector(c.at("alpha"));
    if (y.size() != n_train || a.size() != n_train) {
      return false;
    }
    b.targets.col(k) = y;
    b.alpha.col(k) = a;
    b.offset(k) = c.value("offset", 0.0);
  }
  *out = std::move(b);
  return true;
}

}  // namespace

class SvdLightCurveModel::Impl {
 public:
  std::vector<std::string> parameter_names{};
  Eigen::VectorXd param_min{};
  Eigen::VectorXd param_max{};
  Eigen::MatrixXd training_points{};  // n_train x n_dim, normalized
  double kernel_amplitude{1.0};
  Eigen::VectorXd kernel_length_scale{};
  std::vector<double> times{};
  std::map<std::string, SvdBlock> filters{};
  bool has_lbol{};
  SvdBlock lbol{};

  /**
   * @brief Predicted normalized values on the reference grid for one block.
   */
  [[nodiscard]] Eigen::VectorXd reconstruct(const SvdBlock& block,
                                            const Eigen::VectorXd& x,
                                            int n_coeff,
                                            CoefficientInterpolation scheme) const {
    const Eigen::Index n = std::min<Eigen::Index>(static_cast<Eigen::Index>(n_coeff), block.basis.cols());
    Eigen::VectorXd coeffs(n);
    if (scheme == CoefficientInterpolation::Nearest) {
      Eigen::Index best = 0;
      (training_points.rowwise() - x.transpose()).rowwise().squaredNorm().minCoeff(&best);
      coeffs = block.targets.row(best).head(n).transpose();
    } else {
      const Eigen::VectorXd k = kernel_row(x);
      coeffs = block.offset.head(n) + block.alpha.leftCols(n).transpose() * k;
    }
    const Eigen::VectorXd normalized = block.basis.leftCols(n) * coeffs;
    return (normalized.array() * (block.value_max - block.value_min) + block.value_min).matrix();
  }

 private:
  [[nodiscard]] Eigen::VectorXd kernel_row(const Eigen::VectorXd& x) const {
    const Eigen::Index n_train = training_points.rows();
    Eigen::VectorXd k(n_train);
    for (Eigen::Index i = 0; i < n_train; ++i) {
      const Eigen::VectorXd d = (training_points.row(i).transpose() - x).cwiseQuotient(kernel_length_scale);
      k(i) = kernel_amplitude * std::exp(-0.5 * d.squaredNorm());
    }
    return k;
  }
};

bool parse_coefficient_interpolation(const std::string& name, CoefficientInterpolation* out) {
  if (out == nullptr) {
    return false;
  }
  if (name == "sklearn_gp") {
    *out = CoefficientInterpolation::GaussianProcess;
    return true;
  }
  if (name == "nearest") {
    *out = CoefficientInterpolation::Nearest;
    return true;
  }
  return false;
}

std::unique_ptr<SvdLightCurveModel> SvdLightCurveModel::Create(const Config& config) {
  auto ptr = std::unique_ptr<SvdLightCurveModel>(new SvdLightCurveModel(config));
  if (config.mag_ncoeff <= 0 || config.lbol_ncoeff <= 0) {
    ptr->load_status_ = emsynth::core::Status::ConfigurationError;
    return ptr;
  }

  const auto path = config.svd_path / (config.model + ".json");
  std::ifstream in(path);
  if (!in) {
    ptr->load_status_ = emsynth::core::Status::DataUnavailable;
    return ptr;
  }

  auto impl = std::make_shared<Impl>();
  try {
    const json j = json::parse(in);
    impl->parameter_names = j.at("parameters").get<std::vector<std::string>>();
    impl->param_min = read_vector(j.at("param_mins"));
    impl->param_max = read_vector(j.at("param_maxs"));
    if (!read_matrix(j.at("training_points"), &impl->training_points)) {
      ptr->load_status_ = emsynth::core::Status::InvalidInput;
      return ptr;
    }
    impl->times = j.at("times").get<std::vector<double>>();
    const auto& kernel = j.at("kernel");
    impl->kernel_amplitude = kernel.value("amplitude", 1.0);
    impl->kernel_length_scale = read_vector(kernel.at("length_scale"));

    const auto n_dim = static_cast<Eigen::Index>(impl->parameter_names.size());
    if (impl->param_min.size() != n_dim || impl->param_max.size() != n_dim || impl->training_points.cols() != n_dim ||
        impl->kernel_length_scale.size() != n_dim || impl->times.size() < 2U || impl->training_points.rows() == 0) {
      ptr->load_status_ = emsynth::core::Status::InvalidInput;
      return ptr;
    }

    const auto n_times = static_cast<Eigen::Index>(impl->times.size());
    const auto n_train = impl->training_points.rows();
    for (const auto& [filter, block_json] : j.at("filters").items()) {
      if (!config.filters.empty() &&
          std::find(config.filters.begin(), config.filters.end(), filter) == config.filters.end()) {
        continue;
      }
      SvdBlock block{};
      if (!read_block(block_json, n_times, n_train, &block)) {
        ptr->load_status_ = emsynth::core::Status::InvalidInput;
        return ptr;
      }
      impl->filters.emplace(filter, std::move(block));
    }
    if (j.contains("lbol")) {
      impl->has_lbol = read_block(j.at("lbol"), n_times, n_train, &impl->lbol);
    }
  } catch (const json::exception&) {
    ptr->load_status_ = emsynth::core::Status::InvalidInput;
    return ptr;
  }

  if (impl->filters.empty()) {
    ptr->load_status_ = emsynth::core::Status::DataUnavailable;
    return ptr;
  }
  ptr->impl_ = std::move(impl);
  ptr->load_status_ = emsynth::core::Status::Ok;
  return ptr;
}

std::vector<std::string> SvdLightCurveModel::filters() const {
  std::vector<std::string> out;
  if (impl_) {
    for (const auto& [filter, block] : impl_->filters) {
      out.push_back(filter);
    }
  }
  return out;
}

emsynth::core::ModelEvaluation SvdLightCurveModel::evaluate(const emsynth::core::ParameterSet& parameters,
                                                            const std::vector<double>& sample_times) const {
  if (!impl_) {
    return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::DataUnavailable};
  }

  const auto dl = parameters.find("luminosity_distance");
  if (dl == parameters.end() || !(dl->second > 0.0)) {
    return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::InvalidInput};
  }

  const auto n_dim = static_cast<Eigen::Index>(impl_->parameter_names.size());
  Eigen::VectorXd x(n_dim);
  for (Eigen::Index d = 0; d < n_dim; ++d) {
    const auto it = parameters.find(impl_->parameter_names[static_cast<std::size_t>(d)]);
    if (it == parameters.end()) {
      return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::InvalidInput};
    }
    const double span = impl_->param_max(d) - impl_->param_min(d);
    x(d) = span != 0.0 ? (it->second - impl_->param_min(d)) / span : 0.0;
  }

  const double dm = distance_modulus(dl->second);
  emsynth::core::ModelEvaluation out{};
  for (const auto& [filter, block] : impl_->filters) {
    const Eigen::VectorXd mag_ref = impl_->reconstruct(block, x, config_.mag_ncoeff, config_.interpolation);
    const std::vector<double> ref(mag_ref.data(), mag_ref.data() + mag_ref.size());
    auto mags = emsynth::core::interp_linear_extrapolate(impl_->times, ref, sample_times);
    for (double& m : mags) {
      m += dm;
    }
    if (std::any_of(mags.begin(), mags.end(), [](double m) { return std::isnan(m); })) {
      return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::NumericalError};
    }
    out.magnitudes.emplace(filter, std::move(mags));
  }

  if (impl_->has_lbol) {
    const Eigen::VectorXd log_lbol = impl_->reconstruct(impl_->lbol, x, config_.lbol_ncoeff, config_.interpolation);
    const std::vector<double> ref(log_lbol.data(), log_lbol.data() + log_lbol.size());
    for (const double v : emsynth::core::interp_linear_extrapolate(impl_->times, ref, sample_times)) {
      out.lbol_erg_s.push_back(std::pow(10.0, v));
    }
  }
  out.status = emsynth::core::Status::Ok;
  return out;
}

}  // namespace emsynth::models
