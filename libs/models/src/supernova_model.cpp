/**
 * @file supernova_model.cpp
 * @brief Supernova template model implementation.
 * @author Watosn
 */

#include "emsynth/models/supernova_model.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include "emsynth/core/numerics.hpp"
#include "emsynth/core/text_parse.hpp"
#include "emsynth/models/photometry.hpp"

namespace emsynth::models {
namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    token.erase(0, token.find_first_not_of(" \t\r"));
    token.erase(token.find_last_not_of(" \t\r") + 1U);
    fields.push_back(token);
  }
  return fields;
}

double param_or(const emsynth::core::ParameterSet& params, const char* key, double fallback) {
  const auto it = params.find(key);
  return it == params.end() ? fallback : it->second;
}

}  // namespace

bool is_supernova_template(const std::string& name) { return name == "nugent-hyper" || name == "salt2"; }

std::unique_ptr<SupernovaTemplateModel> SupernovaTemplateModel::Create(const Config& config) {
  auto ptr = std::unique_ptr<SupernovaTemplateModel>(new SupernovaTemplateModel(config));
  std::ifstream in(config.template_dir / (config.template_name + ".csv"));
  if (!in) {
    ptr->load_status_ = emsynth::core::Status::DataUnavailable;
    return ptr;
  }

  std::string line;
  std::vector<std::string> header;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] != '#') {
      header = split_csv_line(line);
      break;
    }
  }
  if (header.size() < 2U || header[0] != "phase") {
    ptr->load_status_ = emsynth::core::Status::InvalidInput;
    return ptr;
  }

  std::vector<std::vector<double>> columns(header.size());
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() != header.size()) {
      ptr->load_status_ = emsynth::core::Status::InvalidInput;
      return ptr;
    }
    for (std::size_t c = 0; c < fields.size(); ++c) {
      double v = 0.0;
      if (!emsynth::core::parse_double(fields[c], v)) {
        ptr->load_status_ = emsynth::core::Status::InvalidInput;
        return ptr;
      }
      columns[c].push_back(v);
    }
  }
  if (columns[0].size() < 2U || !std::is_sorted(columns[0].begin(), columns[0].end())) {
    ptr->load_status_ = emsynth::core::Status::InvalidInput;
    return ptr;
  }

  ptr->phases_ = columns[0];
  for (std::size_t c = 1; c < header.size(); ++c) {
    if (config.filters.empty() || std::find(config.filters.begin(), config.filters.end(), header[c]) != config.filters.end()) {
      ptr->abs_mags_.emplace(header[c], columns[c]);
    }
  }
  ptr->load_status_ = ptr->abs_mags_.empty() ? emsynth::core::Status::DataUnavailable : emsynth::core::Status::Ok;
  return ptr;
}

emsynth::core::ModelEvaluation SupernovaTemplateModel::evaluate(const emsynth::core::ParameterSet& parameters,
                                                                const std::vector<double>& sample_times) const {
  if (load_status_ != emsynth::core::Status::Ok) {
    return emsynth::core::ModelEvaluation{.status = load_status_};
  }
  const double dl = param_or(parameters, "luminosity_distance", 0.0);
  const double stretch = param_or(parameters, "supernova_mag_stretch", 1.0);
  const double boost = param_or(parameters, "supernova_mag_boost", 0.0);
  if (!(dl > 0.0) || !(stretch > 0.0)) {
    return emsynth::core::ModelEvaluation{.status = emsynth::core::Status::InvalidInput};
  }

  const double offset = distance_modulus(dl) + boost;
  emsynth::core::ModelEvaluation out{};
  for (const auto& [filter, mags_abs] : abs_mags_) {
    std::vector<double> mags;
    mags.reserve(sample_times.size());
    for (const double t : sample_times) {
      const double phase = t / stretch;
      if (phase < phases_.front() || phase > phases_.back()) {
        mags.push_back(std::numeric_limits<double>::infinity());
        continue;
      }
      mags.push_back(emsynth::core::interp_linear_extrapolate(phases_, mags_abs, phase) + offset);
    }
    out.magnitudes.emplace(filter, std::move(mags));
  }
  out.status = emsynth::core::Status::Ok;
  return out;
}

}  // namespace emsynth::models
