/**
 * @file test_fixtures.hpp
 * @brief On-disk model fixtures shared by the tests.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace emsynth::testing {

/**
 * @brief Fresh directory under the system temp path.
 */
inline std::filesystem::path make_temp_dir(const std::string& tag) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir = std::filesystem::temp_directory_path() / ("emsynth_" + tag + "_" + std::to_string(stamp));
  std::filesystem::create_directories(dir);
  return dir;
}

/**
 * @brief One-coefficient SVD surrogate over parameters (log10_mej, vej).
 *
 * At the first training point (log10_mej=-3, vej=0.05) the GP coefficient is
 * 0.8 and the absolute magnitudes are -7.2, -5.6, -4.0 at t = 0, 7, 14 days.
 */
inline bool write_svd_fixture(const std::filesystem::path& dir,
                              const std::string& model,
                              const std::vector<std::string>& filters) {
  using json = nlohmann::json;
  json j = json::object();
  j["parameters"] = json::array({"log10_mej", "vej"});
  j["param_mins"] = json::array({-3.0, 0.05});
  j["param_maxs"] = json::array({-1.0, 0.3});
  j["training_points"] = json::array({json::array({0.0, 0.0}), json::array({0.5, 0.5}), json::array({1.0, 1.0})});
  j["times"] = json::array({0.0, 7.0, 14.0});
  j["kernel"] = json::object({{"amplitude", 1.0}, {"length_scale", json::array({1.0, 1.0})}});

  json mag_coeff = json::object();
  mag_coeff["targets"] = json::array({0.8, 0.5, 0.2});
  mag_coeff["alpha"] = json::array({1.0, 0.0, 0.0});
  mag_coeff["offset"] = -0.2;
  json block = json::object();
  block["min"] = -20.0;
  block["max"] = 0.0;
  block["basis"] = json::array({json::array({0.8, 0.9, 1.0})});
  block["coefficients"] = json::array({mag_coeff});
  for (const auto& f : filters) {
    j["filters"][f] = block;
  }

  json lbol_coeff = json::object();
  lbol_coeff["targets"] = json::array({1.0, 1.0, 1.0});
  lbol_coeff["alpha"] = json::array({0.0, 0.0, 0.0});
  lbol_coeff["offset"] = 1.0;
  json lbol = json::object();
  lbol["min"] = 40.0;
  lbol["max"] = 42.0;
  lbol["basis"] = json::array({json::array({1.0, 0.5, 0.0})});
  lbol["coefficients"] = json::array({lbol_coeff});
  j["lbol"] = lbol;
  std::ofstream out(dir / (model + ".json"));
  if (!out) {
    return false;
  }
  out << j.dump(2);
  return static_cast<bool>(out);
}

/**
 * @brief Supernova template with g and r absolute magnitudes over phases -10..50 days.
 */
inline bool write_supernova_fixture(const std::filesystem::path& dir, const std::string& name) {
  std::ofstream out(dir / (name + ".csv"));
  if (!out) {
    return false;
  }
  out << "phase,g,r\n";
  out << "-10,-15.0,-14.5\n";
  out << "0,-19.0,-18.5\n";
  out << "50,-16.0,-16.5\n";
  return static_cast<bool>(out);
}

}  // namespace emsynth::testing
