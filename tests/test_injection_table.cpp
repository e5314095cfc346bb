/**
 * @file test_injection_table.cpp
 * @brief Injection file parsing tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "emsynth/injection/injection_table.hpp"
#include "test_fixtures.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace emsynth;
  namespace fs = std::filesystem;

  const auto dataframe = injection::parse_injection_json(R"({
    "injections": {
      "__dataframe__": true,
      "content": {
        "geocent_time": [1187008882.43, 1187008900.0],
        "luminosity_distance": [40.0, 120.0],
        "simulation_id": ["a", "b"],
        "flag": [true, false]
      }
    }
  })");
  if (dataframe.status != core::Status::Ok || dataframe.rows.size() != 2U || dataframe.rows[1].index != 1 ||
      !approx(dataframe.rows[1].parameters.at("luminosity_distance"), 120.0) ||
      dataframe.rows[0].parameters.count("simulation_id") != 0U ||
      !approx(dataframe.rows[0].parameters.at("flag"), 1.0)) {
    spdlog::error("bilby dataframe layout failed");
    return 1;
  }

  const auto columns = injection::parse_injection_json(R"({"injections": {"geocent_time": [1.0, 2.0, 3.0]}})");
  if (columns.status != core::Status::Ok || columns.rows.size() != 3U ||
      !approx(columns.rows[2].parameters.at("geocent_time"), 3.0)) {
    spdlog::error("column layout failed");
    return 2;
  }

  const auto records = injection::parse_injection_json(
      R"({"injections": [{"geocent_time_x": 5.0, "mej": 0.01}, {"geocent_time": 6.0}]})");
  if (records.status != core::Status::Ok || records.rows.size() != 2U ||
      !approx(records.rows[0].parameters.at("mej"), 0.01) || records.rows[1].parameters.size() != 1U) {
    spdlog::error("record layout failed");
    return 3;
  }

  if (injection::parse_injection_json(R"({"injections": {"a": [1, 2], "b": [1]}})").status !=
          core::Status::InvalidInput ||
      injection::parse_injection_json("{not json").status != core::Status::InvalidInput) {
    spdlog::error("malformed JSON tables must be rejected");
    return 4;
  }

  std::istringstream csv("geocent_time,luminosity_distance,label\n1187008882.43,40,x\n# comment\n1187008900,,y\n");
  const auto parsed = injection::parse_injection_csv(csv);
  if (parsed.status != core::Status::Ok || parsed.rows.size() != 2U ||
      !approx(parsed.rows[0].parameters.at("luminosity_distance"), 40.0) ||
      parsed.rows[1].parameters.count("luminosity_distance") != 0U || parsed.rows[0].parameters.count("label") != 0U) {
    spdlog::error("csv table failed");
    return 5;
  }
  std::istringstream ragged("a,b\n1\n");
  if (injection::parse_injection_csv(ragged).status != core::Status::InvalidInput) {
    spdlog::error("ragged csv must be rejected");
    return 6;
  }

  const auto dir = testing::make_temp_dir("injection");
  {
    std::ofstream out(dir / "injection.json");
    out << R"({"injections": [{"geocent_time": 1.0}]})";
  }
  if (injection::load_injection_table(dir / "injection.json").rows.size() != 1U ||
      injection::load_injection_table(dir / "absent.json").status != core::Status::DataUnavailable) {
    spdlog::error("file loading failed");
    return 7;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
