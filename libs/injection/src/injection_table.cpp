/**
 * @file injection_table.cpp
 * @brief Injection parameter table parsing.
 * @author Watosn
 */

#include "emsynth/injection/injection_table.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace emsynth::injection {
namespace {

using json = nlohmann::json;

bool scalar_value(const json& v, double& out) {
  if (v.is_number()) {
    out = v.get<double>();
    return true;
  }
  if (v.is_boolean()) {
    out = v.get<bool>() ? 1.0 : 0.0;
    return true;
  }
  return false;
}

InjectionTable from_columns(const json& columns) {
  InjectionTable table{};
  std::size_t n_rows = 0;
  bool sized = false;
  for (const auto& [name, values] : columns.items()) {
    if (!values.is_array()) {
      return InjectionTable{.status = emsynth::core::Status::InvalidInput};
    }
    if (!sized) {
      n_rows = values.size();
      sized = true;
    } else if (values.size() != n_rows) {
      return InjectionTable{.status = emsynth::core::Status::InvalidInput};
    }
  }

  table.rows.resize(n_rows);
  for (std::size_t r = 0; r < n_rows; ++r) {
    table.rows[r].index = static_cast<emsynth::core::InjectionIndex>(r);
  }
  for (const auto& [name, values] : columns.items()) {
    for (std::size_t r = 0; r < n_rows; ++r) {
      double v = 0.0;
      if (scalar_value(values[r], v)) {
        table.rows[r].parameters[name] = v;
      }
    }
  }
  return table;
}

InjectionTable from_records(const json& records) {
  InjectionTable table{};
  emsynth::core::InjectionIndex index = 0;
  for (const auto& record : records) {
    if (!record.is_object()) {
      return InjectionTable{.status = emsynth::core::Status::InvalidInput};
    }
    InjectionRow row{.index = index++};
    for (const auto& [name, value] : record.items()) {
      double v = 0.0;
      if (scalar_value(value, v)) {
        row.parameters[name] = v;
      }
    }
    table.rows.push_back(std::move(row));
  }
  return table;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    token.erase(0, token.find_first_not_of(" \t\r\""));
    token.erase(token.find_last_not_of(" \t\r\"") + 1U);
    fields.push_back(token);
  }
  return fields;
}

}  // namespace

InjectionTable parse_injection_json(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error&) {
    return InjectionTable{.status = emsynth::core::Status::InvalidInput};
  }

  const json& body = (root.is_object() && root.contains("injections")) ? root.at("injections") : root;
  if (body.is_array()) {
    return from_records(body);
  }
  if (!body.is_object()) {
    return InjectionTable{.status = emsynth::core::Status::InvalidInput};
  }
  if (body.contains("__dataframe__")) {
    if (!body.contains("content") || !body.at("content").is_object()) {
      return InjectionTable{.status = emsynth::core::Status::InvalidInput};
    }
    return from_columns(body.at("content"));
  }
  return from_columns(body);
}

InjectionTable parse_injection_csv(std::istream& in) {
  InjectionTable table{};
  std::string line;
  std::vector<std::string> header;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] != '#') {
      header = split_csv_line(line);
      break;
    }
  }
  if (header.empty()) {
    return InjectionTable{.status = emsynth::core::Status::InvalidInput};
  }

  emsynth::core::InjectionIndex index = 0;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() != header.size()) {
      return InjectionTable{.status = emsynth::core::Status::InvalidInput};
    }
    InjectionRow row{.index = index++};
    for (std::size_t c = 0; c < fields.size(); ++c) {
      if (fields[c].empty()) {
        continue;
      }
      char* end = nullptr;
      const double v = std::strtod(fields[c].c_str(), &end);
      if (end != fields[c].c_str() && *end == '\0') {
        row.parameters[header[c]] = v;
      }
    }
    table.rows.push_back(std::move(row));
  }
  return table;
}

InjectionTable load_injection_table(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return InjectionTable{.status = emsynth::core::Status::DataUnavailable};
  }
  if (path.extension() == ".json") {
    const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return parse_injection_json(text);
  }
  return parse_injection_csv(in);
}

}  // namespace emsynth::injection
