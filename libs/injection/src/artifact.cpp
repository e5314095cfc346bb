/**
 * @file artifact.cpp
 * @brief On-disk light-curve artifact format.
 * @author Watosn
 */

#include "emsynth/injection/artifact.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace emsynth::injection {
namespace {

using json = nlohmann::json;

bool parse_hash(const std::string& text, std::uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtoull(text.c_str(), &end, 16);
  return end != text.c_str() && *end == '\0';
}

bool parse_point(const json& item, emsynth::core::LightCurvePoint& out) {
  if (!item.is_array() || (item.size() != 2U && item.size() != 3U)) {
    return false;
  }
  if (!item[0].is_number() || !item[1].is_number()) {
    return false;
  }
  out.time = item[0].get<double>();
  out.mag = item[1].get<double>();
  out.mag_error = 0.0;
  if (item.size() == 3U) {
    if (item[2].is_null()) {
      out.mag_error = std::numeric_limits<double>::infinity();
    } else if (item[2].is_number()) {
      out.mag_error = item[2].get<double>();
    } else {
      return false;
    }
  }
  return std::isfinite(out.time) && std::isfinite(out.mag);
}

bool parse_meta(const json& node, ArtifactMeta& out) {
  if (!node.is_object()) {
    return false;
  }
  const auto schema = node.find("schema");
  const auto index = node.find("index");
  const auto hash = node.find("config_hash");
  const auto trigger = node.find("trigger_time_mjd");
  if (schema == node.end() || !schema->is_string() || index == node.end() || !index->is_number_integer() ||
      hash == node.end() || !hash->is_string() || trigger == node.end() || !trigger->is_number()) {
    return false;
  }
  out.schema = schema->get<std::string>();
  out.index = index->get<emsynth::core::InjectionIndex>();
  out.trigger_time_mjd = trigger->get<double>();
  return parse_hash(hash->get<std::string>(), out.config_hash);
}

}  // namespace

std::string serialize_artifact(const emsynth::core::LightCurve& light_curve, const ArtifactMeta& meta) {
  json root = json::object();
  for (const auto& [filter, points] : light_curve) {
    json series = json::array();
    for (const auto& p : points) {
      if (p.is_upper_limit()) {
        series.push_back(json::array({p.time, p.mag, nullptr}));
      } else {
        series.push_back(json::array({p.time, p.mag, p.mag_error}));
      }
    }
    root[filter] = std::move(series);
  }
  root[kArtifactMetaKey] = {
      {"schema", meta.schema},
      {"index", meta.index},
      {"config_hash", fmt::format("{:016x}", meta.config_hash)},
      {"trigger_time_mjd", meta.trigger_time_mjd},
  };
  return root.dump();
}

ArtifactReadResult parse_artifact(const std::string& text) {
  const auto root = json::parse(text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    return ArtifactReadResult{.status = emsynth::core::Status::CacheIoError};
  }

  ArtifactReadResult out{};
  for (const auto& [key, value] : root.items()) {
    if (key == kArtifactMetaKey) {
      if (!parse_meta(value, out.meta)) {
        return ArtifactReadResult{.status = emsynth::core::Status::CacheIoError};
      }
      out.has_meta = true;
      continue;
    }
    if (!value.is_array()) {
      return ArtifactReadResult{.status = emsynth::core::Status::CacheIoError};
    }
    auto& series = out.light_curve[key];
    series.reserve(value.size());
    for (const auto& item : value) {
      emsynth::core::LightCurvePoint p{};
      if (!parse_point(item, p)) {
        return ArtifactReadResult{.status = emsynth::core::Status::CacheIoError};
      }
      series.push_back(p);
    }
  }
  return out;
}

emsynth::core::Status write_file_atomic(const std::filesystem::path& path, const std::string& contents) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return emsynth::core::Status::CacheIoError;
    }
    out << contents;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return emsynth::core::Status::CacheIoError;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return emsynth::core::Status::CacheIoError;
  }
  return emsynth::core::Status::Ok;
}

}  // namespace emsynth::injection
