/**
 * @file injection_table.hpp
 * @brief Injection parameter table loading (JSON or CSV).
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "emsynth/core/types.hpp"

namespace emsynth::injection {

/**
 * @brief One injection: its row index and parameters.
 */
struct InjectionRow {
  emsynth::core::InjectionIndex index{};
  emsynth::core::ParameterSet parameters{};
};

/**
 * @brief All injections in file order.
 */
struct InjectionTable {
  std::vector<InjectionRow> rows{};
  emsynth::core::Status status{emsynth::core::Status::Ok};
};

/**
 * @brief Parse a JSON injection document.
 *
 * Accepted layouts under the top-level `injections` key (or at the root):
 * a bilby dataframe `{"__dataframe__": true, "content": {col: [...]}}`, a
 * column mapping `{col: [...]}`, or a list of row objects. Numeric and
 * boolean values are kept; other value types are skipped.
 */
InjectionTable parse_injection_json(const std::string& text);

/**
 * @brief Parse a comma-separated table with a header row.
 */
InjectionTable parse_injection_csv(std::istream& in);

/**
 * @brief Load `path`, choosing JSON for a `.json` extension and CSV otherwise.
 * @return `DataUnavailable` if unreadable, `InvalidInput` if malformed.
 */
InjectionTable load_injection_table(const std::filesystem::path& path);

}  // namespace emsynth::injection
