/**
 * @file sun_table_reader.hpp
 * @brief Sunrise/sunset table reader.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "windcurtail/curtailment/curtailment_engine.hpp"

namespace windcurtail::io {

struct SunTable {
  std::vector<curtailment::SunDay> days{};
  std::size_t skipped_rows{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Read sun times of one turbine, re-anchoring every date to `year`.
 *
 * Columns: `date` (`Mon DD YYYY`), `rise`, `set` (`HH:MM[:SS]`), `turbine_name` (exact match).
 * Rows whose date does not exist in `year` (02-29) or whose times do not parse are skipped.
 */
[[nodiscard]] SunTable read_sun_table(const std::filesystem::path& path, const std::string& turbine_name, int year);

}  // namespace windcurtail::io
