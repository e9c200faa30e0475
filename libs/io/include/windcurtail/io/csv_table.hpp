/**
 * @file csv_table.hpp
 * @brief Minimal header-addressed CSV table.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "windcurtail/core/types.hpp"

namespace windcurtail::io {

/**
 * @brief CSV contents with the header row split off.
 */
struct CsvTable {
  std::vector<std::string> header{};
  std::vector<std::vector<std::string>> rows{};
  std::vector<std::size_t> line_numbers{};

  /**
   * @brief Index of the first header matching any candidate (case-insensitive, trimmed).
   */
  [[nodiscard]] std::optional<std::size_t> column(std::initializer_list<std::string_view> candidates) const;
  [[nodiscard]] std::optional<std::size_t> column(std::string_view name) const { return column({name}); }
};

/**
 * @brief Read result with status and reason on failure.
 */
struct CsvRead {
  CsvTable table{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Split one CSV line; double-quoted fields may contain commas and `""` escapes.
 */
[[nodiscard]] std::vector<std::string> split_csv_line(const std::string& line);

/**
 * @brief Read a CSV file whose first non-empty line is the header.
 *
 * Lines starting with `#` (metadata records) are skipped.
 */
[[nodiscard]] CsvRead read_csv(const std::filesystem::path& path);

/**
 * @brief Parse a numeric cell; empty or malformed cells read as NaN.
 */
[[nodiscard]] double parse_cell(std::string_view text);

/**
 * @brief Cell at a column, or an empty view when the row is short.
 */
[[nodiscard]] std::string_view cell(const std::vector<std::string>& row, std::size_t col);

}  // namespace windcurtail::io
