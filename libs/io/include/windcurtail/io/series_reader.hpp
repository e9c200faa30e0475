/**
 * @file series_reader.hpp
 * @brief Reader for previously written forward / back-calc series.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "windcurtail/curtailment/curtailment_engine.hpp"

namespace windcurtail::io {

struct CorrectedSeries {
  std::vector<curtailment::CorrectedRow> rows{};
  std::string base_column{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Rebuild corrected rows from a CSV written by the series writers.
 *
 * The uncorrected value is taken from `power_kw` (forward) or `per_unit_power_kw` (back-calc).
 * Every `blanket_<T>` column needs a matching `smart_<T>` column.
 */
[[nodiscard]] CorrectedSeries read_corrected_series(const std::filesystem::path& path);

}  // namespace windcurtail::io
