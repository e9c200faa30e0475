/**
 * @file series_writer.hpp
 * @brief CSV / JSON-lines writers for estimated series and loss summaries.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "windcurtail/core/types.hpp"
#include "windcurtail/curtailment/curtailment_engine.hpp"
#include "windcurtail/curtailment/loss_summary.hpp"

namespace windcurtail::io {

enum class OutputFormat : unsigned char { Csv, JsonLines };

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text);

/**
 * @brief Leading metadata record: schema name plus free-form key/value pairs.
 */
struct RunMetadata {
  std::string schema{};
  std::vector<std::pair<std::string, std::string>> fields{};
};

[[nodiscard]] const char* status_to_string(core::Status status);

/**
 * @brief Column suffix for a threshold, `5.0` for whole values and shortest form otherwise.
 */
[[nodiscard]] std::string threshold_label(double threshold_mps);

/**
 * @brief Write the forward series; all spans must have the same length.
 *
 * CSV columns: time, temp_c, precip_mm, wind_ref_mps, wind_hub_mps, power_kw, density_kg_m3,
 * adjustment_factor, phase, then `blanket_<T>` and `smart_<T>` per threshold.
 */
core::Status write_forward_series(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                  std::span<const core::WeatherSample> weather,
                                  std::span<const core::PowerEstimate> estimates,
                                  std::span<const curtailment::CorrectedRow> corrected);

/**
 * @brief Write the back-calculated series; all spans must have the same length.
 *
 * CSV columns: time, temp_c, precip_mm, observed_power_kw, per_unit_power_kw, wind_hub_mps,
 * density_kg_m3, phase, then the per-threshold columns.
 */
core::Status write_backcalc_series(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                   std::span<const core::WeatherSample> weather,
                                   std::span<const double> farm_power_kw,
                                   std::span<const core::BackCalcEstimate> estimates,
                                   std::span<const curtailment::CorrectedRow> corrected);

/**
 * @brief One row per threshold.
 */
core::Status write_loss_summary(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                const curtailment::LossSummary& summary);

}  // namespace windcurtail::io
