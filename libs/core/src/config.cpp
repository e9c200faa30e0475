/**
 * @file config.cpp
 * @brief Model configuration parsing and validation.
 * @author Watosn
 */

#include "windcurtail/core/config.hpp"

#include <array>
#include <cmath>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "windcurtail/core/calendar.hpp"

namespace windcurtail::core {
namespace {

constexpr std::array<std::string_view, 16> kKnownKeys{
    "reference_height_m",      "rho_std_kg_m3",         "gas_constant_j_kgk",
    "loss_fraction",           "cut_in_thresholds_mps", "season_start",
    "season_end",              "year",                  "buffer_hours",
    "smart_min_temperature_c", "smart_max_precipitation_mm",
    "density_correction",      "wind_profile",          "power_law_alpha",
    "wind_speed_conversion",   "observed_power_scale_kw"};

bool is_known_key(std::string_view key) {
  for (const auto k : kKnownKeys) {
    if (k == key) {
      return true;
    }
  }
  return false;
}

ModelConfigLoad fail(Status status, std::string message) {
  return ModelConfigLoad{.status = status, .message = std::move(message)};
}

template <typename T>
void read_if_present(const YAML::Node& root, const char* key, T& field) {
  if (const YAML::Node node = root[key]) {
    field = node.template as<T>();
  }
}

// Month-day boundary such as "07-15"; returns false when the text is not a calendar day.
bool read_month_day(const YAML::Node& root, const char* key, MonthDay& field) {
  if (const YAML::Node node = root[key]) {
    const auto md = parse_month_day(node.as<std::string>());
    if (!md.has_value()) {
      return false;
    }
    field = *md;
  }
  return true;
}

// Throws YAML::Exception for values of the wrong type; the caller maps that to InvalidInput.
ModelConfigLoad from_yaml(const YAML::Node& root) {
  ModelConfigLoad out{};
  if (root.IsNull()) {
    return out;
  }
  if (!root.IsMap()) {
    return fail(Status::InvalidInput, "config must be a mapping of key: value pairs");
  }

  for (const auto& entry : root) {
    const auto key = entry.first.as<std::string>();
    if (!is_known_key(key)) {
      spdlog::warn("config key '{}' (line {}) is not recognized and is ignored", key, entry.first.Mark().line + 1);
    }
  }

  auto& c = out.config;
  read_if_present(root, "reference_height_m", c.reference_height_m);
  read_if_present(root, "rho_std_kg_m3", c.rho_std_kg_m3);
  read_if_present(root, "gas_constant_j_kgk", c.gas_constant_j_kgk);
  read_if_present(root, "loss_fraction", c.loss_fraction);
  read_if_present(root, "year", c.year);
  read_if_present(root, "buffer_hours", c.buffer_hours);
  read_if_present(root, "smart_min_temperature_c", c.smart_min_temperature_c);
  read_if_present(root, "smart_max_precipitation_mm", c.smart_max_precipitation_mm);
  read_if_present(root, "power_law_alpha", c.power_law_alpha);
  read_if_present(root, "wind_speed_conversion", c.wind_speed_conversion);
  read_if_present(root, "observed_power_scale_kw", c.observed_power_scale_kw);

  if (const YAML::Node node = root["cut_in_thresholds_mps"]) {
    const auto values = node.IsSequence() ? node.as<std::vector<double>>() : std::vector<double>{node.as<double>()};
    c.cut_in_thresholds_mps = std::set<double>(values.begin(), values.end());
  }
  if (!read_month_day(root, "season_start", c.season_start)) {
    return fail(Status::InvalidInput,
                fmt::format("season_start '{}' is not a MM-DD day", root["season_start"].as<std::string>()));
  }
  if (!read_month_day(root, "season_end", c.season_end)) {
    return fail(Status::InvalidInput,
                fmt::format("season_end '{}' is not a MM-DD day", root["season_end"].as<std::string>()));
  }

  if (const YAML::Node node = root["density_correction"]) {
    const auto value = node.as<std::string>();
    if (value == "standard") {
      c.density_correction = DensityCorrection::StandardDensity;
    } else if (value == "site") {
      c.density_correction = DensityCorrection::SiteDensity;
    } else {
      return fail(Status::InvalidInput, fmt::format("density_correction must be standard or site, got '{}'", value));
    }
  }
  if (const YAML::Node node = root["wind_profile"]) {
    const auto value = node.as<std::string>();
    if (value == "log") {
      c.wind_profile = WindProfileLaw::Logarithmic;
    } else if (value == "power") {
      c.wind_profile = WindProfileLaw::PowerLaw;
    } else {
      return fail(Status::InvalidInput, fmt::format("wind_profile must be log or power, got '{}'", value));
    }
  }

  const std::string problem = validate_model_config(c);
  if (!problem.empty()) {
    return fail(Status::InvalidInput, problem);
  }
  return out;
}

}  // namespace

std::string validate_model_config(const ModelConfig& config) {
  if (!(config.reference_height_m > 0.0)) {
    return "reference_height_m must be positive";
  }
  if (!(config.rho_std_kg_m3 > 0.0) || !(config.gas_constant_j_kgk > 0.0)) {
    return "air density constants must be positive";
  }
  if (!(config.loss_fraction >= 0.0 && config.loss_fraction < 1.0)) {
    return "loss_fraction must lie in [0, 1)";
  }
  if (config.cut_in_thresholds_mps.empty()) {
    return "at least one cut-in threshold is required";
  }
  if (!std::isfinite(config.power_law_alpha)) {
    return "power_law_alpha must be finite";
  }
  if (!(config.buffer_hours >= 0.0)) {
    return "buffer_hours must not be negative";
  }
  if (!(config.wind_speed_conversion > 0.0) || !(config.observed_power_scale_kw > 0.0)) {
    return "unit conversion factors must be positive";
  }
  const auto start = anchor_month_day(config.season_start, config.year);
  const auto end = anchor_month_day(config.season_end, config.year);
  if (!start.has_value() || !end.has_value()) {
    return fmt::format("season boundaries do not exist in year {}", config.year);
  }
  if (*end < *start) {
    return "season_end precedes season_start";
  }
  return {};
}

ModelConfigLoad parse_model_config(const std::string& text) {
  try {
    return from_yaml(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    return fail(Status::InvalidInput, fmt::format("config: {}", e.what()));
  }
}

ModelConfigLoad load_model_config(const std::filesystem::path& path) {
  try {
    auto out = from_yaml(YAML::LoadFile(path.string()));
    if (out.status == Status::Ok) {
      spdlog::info("loaded model config from {}", path.string());
    } else {
      out.message = fmt::format("{}: {}", path.string(), out.message);
    }
    return out;
  } catch (const YAML::BadFile&) {
    return fail(Status::DataUnavailable, fmt::format("cannot open config file {}", path.string()));
  } catch (const YAML::Exception& e) {
    return fail(Status::InvalidInput, fmt::format("{}: {}", path.string(), e.what()));
  }
}

const char* density_correction_to_string(DensityCorrection mode) {
  switch (mode) {
    case DensityCorrection::StandardDensity:
      return "standard";
    case DensityCorrection::SiteDensity:
      return "site";
    default:
      return "unknown";
  }
}

const char* wind_profile_to_string(WindProfileLaw law) {
  switch (law) {
    case WindProfileLaw::Logarithmic:
      return "log";
    case WindProfileLaw::PowerLaw:
      return "power";
    default:
      return "unknown";
  }
}

}  // namespace windcurtail::core
