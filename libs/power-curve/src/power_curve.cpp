/**
 * @file power_curve.cpp
 * @brief Power curve interpolation, validation and loading.
 * @author Watosn
 */

#include "windcurtail/curve/power_curve.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace windcurtail::curve {
namespace {

using core::PowerCurveSample;

double lerp(double x0, double y0, double x1, double y1, double x) {
  if (x1 == x0) {
    return y1;
  }
  return y0 + (x - x0) * (y1 - y0) / (x1 - x0);
}

std::vector<PowerCurveSample> build_inverse_branch(const std::vector<PowerCurveSample>& forward) {
  std::vector<PowerCurveSample> out;
  for (const auto& s : forward) {
    if (!std::isfinite(s.power_kw) || !std::isfinite(s.wind_speed_mps)) {
      continue;
    }
    // Equal power keeps the earlier (lower) wind speed, the bottom plateau included.
    if (out.empty() || s.power_kw > out.back().power_kw) {
      out.push_back(s);
    } else if (s.power_kw < out.back().power_kw) {
      break;
    }
  }
  return out;
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  for (const char c : line) {
    if (c == ' ' || c == '\t' || c == ',' || c == ';' || c == '\r') {
      if (!token.empty()) {
        fields.push_back(token);
        token.clear();
      }
    } else {
      token.push_back(c);
    }
  }
  if (!token.empty()) {
    fields.push_back(token);
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

}  // namespace

PowerCurve::PowerCurve(std::vector<core::PowerCurveSample> samples) : samples_(std::move(samples)) {
  forward_ = samples_;
  forward_.erase(std::remove_if(forward_.begin(), forward_.end(),
                                [](const PowerCurveSample& s) { return std::isnan(s.wind_speed_mps); }),
                 forward_.end());
  std::stable_sort(forward_.begin(), forward_.end(),
                   [](const PowerCurveSample& a, const PowerCurveSample& b) { return a.wind_speed_mps < b.wind_speed_mps; });
  inverse_ = build_inverse_branch(forward_);
}

double PowerCurve::lookup_power(double wind_speed_mps) const {
  if (forward_.empty() || !std::isfinite(wind_speed_mps)) {
    return 0.0;
  }
  if (wind_speed_mps < forward_.front().wind_speed_mps || wind_speed_mps > forward_.back().wind_speed_mps) {
    return 0.0;
  }
  const auto it = std::upper_bound(forward_.begin(), forward_.end(), wind_speed_mps,
                                   [](double v, const PowerCurveSample& s) { return v < s.wind_speed_mps; });
  double p = 0.0;
  if (it == forward_.end()) {
    p = forward_.back().power_kw;
  } else {
    const auto& hi = *it;
    const auto& lo = *(it - 1);
    p = lerp(lo.wind_speed_mps, lo.power_kw, hi.wind_speed_mps, hi.power_kw, wind_speed_mps);
  }
  return std::isfinite(p) ? std::max(0.0, p) : 0.0;
}

double PowerCurve::lookup_wind_speed(double power_kw) const {
  if (inverse_.empty() || !std::isfinite(power_kw)) {
    return core::kMissing;
  }
  if (power_kw < inverse_.front().power_kw || power_kw > inverse_.back().power_kw) {
    return core::kMissing;
  }
  const auto it = std::lower_bound(inverse_.begin(), inverse_.end(), power_kw,
                                   [](const PowerCurveSample& s, double p) { return s.power_kw < p; });
  if (it == inverse_.begin()) {
    return it->wind_speed_mps;
  }
  const auto& hi = *it;
  const auto& lo = *(it - 1);
  return lerp(lo.power_kw, lo.wind_speed_mps, hi.power_kw, hi.wind_speed_mps, power_kw);
}

CurveValidation PowerCurve::validate() const {
  CurveValidation out{};
  if (samples_.size() < 2U) {
    out.message = "power curve needs at least two (wind speed, power) samples";
    spdlog::error(out.message);
    return out;
  }
  for (std::size_t i = 0; i < samples_.size(); ++i) {
    if (samples_[i].power_kw < 0.0 || samples_[i].wind_speed_mps < 0.0) {
      out.non_negative_power = false;
    }
    if (i > 0 && !(samples_[i].wind_speed_mps >= samples_[i - 1].wind_speed_mps)) {
      out.monotone_wind_speed = false;
    }
  }
  if (!out.non_negative_power) {
    spdlog::warn("power curve contains negative values");
  }
  if (!out.monotone_wind_speed) {
    spdlog::warn("wind speeds in power curve are not monotonically increasing");
  }
  out.valid = true;
  return out;
}

PowerCurveLoad PowerCurve::load_table(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return PowerCurveLoad{.status = core::Status::DataUnavailable,
                          .message = fmt::format("power curve file not found: {}", path.string())};
  }

  std::vector<PowerCurveSample> samples;
  std::string line;
  std::size_t line_no = 0;
  bool first_content = true;
  while (std::getline(in, line)) {
    ++line_no;
    const auto fields = split_fields(line);
    if (fields.empty()) {
      continue;
    }
    double ws = 0.0;
    double p = 0.0;
    const bool numeric_first = parse_double(fields[0], ws);
    if (first_content && !numeric_first) {
      first_content = false;
      continue;
    }
    first_content = false;
    if (fields.size() < 2U) {
      return PowerCurveLoad{.status = core::Status::InvalidInput,
                            .message = fmt::format("{}:{}: power curve must have at least 2 columns (wind speed, power)",
                                                   path.string(), line_no)};
    }
    if (!numeric_first || !parse_double(fields[1], p)) {
      return PowerCurveLoad{.status = core::Status::InvalidInput,
                            .message = fmt::format("{}:{}: non-numeric power curve row", path.string(), line_no)};
    }
    samples.push_back(PowerCurveSample{.wind_speed_mps = ws, .power_kw = p});
  }

  PowerCurve curve(std::move(samples));
  const auto check = curve.validate();
  if (!check.valid) {
    return PowerCurveLoad{.status = core::Status::InvalidInput, .message = fmt::format("{}: {}", path.string(), check.message)};
  }
  spdlog::info("loaded power curve {} ({} samples, rated {} kW)", path.filename().string(), curve.size(), curve.rated_power_kw());
  return PowerCurveLoad{.curve = std::move(curve), .status = core::Status::Ok};
}

}  // namespace windcurtail::curve
