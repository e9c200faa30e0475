/**
 * @file validation_summary.cpp
 * @brief Cross-site energy and wind distribution error metrics.
 * @author Watosn
 */

#include "windcurtail/curtailment/validation_summary.hpp"

#include <cmath>

#include <Eigen/Dense>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/constants.hpp"

namespace windcurtail::curtailment {
namespace {

Eigen::ArrayXd density_histogram(std::span<const double> values, std::span<const double> edges) {
  const auto bins = static_cast<Eigen::Index>(edges.size() - 1);
  Eigen::ArrayXd counts = Eigen::ArrayXd::Zero(bins);
  for (const double v : values) {
    if (!std::isfinite(v) || v < edges.front() || v > edges.back()) {
      continue;
    }
    Eigen::Index bin = bins - 1;
    for (Eigen::Index i = 0; i < bins; ++i) {
      if (v < edges[static_cast<std::size_t>(i) + 1]) {
        bin = i;
        break;
      }
    }
    counts(bin) += 1.0;
  }

  const double total = counts.sum();
  if (total == 0.0) {
    return Eigen::ArrayXd::Constant(bins, std::nan(""));
  }
  Eigen::ArrayXd widths(bins);
  for (Eigen::Index i = 0; i < bins; ++i) {
    widths(i) = edges[static_cast<std::size_t>(i) + 1] - edges[static_cast<std::size_t>(i)];
  }
  return counts / (total * widths);
}

std::vector<double> to_vector(const Eigen::ArrayXd& a) { return std::vector<double>(a.data(), a.data() + a.size()); }

}  // namespace

double series_energy_mwh(std::span<const double> per_unit_kw, int number_of_units, double hours_per_row) {
  if (number_of_units < 1 || !(hours_per_row > 0.0)) {
    return std::nan("");
  }
  const Eigen::Map<const Eigen::ArrayXd> kw(per_unit_kw.data(), static_cast<Eigen::Index>(per_unit_kw.size()));
  const double sum = kw.isNaN().select(Eigen::ArrayXd::Zero(kw.size()), kw).sum();
  return sum * static_cast<double>(number_of_units) / core::constants::kKwPerMw * hours_per_row;
}

ValidationSummary summarize_validation(std::span<const EnergyComparison> sites) {
  std::vector<double> modeled;
  std::vector<double> observed;
  for (const auto& site : sites) {
    if (std::isnan(site.modeled_mwh) || std::isnan(site.observed_mwh)) {
      spdlog::debug("validation: skipping {} with missing energy", site.site);
      continue;
    }
    modeled.push_back(site.modeled_mwh);
    observed.push_back(site.observed_mwh);
  }
  if (modeled.empty()) {
    return ValidationSummary{.status = core::Status::DataUnavailable,
                             .message = "no site has both modeled and observed energy"};
  }

  const auto n = static_cast<Eigen::Index>(modeled.size());
  const Eigen::Map<const Eigen::ArrayXd> mod(modeled.data(), n);
  const Eigen::Map<const Eigen::ArrayXd> obs(observed.data(), n);
  const Eigen::ArrayXd diff = mod - obs;

  ValidationSummary out{.sites_compared = modeled.size(), .rmse_mwh = std::sqrt(diff.square().mean())};
  const Eigen::Array<bool, Eigen::Dynamic, 1> nonzero = (obs != 0.0);
  const auto usable = nonzero.count();
  if (usable == 0) {
    out.mape_pct = std::nan("");
    out.message = "observed energy is zero at every compared site; MAPE undefined";
    spdlog::warn("validation: {}", out.message);
    return out;
  }
  const Eigen::ArrayXd ratio = (diff / obs).abs();
  out.mape_pct = nonzero.select(ratio, 0.0).sum() / static_cast<double>(usable) * 100.0;
  return out;
}

DistributionComparison compare_wind_distributions(std::span<const double> modeled_mps,
                                                  std::span<const double> observed_mps,
                                                  std::span<const double> bin_edges_mps) {
  if (bin_edges_mps.size() < 2) {
    return DistributionComparison{.status = core::Status::InvalidInput, .message = "at least two bin edges are required"};
  }
  for (std::size_t i = 1; i < bin_edges_mps.size(); ++i) {
    if (!(bin_edges_mps[i] > bin_edges_mps[i - 1])) {
      return DistributionComparison{.status = core::Status::InvalidInput,
                                    .message = fmt::format("bin edges must increase (index {})", i)};
    }
  }

  const Eigen::ArrayXd mod = density_histogram(modeled_mps, bin_edges_mps);
  const Eigen::ArrayXd obs = density_histogram(observed_mps, bin_edges_mps);
  DistributionComparison out{.modeled_density = to_vector(mod), .observed_density = to_vector(obs)};
  if (mod.isNaN().any() || obs.isNaN().any()) {
    out.rmse = std::nan("");
    out.status = core::Status::DataUnavailable;
    out.message = "a series has no wind speeds inside the bin edges";
    return out;
  }
  out.rmse = std::sqrt((mod - obs).square().mean());
  return out;
}

}  // namespace windcurtail::curtailment
