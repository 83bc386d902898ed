#include "report/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cdm::detail {
namespace {

// Linear interpolation between the closest ranks; `sorted` is non-empty.
double percentile(const std::vector<double>& sorted, double fraction) {
  const double rank = fraction * static_cast<double>(sorted.size() - 1);
  const double below = std::floor(rank);
  const auto lower = static_cast<size_t>(below);
  const size_t upper = std::min(lower + 1, sorted.size() - 1);
  const double weight = rank - below;
  return sorted[lower] + (sorted[upper] - sorted[lower]) * weight;
}

}  // namespace

Stats calc_stats(std::vector<double> values) {
  if (values.empty()) {
    return Stats{};
  }
  std::sort(values.begin(), values.end());

  const double total = std::accumulate(values.begin(), values.end(), 0.0);
  return Stats{
      .mean = total / static_cast<double>(values.size()),
      .median = percentile(values, 0.50),
      .p95 = percentile(values, 0.95),
      .min = values.front(),
      .max = values.back(),
  };
}

}  // namespace cdm::detail
