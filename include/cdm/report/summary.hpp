#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "cdm/core/types.hpp"

namespace cdm {

struct Stats {
  double mean{0.0};
  double median{0.0};
  double p95{0.0};
  double min{0.0};
  double max{0.0};
};

// Identifies "the same test" across reports.
struct SummaryKey {
  Section section{Section::None};
  PatternKind type{PatternKind::SequentialAccess};
  double block_size{};
  std::string block_size_unit{};
  uint32_t queue_depth{};
  uint32_t threads{};
  std::string throughput_unit{};

  auto operator<=>(const SummaryKey&) const = default;
};

struct SummaryEntry {
  SummaryKey key{};
  size_t samples{0};
  Stats throughput{};
  Stats latency{};
};

// Groups measurements of all reports by SummaryKey, ordered by key.
std::vector<SummaryEntry> summarize(std::span<const ParsedReport> reports);

void write_summary(std::ostream& out, std::span<const SummaryEntry> entries);

}  // namespace cdm
