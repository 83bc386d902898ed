#include "cdm/report/summary.hpp"

#include <format>
#include <map>
#include <utility>

#include "report/stats.hpp"

namespace cdm {
namespace {

struct Samples {
  std::vector<double> throughput;
  std::vector<double> latency;
};

void collect(std::map<SummaryKey, Samples>& groups,
             Section section,
             const std::vector<Measurement>& measurements) {
  for (const auto& m : measurements) {
    SummaryKey key{};
    key.section = section;
    key.type = m.pattern;
    key.block_size = m.block_size;
    key.block_size_unit = m.block_size_unit;
    key.queue_depth = m.queue_depth;
    key.threads = m.threads;
    key.throughput_unit = m.throughput_unit;

    auto& samples = groups[std::move(key)];
    samples.throughput.push_back(m.throughput);
    samples.latency.push_back(m.latency);
  }
}

}  // namespace

std::vector<SummaryEntry> summarize(std::span<const ParsedReport> reports) {
  std::map<SummaryKey, Samples> groups;
  for (const auto& report : reports) {
    collect(groups, Section::Read, report.run.read);
    collect(groups, Section::Write, report.run.write);
    collect(groups, Section::Mix, report.run.mix);
  }

  std::vector<SummaryEntry> out;
  out.reserve(groups.size());
  for (auto& [key, samples] : groups) {
    SummaryEntry entry{};
    entry.key = key;
    entry.samples = samples.throughput.size();
    entry.throughput = detail::calc_stats(std::move(samples.throughput));
    entry.latency = detail::calc_stats(std::move(samples.latency));
    out.push_back(std::move(entry));
  }
  return out;
}

void write_summary(std::ostream& out, std::span<const SummaryEntry> entries) {
  out << "=== Summary (mean/median/p95/min/max) ===\n";
  for (const auto& e : entries) {
    const auto& k = e.key;
    out << std::format("{:<5} {} {}{} (Q={}, T={}) n={}: {:.3f} / {:.3f} / {:.3f} / {:.3f} / {:.3f} {}\n",
                       section_name(k.section),
                       pattern_kind_name(k.type),
                       k.block_size,
                       k.block_size_unit,
                       k.queue_depth,
                       k.threads,
                       e.samples,
                       e.throughput.mean,
                       e.throughput.median,
                       e.throughput.p95,
                       e.throughput.min,
                       e.throughput.max,
                       k.throughput_unit);
  }
}

}  // namespace cdm
