#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cdm/core/types.hpp"

namespace cdm {

inline constexpr std::array<std::string_view, 19> kTableColumns{
    "date",      "test",           "time",   "os",      "mode",
    "profile",   "comment",        "read_write_mix",    "type",
    "blocksize", "unit_blocksize", "queues", "threads", "rate",
    "unit_rate", "iops",           "unit_iops",         "latency",
    "unit_latency",
};

// One measurement with the run metadata repeated alongside it.
struct TableRow {
  std::string source{};

  std::optional<std::string> date{};
  std::optional<std::string> test{};
  std::optional<std::string> time{};
  std::optional<std::string> os{};
  std::optional<std::string> mode{};
  std::optional<std::string> profile{};
  std::optional<std::string> comment{};

  Section read_write_mix{Section::None};
  std::string type{};
  double blocksize{};
  std::string unit_blocksize{};
  uint32_t queues{};
  uint32_t threads{};
  double rate{};
  std::string unit_rate{};
  double iops{};
  std::string unit_iops{};
  double latency{};
  std::string unit_latency{};
};

// Rows for every read measurement, then write, then mix, each in source order.
std::vector<TableRow> flatten(const BenchmarkRun& run, const std::string& source = {});

struct CsvOptions {
  char delimiter{','};
  bool header{true};
  // Prepends a "source" column holding TableRow::source.
  bool include_source{false};
};

void write_csv(std::ostream& out, std::span<const TableRow> rows, const CsvOptions& opts = {});

}  // namespace cdm
