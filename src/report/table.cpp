#include "cdm/report/table.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace cdm {
namespace {

void append_rows(std::vector<TableRow>& rows,
                 const BenchmarkRun& run,
                 const std::string& source,
                 Section section,
                 const std::vector<Measurement>& measurements) {
  for (const auto& m : measurements) {
    TableRow row{};
    row.source = source;
    row.date = run.date;
    row.test = run.test_label;
    row.time = run.measurement_time;
    row.os = run.operating_system;
    row.mode = run.mode;
    row.profile = run.profile;
    row.comment = run.comment;
    row.read_write_mix = section;
    row.type = std::string(pattern_label(m));
    row.blocksize = m.block_size;
    row.unit_blocksize = m.block_size_unit;
    row.queues = m.queue_depth;
    row.threads = m.threads;
    row.rate = m.throughput;
    row.unit_rate = m.throughput_unit;
    row.iops = m.iops;
    row.unit_iops = m.iops_unit;
    row.latency = m.latency;
    row.unit_latency = m.latency_unit;
    rows.push_back(std::move(row));
  }
}

class CsvLine {
 public:
  explicit CsvLine(char delimiter) : delimiter_(delimiter) {}

  void text(std::string_view value) {
    separate();
    if (!needs_quotes(value)) {
      buf_.append(value);
      return;
    }
    // RFC 4180: wrap in quotes, double embedded quotes.
    buf_.push_back('"');
    for (const char c : value) {
      if (c == '"') {
        buf_.push_back('"');
      }
      buf_.push_back(c);
    }
    buf_.push_back('"');
  }

  void optional_text(const std::optional<std::string>& value) {
    if (value) {
      text(*value);
    } else {
      separate();
    }
  }

  template <typename T>
  void number(T value) {
    separate();
    constexpr size_t kMaxDigits = 32;
    const size_t old_size = buf_.size();
    buf_.resize(old_size + kMaxDigits);
    const auto [ptr, ec] =
        std::to_chars(buf_.data() + old_size, buf_.data() + old_size + kMaxDigits, value);
    buf_.resize(ec == std::errc{} ? static_cast<size_t>(ptr - buf_.data()) : old_size);
  }

  void flush(std::ostream& out) {
    buf_.push_back('\n');
    out.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    buf_.clear();
    first_ = true;
  }

 private:
  void separate() {
    if (!first_) {
      buf_.push_back(delimiter_);
    }
    first_ = false;
  }

  bool needs_quotes(std::string_view value) const {
    if (!value.empty() && (value.front() == ' ' || value.back() == ' ')) {
      return true;
    }
    for (const char c : value) {
      if (c == delimiter_ || c == '"' || c == '\n' || c == '\r') {
        return true;
      }
    }
    return false;
  }

  char delimiter_;
  bool first_{true};
  std::string buf_;
};

}  // namespace

std::vector<TableRow> flatten(const BenchmarkRun& run, const std::string& source) {
  std::vector<TableRow> rows;
  rows.reserve(run.read.size() + run.write.size() + run.mix.size());
  append_rows(rows, run, source, Section::Read, run.read);
  append_rows(rows, run, source, Section::Write, run.write);
  append_rows(rows, run, source, Section::Mix, run.mix);
  return rows;
}

void write_csv(std::ostream& out, std::span<const TableRow> rows, const CsvOptions& opts) {
  CsvLine line(opts.delimiter);

  if (opts.header) {
    if (opts.include_source) {
      line.text("source");
    }
    for (const auto column : kTableColumns) {
      line.text(column);
    }
    line.flush(out);
  }

  for (const auto& row : rows) {
    if (opts.include_source) {
      line.text(row.source);
    }
    line.optional_text(row.date);
    line.optional_text(row.test);
    line.optional_text(row.time);
    line.optional_text(row.os);
    line.optional_text(row.mode);
    line.optional_text(row.profile);
    line.optional_text(row.comment);
    line.text(section_name(row.read_write_mix));
    line.text(row.type);
    line.number(row.blocksize);
    line.text(row.unit_blocksize);
    line.number(row.queues);
    line.number(row.threads);
    line.number(row.rate);
    line.text(row.unit_rate);
    line.number(row.iops);
    line.text(row.unit_iops);
    line.number(row.latency);
    line.text(row.unit_latency);
    line.flush(out);
  }
}

}  // namespace cdm
