#include "cdm/report/output.hpp"

#include <format>
#include <optional>
#include <vector>

namespace cdm {
namespace {

std::string json_string(const std::optional<std::string>& value) {
  return value ? "\"" + json_escape(*value) + "\"" : std::string("null");
}

std::string measurement_json(const Measurement& m) {
  return std::format(
      "{{\"type\": \"{}\", \"blocksize\": {}, \"unit_blocksize\": \"{}\", \"queues\": {}, "
      "\"threads\": {}, \"rate\": {}, \"unit_rate\": \"{}\", \"iops\": {}, "
      "\"unit_iops\": \"{}\", \"latency\": {}, \"unit_latency\": \"{}\"}}",
      json_escape(pattern_label(m)),
      m.block_size,
      json_escape(m.block_size_unit),
      m.queue_depth,
      m.threads,
      m.throughput,
      json_escape(m.throughput_unit),
      m.iops,
      json_escape(m.iops_unit),
      m.latency,
      json_escape(m.latency_unit));
}

void write_measurements(std::ostream& out,
                        const char* name,
                        const std::vector<Measurement>& measurements,
                        bool last) {
  out << "    \"" << name << "\": [";
  for (size_t i = 0; i < measurements.size(); ++i) {
    out << (i == 0 ? "\n      " : ",\n      ") << measurement_json(measurements[i]);
  }
  out << (measurements.empty() ? "]" : "\n    ]") << (last ? "\n" : ",\n");
}

void write_section_text(std::ostream& out,
                        const char* header,
                        const std::vector<Measurement>& measurements) {
  if (measurements.empty()) {
    return;
  }
  out << "[" << header << "]\n";
  for (const auto& m : measurements) {
    out << std::format("  {} {}{} (Q= {}, T= {}): {} {} [{} {}] <{} {}>\n",
                       pattern_label(m),
                       m.block_size,
                       m.block_size_unit,
                       m.queue_depth,
                       m.threads,
                       m.throughput,
                       m.throughput_unit,
                       m.iops,
                       m.iops_unit,
                       m.latency,
                       m.latency_unit);
  }
}

void write_metadata_text(std::ostream& out, const char* label, const std::optional<std::string>& value) {
  if (value) {
    out << label << ": " << *value << "\n";
  }
}

}  // namespace

std::string json_escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += std::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

void write_json(std::ostream& out, std::span<const ParsedReport> reports) {
  out << "[";
  for (size_t i = 0; i < reports.size(); ++i) {
    const auto& report = reports[i];
    const auto& run = report.run;
    out << (i == 0 ? "\n" : ",\n");
    out << "  {\n";
    out << "    \"source\": \"" << json_escape(report.source) << "\",\n";
    out << std::format("    \"digest\": \"0x{:016x}\",\n", report.digest);
    out << "    \"date\": " << json_string(run.date) << ",\n";
    out << "    \"test\": " << json_string(run.test_label) << ",\n";
    out << "    \"time\": " << json_string(run.measurement_time) << ",\n";
    out << "    \"os\": " << json_string(run.operating_system) << ",\n";
    out << "    \"mode\": " << json_string(run.mode) << ",\n";
    out << "    \"profile\": " << json_string(run.profile) << ",\n";
    out << "    \"comment\": " << json_string(run.comment) << ",\n";
    write_measurements(out, "read", run.read, false);
    write_measurements(out, "write", run.write, false);
    write_measurements(out, "mix", run.mix, true);
    out << "  }";
  }
  out << (reports.empty() ? "]\n" : "\n]\n");
}

void write_text(std::ostream& out, const ParsedReport& report) {
  const auto& run = report.run;
  out << std::format("== {} (digest 0x{:016x}, {} lines)\n", report.source, report.digest,
                     report.line_count);
  write_section_text(out, "Read", run.read);
  write_section_text(out, "Write", run.write);
  write_section_text(out, "Mix", run.mix);
  write_metadata_text(out, "Profile", run.profile);
  write_metadata_text(out, "Test", run.test_label);
  write_metadata_text(out, "Mode", run.mode);
  write_metadata_text(out, "Time", run.measurement_time);
  write_metadata_text(out, "Date", run.date);
  write_metadata_text(out, "OS", run.operating_system);
  write_metadata_text(out, "Comment", run.comment);
}

}  // namespace cdm
