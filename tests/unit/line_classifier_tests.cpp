#include <cmath>
#include <format>
#include <iostream>
#include <string_view>
#include <utility>
#include <variant>

#include "cdm/core/error.hpp"
#include "cdm/parser/line_classifier.hpp"

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

bool test_measurement_fields() {
  const auto match = cdm::classify_line(
      "  RND    4KiB (Q= 32, T= 1):   269.406 MB/s [  65772.9 IOPS] <   470.58 us>");
  if (!match) {
    std::cerr << std::format("classify failed: {}\n", match.error().what());
    return false;
  }
  const auto* line = std::get_if<cdm::MeasurementLine>(&*match);
  if (line == nullptr) {
    std::cerr << std::format("expected a measurement line\n");
    return false;
  }

  const auto& m = line->measurement;
  if (m.pattern != cdm::PatternKind::RandomAccess || !near(m.block_size, 4.0) ||
      m.block_size_unit != "KiB" || m.queue_depth != 32 || m.threads != 1) {
    std::cerr << std::format("measurement test parameters mismatch\n");
    return false;
  }
  if (!near(m.throughput, 269.406) || m.throughput_unit != "MB/s" || !near(m.iops, 65772.9) ||
      m.iops_unit != "IOPS" || !near(m.latency, 470.58) || m.latency_unit != "us") {
    std::cerr << std::format("measurement results mismatch\n");
    return false;
  }
  return true;
}

bool test_long_pattern_tokens() {
  const auto seq = cdm::classify_line(
      "Sequential 128KiB (Q=32,T=1): 3,512.25 MB/s [26,797.0 IOPS] <1,193.20 us>");
  const auto rnd =
      cdm::classify_line("Random 4KiB (Q= 1, T= 1): 50.1 MB/s [12231.4 IOPS] <81.52 us>");
  if (!seq || !rnd) {
    std::cerr << std::format("long-form tokens failed to classify\n");
    return false;
  }
  const auto* s = std::get_if<cdm::MeasurementLine>(&*seq);
  const auto* r = std::get_if<cdm::MeasurementLine>(&*rnd);
  if (s == nullptr || r == nullptr) {
    std::cerr << std::format("long-form tokens not recognized as measurements\n");
    return false;
  }
  if (s->measurement.pattern != cdm::PatternKind::SequentialAccess ||
      r->measurement.pattern != cdm::PatternKind::RandomAccess) {
    std::cerr << std::format("long-form token normalization mismatch\n");
    return false;
  }
  if (s->measurement.pattern_token != "Sequential" || r->measurement.pattern_token != "Random") {
    std::cerr << std::format("source pattern token not kept: '{}' '{}'\n",
                             s->measurement.pattern_token, r->measurement.pattern_token);
    return false;
  }
  if (!near(s->measurement.throughput, 3512.25) || !near(s->measurement.iops, 26797.0) ||
      !near(s->measurement.latency, 1193.20)) {
    std::cerr << std::format("thousands separators were not stripped\n");
    return false;
  }
  return true;
}

bool test_legacy_dialect() {
  const cdm::ParseOptions legacy{.dialect = cdm::TokenDialect::Legacy};

  const auto seq = cdm::classify_line(
      "SEQ 1MiB (Q= 8, T= 1): 531.458 MB/s [506.8 IOPS] <15726.77 us>", legacy);
  if (!seq || !std::holds_alternative<cdm::MeasurementLine>(*seq)) {
    std::cerr << std::format("legacy dialect rejected SEQ\n");
    return false;
  }

  const auto random = cdm::classify_line(
      "Random 4KiB (Q= 1, T= 1): 50.1 MB/s [12231.4 IOPS] <81.52 us>", legacy);
  const auto mix = cdm::classify_line("[Mix] Read 70%/Write 30%", legacy);
  if (!random || !std::holds_alternative<cdm::UnrecognizedLine>(*random) || !mix ||
      !std::holds_alternative<cdm::UnrecognizedLine>(*mix)) {
    std::cerr << std::format("legacy dialect accepted extended tokens\n");
    return false;
  }
  return true;
}

bool test_section_headers() {
  const std::pair<std::string_view, cdm::Section> cases[] = {
      {"[Read]", cdm::Section::Read},
      {"[Write]", cdm::Section::Write},
      {"  [Mix]  ", cdm::Section::Mix},
      {"[Mix] Read 70%/Write 30%", cdm::Section::Mix},
      {"[Read] extra", cdm::Section::Read},
  };
  for (const auto& [text, section] : cases) {
    const auto match = cdm::classify_line(text);
    const auto* header = match ? std::get_if<cdm::SectionHeaderLine>(&*match) : nullptr;
    if (header == nullptr || header->section != section) {
      std::cerr << std::format("header '{}' not recognized\n", text);
      return false;
    }
  }

  for (const std::string_view text :
       {"[read]", "[Admin]", "Read", "[Readme]", "Mode: [Read]", "x [Write]"}) {
    const auto match = cdm::classify_line(text);
    if (!match || std::holds_alternative<cdm::SectionHeaderLine>(*match)) {
      std::cerr << std::format("'{}' must not be a section header\n", text);
      return false;
    }
  }
  return true;
}

bool test_metadata_labels() {
  const std::pair<std::string_view, cdm::MetadataField> cases[] = {
      {"Profile: Default", cdm::MetadataField::Profile},
      {"   Test: 1 GiB (x5) [E: 96% (894/932GiB)]", cdm::MetadataField::Test},
      {"   Mode: [Admin]", cdm::MetadataField::Mode},
      {"   Time: Measure 5 sec / Interval 5 sec ", cdm::MetadataField::Time},
      {"   Date: 2021/06/22 17:19:21", cdm::MetadataField::Date},
      {"     OS: Windows 10  [10.0 Build 19042] (x64)", cdm::MetadataField::Os},
      {"Comment: WD Blue 3D 1TB WDS100T2B0A", cdm::MetadataField::Comment},
  };
  for (const auto& [text, field] : cases) {
    const auto match = cdm::classify_line(text);
    const auto* meta = match ? std::get_if<cdm::MetadataLine>(&*match) : nullptr;
    if (meta == nullptr || meta->field != field) {
      std::cerr << std::format("metadata line '{}' not recognized\n", text);
      return false;
    }
  }

  const auto time = cdm::classify_line("   Time: Measure 5 sec / Interval 5 sec ");
  if (std::get<cdm::MetadataLine>(*time).value != "Measure 5 sec / Interval 5 sec") {
    std::cerr << std::format("metadata value was not trimmed\n");
    return false;
  }
  const auto os = cdm::classify_line("     OS: Windows 10  [10.0 Build 19042] (x64)");
  if (std::get<cdm::MetadataLine>(*os).value != "Windows 10  [10.0 Build 19042] (x64)") {
    std::cerr << std::format("inner whitespace of metadata value changed\n");
    return false;
  }
  return true;
}

bool test_unrecognized_lines() {
  for (const std::string_view text : {
           "",
           "   ",
           "CrystalDiskMark 8.0.1 x64 (C) 2007-2021 hiyohiyo",
           "* MB/s = 1,000,000 bytes/s [SATA/600 = 600,000,000 bytes/s]",
           "Comment:",
           "SEQ 1MiB (Q= 8, T= 1): 531.458 MB/s [506.8 IOPS]",
           "SEQ 1MiB (Q= 8, T= 1): 531.458 MB/s [506.8 IOPS] <15726.77 us> trailing",
           "XYZ 1MiB (Q= 8, T= 1): 531.458 MB/s [506.8 IOPS] <15726.77 us>",
       }) {
    const auto match = cdm::classify_line(text);
    if (!match || !std::holds_alternative<cdm::UnrecognizedLine>(*match)) {
      std::cerr << std::format("'{}' should be unrecognized\n", text);
      return false;
    }
  }
  return true;
}

bool test_numeric_format_error() {
  const auto match =
      cdm::classify_line("SEQ 1MiB (Q= 8, T= 1): 1.2.3 MB/s [506.8 IOPS] <15726.77 us>");
  if (match || match.error().code() != cdm::ErrorCode::NumericFormatError) {
    std::cerr << std::format("malformed rate should be a NumericFormatError\n");
    return false;
  }

  const auto overflow = cdm::classify_line(
      "SEQ 1MiB (Q= 99999999999, T= 1): 1.0 MB/s [506.8 IOPS] <15726.77 us>");
  if (overflow || overflow.error().code() != cdm::ErrorCode::NumericFormatError) {
    std::cerr << std::format("queue depth overflow should be a NumericFormatError\n");
    return false;
  }
  return true;
}

bool test_parse_decimal() {
  const auto v = cdm::parse_decimal("1,234.56");
  if (!v || !near(*v, 1234.56)) {
    std::cerr << std::format("1,234.56 did not parse to 1234.56\n");
    return false;
  }
  for (const std::string_view bad : {"", ",", "12a", "-"}) {
    const auto r = cdm::parse_decimal(bad);
    if (r || r.error().code() != cdm::ErrorCode::NumericFormatError) {
      std::cerr << std::format("'{}' should not parse as decimal\n", bad);
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  if (!test_measurement_fields()) {
    return 1;
  }
  if (!test_long_pattern_tokens()) {
    return 1;
  }
  if (!test_legacy_dialect()) {
    return 1;
  }
  if (!test_section_headers()) {
    return 1;
  }
  if (!test_metadata_labels()) {
    return 1;
  }
  if (!test_unrecognized_lines()) {
    return 1;
  }
  if (!test_numeric_format_error()) {
    return 1;
  }
  if (!test_parse_decimal()) {
    return 1;
  }
  return 0;
}
