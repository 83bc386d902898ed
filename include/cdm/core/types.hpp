#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cdm {

enum class Section { None, Read, Write, Mix };
enum class PatternKind { SequentialAccess, RandomAccess };
enum class MetadataField { Profile, Test, Mode, Time, Date, Os, Comment };

enum class TextEncoding { Utf8, Utf16Le, Auto };
enum class CodecId : uint8_t { None = 0, Lz4 = 1, Zstd = 2 };

// Token set accepted by the classifier. Legacy reports only know SEQ/RND and
// the Read/Write sections.
enum class TokenDialect { Extended, Legacy };

struct ParseOptions {
  TokenDialect dialect{TokenDialect::Extended};
};

struct Measurement {
  PatternKind pattern{PatternKind::SequentialAccess};
  // Pattern as written in the report ("SEQ", "Sequential", ...). Empty for
  // measurements built in code.
  std::string pattern_token{};
  double block_size{};
  std::string block_size_unit{};
  uint32_t queue_depth{};
  uint32_t threads{};
  double throughput{};
  std::string throughput_unit{};
  double iops{};
  std::string iops_unit{};
  double latency{};
  std::string latency_unit{};
};

struct BenchmarkRun {
  std::optional<std::string> test_label{};
  std::optional<std::string> date{};
  std::optional<std::string> operating_system{};
  std::optional<std::string> mode{};
  std::optional<std::string> measurement_time{};
  std::optional<std::string> profile{};
  std::optional<std::string> comment{};

  std::vector<Measurement> read{};
  std::vector<Measurement> write{};
  std::vector<Measurement> mix{};
};

struct ParsedReport {
  std::string source{};
  BenchmarkRun run{};
  uint64_t digest{};
  size_t line_count{};
};

const char* section_name(Section section) noexcept;
const char* pattern_kind_name(PatternKind kind) noexcept;
// pattern_token, or pattern_kind_name(pattern) when no token was recorded.
std::string_view pattern_label(const Measurement& m) noexcept;
const char* metadata_label(MetadataField field) noexcept;
const char* codec_name(CodecId id) noexcept;

}  // namespace cdm
