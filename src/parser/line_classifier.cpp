#include "cdm/parser/line_classifier.hpp"

#include <array>
#include <charconv>
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "cdm/core/error.hpp"

namespace cdm {
namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_number_char(char c) { return is_digit(c) || c == '.' || c == ','; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

class Cursor {
 public:
  explicit Cursor(std::string_view text) : text_(text) {}

  void skip_ws() {
    while (pos_ < text_.size() && is_space(text_[pos_])) {
      ++pos_;
    }
  }

  // At least one whitespace character.
  bool skip_ws1() {
    const size_t start = pos_;
    skip_ws();
    return pos_ > start;
  }

  bool literal(std::string_view lit) {
    if (text_.substr(pos_).starts_with(lit)) {
      pos_ += lit.size();
      return true;
    }
    return false;
  }

  template <typename Pred>
  std::string_view take_while(Pred pred) {
    const size_t start = pos_;
    while (pos_ < text_.size() && pred(text_[pos_])) {
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  // Unit token: non-blank run that stops at the punctuation closing its field.
  std::string_view unit(char stop) {
    return take_while([stop](char c) { return !is_space(c) && c != stop; });
  }

  std::string_view rest() const { return text_.substr(pos_); }
  bool at_end() const { return pos_ >= text_.size(); }

 private:
  std::string_view text_;
  size_t pos_{0};
};

struct PatternToken {
  std::string_view text;
  PatternKind kind;
  bool legacy;
};

constexpr std::array<PatternToken, 4> kPatternTokens{{
    {"SEQ", PatternKind::SequentialAccess, true},
    {"RND", PatternKind::RandomAccess, true},
    {"Sequential", PatternKind::SequentialAccess, false},
    {"Random", PatternKind::RandomAccess, false},
}};

struct SectionToken {
  std::string_view text;
  Section section;
  bool legacy;
};

constexpr std::array<SectionToken, 3> kSectionTokens{{
    {"Read", Section::Read, true},
    {"Write", Section::Write, true},
    {"Mix", Section::Mix, false},
}};

bool token_allowed(bool legacy_token, const ParseOptions& opts) {
  return legacy_token || opts.dialect == TokenDialect::Extended;
}

// Captured substrings of a measurement line, before numeric conversion.
struct MeasurementFields {
  PatternKind pattern{};
  std::string_view pattern_token;
  std::string_view block_size;
  std::string_view block_size_unit;
  std::string_view queue_depth;
  std::string_view threads;
  std::string_view throughput;
  std::string_view throughput_unit;
  std::string_view iops;
  std::string_view iops_unit;
  std::string_view latency;
  std::string_view latency_unit;
};

std::optional<MeasurementFields> scan_measurement(std::string_view line,
                                                  const ParseOptions& opts) {
  Cursor c(line);
  MeasurementFields f{};

  c.skip_ws();
  bool have_token = false;
  for (const auto& tok : kPatternTokens) {
    if (token_allowed(tok.legacy, opts) && c.literal(tok.text)) {
      f.pattern = tok.kind;
      f.pattern_token = tok.text;
      have_token = true;
      break;
    }
  }
  if (!have_token) {
    return std::nullopt;
  }

  c.skip_ws();
  f.block_size = c.take_while(is_digit);
  f.block_size_unit = c.unit('(');
  if (f.block_size.empty() || f.block_size_unit.empty()) {
    return std::nullopt;
  }

  c.skip_ws();
  if (!c.literal("(Q=")) {
    return std::nullopt;
  }
  c.skip_ws();
  f.queue_depth = c.take_while(is_digit);
  if (f.queue_depth.empty() || !c.literal(",")) {
    return std::nullopt;
  }
  c.skip_ws();
  if (!c.literal("T=")) {
    return std::nullopt;
  }
  c.skip_ws();
  f.threads = c.take_while(is_digit);
  if (f.threads.empty() || !c.literal(")")) {
    return std::nullopt;
  }
  c.skip_ws();
  if (!c.literal(":")) {
    return std::nullopt;
  }

  c.skip_ws();
  f.throughput = c.take_while(is_number_char);
  if (f.throughput.empty() || !c.skip_ws1()) {
    return std::nullopt;
  }
  f.throughput_unit = c.unit('[');
  if (f.throughput_unit.empty()) {
    return std::nullopt;
  }

  c.skip_ws();
  if (!c.literal("[")) {
    return std::nullopt;
  }
  c.skip_ws();
  f.iops = c.take_while(is_number_char);
  if (f.iops.empty() || !c.skip_ws1()) {
    return std::nullopt;
  }
  f.iops_unit = c.unit(']');
  c.skip_ws();
  if (f.iops_unit.empty() || !c.literal("]")) {
    return std::nullopt;
  }

  c.skip_ws();
  if (!c.literal("<")) {
    return std::nullopt;
  }
  c.skip_ws();
  f.latency = c.take_while(is_number_char);
  if (f.latency.empty() || !c.skip_ws1()) {
    return std::nullopt;
  }
  f.latency_unit = c.unit('>');
  c.skip_ws();
  if (f.latency_unit.empty() || !c.literal(">")) {
    return std::nullopt;
  }

  c.skip_ws();
  if (!c.at_end()) {
    return std::nullopt;
  }
  return f;
}

using RecognizerResult = Expected<std::optional<LineMatch>>;
using RecognizerFn = RecognizerResult (*)(std::string_view, const ParseOptions&);

RecognizerResult recognize_measurement(std::string_view line, const ParseOptions& opts) {
  const auto fields = scan_measurement(line, opts);
  if (!fields) {
    return std::optional<LineMatch>{};
  }

  Measurement m{};
  m.pattern = fields->pattern;
  m.pattern_token = std::string(fields->pattern_token);

  auto block_size = parse_decimal(fields->block_size);
  if (!block_size) {
    return std::unexpected(block_size.error());
  }
  auto queue_depth = parse_count(fields->queue_depth);
  if (!queue_depth) {
    return std::unexpected(queue_depth.error());
  }
  auto threads = parse_count(fields->threads);
  if (!threads) {
    return std::unexpected(threads.error());
  }
  auto throughput = parse_decimal(fields->throughput);
  if (!throughput) {
    return std::unexpected(throughput.error());
  }
  auto iops = parse_decimal(fields->iops);
  if (!iops) {
    return std::unexpected(iops.error());
  }
  auto latency = parse_decimal(fields->latency);
  if (!latency) {
    return std::unexpected(latency.error());
  }

  m.block_size = *block_size;
  m.block_size_unit = std::string(fields->block_size_unit);
  m.queue_depth = *queue_depth;
  m.threads = *threads;
  m.throughput = *throughput;
  m.throughput_unit = std::string(fields->throughput_unit);
  m.iops = *iops;
  m.iops_unit = std::string(fields->iops_unit);
  m.latency = *latency;
  m.latency_unit = std::string(fields->latency_unit);

  return std::optional<LineMatch>{MeasurementLine{std::move(m)}};
}

// "[Read]", "[Write]" or "[Mix]" opening the line. Text after the bracket is
// a caption, e.g. "[Mix] Read 70%/Write 30%".
RecognizerResult recognize_section(std::string_view line, const ParseOptions& opts) {
  Cursor c(line);
  c.skip_ws();
  if (!c.literal("[")) {
    return std::optional<LineMatch>{};
  }
  for (const auto& tok : kSectionTokens) {
    if (token_allowed(tok.legacy, opts) && c.literal(tok.text)) {
      if (!c.literal("]")) {
        break;
      }
      return std::optional<LineMatch>{SectionHeaderLine{tok.section}};
    }
  }
  return std::optional<LineMatch>{};
}

// "<Label>: <value>". The value must have at least one character after the
// separator space; it is returned trimmed.
template <MetadataField Field>
RecognizerResult recognize_metadata(std::string_view line, const ParseOptions&) {
  Cursor c(line);
  c.skip_ws();
  if (!c.literal(metadata_label(Field)) || !c.literal(": ")) {
    return std::optional<LineMatch>{};
  }
  const std::string_view raw = c.rest();
  if (raw.empty()) {
    return std::optional<LineMatch>{};
  }
  return std::optional<LineMatch>{MetadataLine{Field, std::string(trim(raw))}};
}

constexpr std::array<RecognizerFn, 9> kRecognizers{
    &recognize_measurement,
    &recognize_section,
    &recognize_metadata<MetadataField::Profile>,
    &recognize_metadata<MetadataField::Test>,
    &recognize_metadata<MetadataField::Mode>,
    &recognize_metadata<MetadataField::Time>,
    &recognize_metadata<MetadataField::Date>,
    &recognize_metadata<MetadataField::Os>,
    &recognize_metadata<MetadataField::Comment>,
};

}  // namespace

Expected<double> parse_decimal(std::string_view text) noexcept {
  std::string digits;
  try {
    digits.reserve(text.size());
    for (const char ch : text) {
      if (ch != ',') {
        digits.push_back(ch);
      }
    }
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }

  double value = 0.0;
  const char* first = digits.data();
  const char* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
  if (digits.empty() || ec != std::errc{} || ptr != last) {
    return std::unexpected(Error{ErrorCode::NumericFormatError,
                                 "invalid decimal number '" + std::string(text) + "'"});
  }
  return value;
}

Expected<uint32_t> parse_count(std::string_view text) noexcept {
  uint32_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, 10);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::unexpected(Error{ErrorCode::NumericFormatError,
                                 "invalid integer '" + std::string(text) + "'"});
  }
  return value;
}

Expected<LineMatch> classify_line(std::string_view line, const ParseOptions& opts) noexcept {
  try {
    for (const auto& recognizer : kRecognizers) {
      auto result = recognizer(line, opts);
      if (!result) {
        return std::unexpected(result.error());
      }
      if (result->has_value()) {
        return std::move(**result);
      }
    }
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
  return LineMatch{UnrecognizedLine{}};
}

}  // namespace cdm
