#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "cdm/core/expected.hpp"
#include "cdm/core/types.hpp"

namespace cdm {

struct UnrecognizedLine {};

struct MeasurementLine {
  Measurement measurement{};
};

struct SectionHeaderLine {
  Section section{Section::None};
};

struct MetadataLine {
  MetadataField field{MetadataField::Profile};
  std::string value{};
};

using LineMatch =
    std::variant<UnrecognizedLine, MeasurementLine, SectionHeaderLine, MetadataLine>;

// Runs the recognizers in precedence order (measurement, section header,
// metadata labels) and returns the first match. Lines matching nothing come
// back as UnrecognizedLine. Fails only with NumericFormatError, when a line
// has the full measurement shape but one of its numbers does not parse.
Expected<LineMatch> classify_line(std::string_view line,
                                  const ParseOptions& opts = {}) noexcept;

// Decimal number with '.' as the decimal point; ',' separators are dropped.
Expected<double> parse_decimal(std::string_view text) noexcept;

Expected<uint32_t> parse_count(std::string_view text) noexcept;

}  // namespace cdm
