#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "cdm/core/expected.hpp"
#include "cdm/core/types.hpp"
#include "cdm/parser/line_classifier.hpp"
#include "cdm/source/source.hpp"

namespace cdm {

// Applies one classified line to `run` and returns the section that is active
// afterwards. Section headers open a section, measurements keep it, metadata
// closes it, unrecognized lines leave it alone. A measurement while no section
// is active is a ClassificationError.
Expected<Section> accumulate(Section current, LineMatch match, BenchmarkRun& run);

// Single pass over `source`. Any error discards the partial run; errors raised
// for a specific line carry its number.
Expected<BenchmarkRun> parse(ILineSource& source, const ParseOptions& opts = {}) noexcept;

Expected<BenchmarkRun> parse_lines(std::span<const std::string> lines,
                                   const ParseOptions& opts = {}) noexcept;

Expected<BenchmarkRun> parse_text(std::string_view text, const ParseOptions& opts = {}) noexcept;

// Reads, decompresses and decodes `path`, then parses it. The returned report
// carries the xxHash64 digest of the decoded lines.
Expected<ParsedReport> parse_file(const std::filesystem::path& path,
                                  const SourceOptions& source_opts = {},
                                  const ParseOptions& opts = {}) noexcept;

}  // namespace cdm
