#pragma once

#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "cdm/core/types.hpp"

namespace cdm {

// JSON array with one object per report: source, digest, metadata (absent
// fields are null) and the read/write/mix measurement arrays.
void write_json(std::ostream& out, std::span<const ParsedReport> reports);

// Listing in the report's own line grammar, preceded by a source banner.
void write_text(std::ostream& out, const ParsedReport& report);

std::string json_escape(std::string_view text);

}  // namespace cdm
