#pragma once

#include <optional>
#include <string>

#include "app/config_types.hpp"
#include "cdm/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace cdm::app {

cdm::Expected<Config> parse_args(int argc, char** argv);

cdm::Expected<TextEncoding> parse_encoding(const std::string& s);
cdm::Expected<std::optional<CodecId>> parse_compression(const std::string& s);
cdm::Expected<OutputFormat> parse_format(const std::string& s);
cdm::Expected<TokenDialect> parse_dialect(const std::string& s);

}  // namespace cdm::app
