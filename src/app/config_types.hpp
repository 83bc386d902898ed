#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cdm/core/types.hpp"

namespace cdm::app {

enum class OutputFormat { Csv, Json, Text };

struct Config {
  std::vector<std::filesystem::path> inputs;

  TextEncoding encoding{TextEncoding::Utf8};
  std::optional<CodecId> compression{};
  TokenDialect dialect{TokenDialect::Extended};

  OutputFormat format{OutputFormat::Csv};
  std::optional<std::filesystem::path> output;
  bool with_source{false};

  // 0 picks min(hardware threads, inputs).
  uint32_t threads{0};
  uint32_t queue_depth{64};

  bool dedupe{false};
  bool summary{false};
  bool verbose{false};

  std::string executable_path;
};

}  // namespace cdm::app
