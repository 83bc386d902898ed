#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cdm/core/expected.hpp"
#include "cdm/core/types.hpp"

namespace cdm {

class DigestSink;

struct SourceOptions {
  TextEncoding encoding{TextEncoding::Utf8};
  // nullopt detects lz4/zstd frames by magic number.
  std::optional<CodecId> compression{};
  // Receives every decoded line when set. Not owned.
  DigestSink* digest{nullptr};
};

// Sequence of decoded text lines, consumed strictly in order.
class ILineSource {
 public:
  virtual ~ILineSource() = default;

  // nullopt at end of input.
  virtual Expected<std::optional<std::string>> next_line() noexcept = 0;

  // Number of lines handed out so far, i.e. the 1-based number of the line
  // most recently returned by next_line().
  virtual size_t line_number() const noexcept = 0;
};

Expected<std::unique_ptr<ILineSource>> make_memory_source(std::string bytes,
                                                          const SourceOptions& opts = {}) noexcept;

Expected<std::unique_ptr<ILineSource>> open_file_source(const std::filesystem::path& path,
                                                        const SourceOptions& opts = {}) noexcept;

Expected<std::vector<std::byte>> read_file_bytes(const std::filesystem::path& path) noexcept;

}  // namespace cdm
