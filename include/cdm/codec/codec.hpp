#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "cdm/core/expected.hpp"
#include "cdm/core/types.hpp"

namespace cdm {

struct CodecParams {
  CodecId id{CodecId::None};
  int level{0};
};

// Whole-buffer frame codec for archived reports. Decompression handles frames
// of unknown content size and concatenated frames.
class ICodec {
 public:
  virtual ~ICodec() = default;

  virtual CodecId id() const noexcept = 0;
  virtual const char* name() const noexcept = 0;

  virtual Expected<std::vector<std::byte>> compress(
      std::span<const std::byte> raw) noexcept = 0;

  virtual Expected<std::vector<std::byte>> decompress(
      std::span<const std::byte> comp) noexcept = 0;
};

Expected<std::unique_ptr<ICodec>> make_codec(const CodecParams& params) noexcept;

// Identifies zstd and LZ4 frames by their magic number; anything else is None.
CodecId detect_codec(std::span<const std::byte> data) noexcept;

}  // namespace cdm
