#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "cdm/core/types.hpp"

namespace cdm::detail {

class FrameCodec {
 public:
  FrameCodec(CodecId id, int level);

  CodecId id() const;

  std::vector<uint8_t> compress(std::span<const uint8_t> raw) const;
  std::vector<uint8_t> decompress(std::span<const uint8_t> comp) const;

 private:
  CodecId id_{CodecId::None};
  int level_{1};
};

}  // namespace cdm::detail
