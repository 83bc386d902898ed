#include "codec/runtime_codec.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <lz4frame.h>
#include <zstd.h>

#include "cdm/core/error.hpp"

namespace cdm::detail {

namespace {

constexpr size_t kLz4ChunkSize = 64 * 1024;

using Lz4DecompressionContext =
    std::unique_ptr<LZ4F_dctx, decltype(&LZ4F_freeDecompressionContext)>;
using ZstdDecompressionContext = std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)>;

Error lz4_error(const char* what, size_t code) {
  return Error{ErrorCode::CodecError,
               std::string(what) + ": " + LZ4F_getErrorName(code)};
}

Error zstd_error(const char* what, size_t code) {
  return Error{ErrorCode::CodecError,
               std::string(what) + ": " + ZSTD_getErrorName(code)};
}

std::vector<uint8_t> lz4_decompress(std::span<const uint8_t> comp) {
  LZ4F_dctx* raw_ctx = nullptr;
  const size_t rc = LZ4F_createDecompressionContext(&raw_ctx, LZ4F_VERSION);
  if (LZ4F_isError(rc)) {
    throw lz4_error("lz4 context creation failed", rc);
  }
  Lz4DecompressionContext ctx(raw_ctx, &LZ4F_freeDecompressionContext);

  std::vector<uint8_t> out;
  std::array<uint8_t, kLz4ChunkSize> chunk{};
  size_t pos = 0;

  while (pos < comp.size()) {
    size_t hint = 1;
    while (hint != 0) {
      size_t dst_size = chunk.size();
      size_t src_size = comp.size() - pos;
      hint = LZ4F_decompress(ctx.get(), chunk.data(), &dst_size, comp.data() + pos,
                             &src_size, nullptr);
      if (LZ4F_isError(hint)) {
        throw lz4_error("lz4 decompress failed", hint);
      }
      out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dst_size));
      pos += src_size;
      if (hint != 0 && dst_size == 0 && src_size == 0) {
        throw Error{ErrorCode::CodecError, "lz4 decompress failed: truncated frame"};
      }
    }
  }
  return out;
}

std::vector<uint8_t> zstd_decompress(std::span<const uint8_t> comp) {
  ZstdDecompressionContext ctx(ZSTD_createDCtx(), &ZSTD_freeDCtx);
  if (!ctx) {
    throw Error{ErrorCode::Internal, "zstd context creation failed"};
  }

  std::vector<uint8_t> out;
  std::vector<uint8_t> chunk(ZSTD_DStreamOutSize());
  ZSTD_inBuffer in{comp.data(), comp.size(), 0};
  size_t remaining = 0;

  while (in.pos < in.size) {
    ZSTD_outBuffer dst{chunk.data(), chunk.size(), 0};
    remaining = ZSTD_decompressStream(ctx.get(), &dst, &in);
    if (ZSTD_isError(remaining)) {
      throw zstd_error("zstd decompress failed", remaining);
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dst.pos));
  }

  // Input consumed; flush whatever the decoder still holds.
  while (remaining != 0) {
    ZSTD_outBuffer dst{chunk.data(), chunk.size(), 0};
    remaining = ZSTD_decompressStream(ctx.get(), &dst, &in);
    if (ZSTD_isError(remaining)) {
      throw zstd_error("zstd decompress failed", remaining);
    }
    if (dst.pos == 0) {
      throw Error{ErrorCode::CodecError, "zstd decompress failed: truncated frame"};
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dst.pos));
  }
  return out;
}

}  // namespace

FrameCodec::FrameCodec(CodecId id, int level) : id_(id), level_(level) {}

CodecId FrameCodec::id() const { return id_; }

std::vector<uint8_t> FrameCodec::compress(std::span<const uint8_t> raw) const {
  switch (id_) {
    case CodecId::None:
      return std::vector<uint8_t>(raw.begin(), raw.end());
    case CodecId::Lz4: {
      LZ4F_preferences_t prefs{};
      prefs.compressionLevel = level_;
      std::vector<uint8_t> out(LZ4F_compressFrameBound(raw.size(), &prefs));
      const size_t n =
          LZ4F_compressFrame(out.data(), out.size(), raw.data(), raw.size(), &prefs);
      if (LZ4F_isError(n)) {
        throw lz4_error("lz4 compress failed", n);
      }
      out.resize(n);
      return out;
    }
    case CodecId::Zstd: {
      std::vector<uint8_t> out(ZSTD_compressBound(raw.size()));
      const size_t n = ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), level_);
      if (ZSTD_isError(n)) {
        throw zstd_error("zstd compress failed", n);
      }
      out.resize(n);
      return out;
    }
  }
  throw std::logic_error("unknown codec");
}

std::vector<uint8_t> FrameCodec::decompress(std::span<const uint8_t> comp) const {
  switch (id_) {
    case CodecId::None:
      return std::vector<uint8_t>(comp.begin(), comp.end());
    case CodecId::Lz4:
      return lz4_decompress(comp);
    case CodecId::Zstd:
      return zstd_decompress(comp);
  }
  throw std::logic_error("unknown codec");
}

}  // namespace cdm::detail
