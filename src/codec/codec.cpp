#include "cdm/codec/codec.hpp"

#include <array>
#include <cstring>
#include <exception>

#include "codec/runtime_codec.hpp"

namespace cdm {
namespace {

constexpr std::array<uint8_t, 4> kZstdMagic{0x28, 0xB5, 0x2F, 0xFD};
constexpr std::array<uint8_t, 4> kLz4FrameMagic{0x04, 0x22, 0x4D, 0x18};

bool starts_with_magic(std::span<const std::byte> data, const std::array<uint8_t, 4>& magic) {
  return data.size() >= magic.size() && std::memcmp(data.data(), magic.data(), magic.size()) == 0;
}

std::span<const uint8_t> as_u8(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
}

std::vector<std::byte> to_bytes(const std::vector<uint8_t>& v) {
  std::vector<std::byte> out(v.size());
  if (!v.empty()) {
    std::memcpy(out.data(), v.data(), v.size());
  }
  return out;
}

class CodecAdapter final : public ICodec {
 public:
  explicit CodecAdapter(CodecParams params) : id_(params.id), impl_(params.id, params.level) {}

  CodecId id() const noexcept override { return id_; }
  const char* name() const noexcept override { return codec_name(id_); }

  Expected<std::vector<std::byte>> compress(std::span<const std::byte> raw) noexcept override {
    try {
      return to_bytes(impl_.compress(as_u8(raw)));
    } catch (const Error& e) {
      return std::unexpected(e);
    } catch (const std::exception& ex) {
      return std::unexpected(Error{ErrorCode::Internal, ex.what()});
    }
  }

  Expected<std::vector<std::byte>> decompress(std::span<const std::byte> comp) noexcept override {
    try {
      return to_bytes(impl_.decompress(as_u8(comp)));
    } catch (const Error& e) {
      return std::unexpected(e);
    } catch (const std::exception& ex) {
      return std::unexpected(Error{ErrorCode::Internal, ex.what()});
    }
  }

 private:
  CodecId id_;
  detail::FrameCodec impl_;
};

}  // namespace

Expected<std::unique_ptr<ICodec>> make_codec(const CodecParams& params) noexcept {
  if (params.id != CodecId::None && params.id != CodecId::Lz4 && params.id != CodecId::Zstd) {
    return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid codec id"});
  }

  try {
    return std::unique_ptr<ICodec>(new CodecAdapter(params));
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

CodecId detect_codec(std::span<const std::byte> data) noexcept {
  if (starts_with_magic(data, kZstdMagic)) {
    return CodecId::Zstd;
  }
  if (starts_with_magic(data, kLz4FrameMagic)) {
    return CodecId::Lz4;
  }
  return CodecId::None;
}

}  // namespace cdm
