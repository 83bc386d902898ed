#include "cdm/codec/text_decoder.hpp"

#include <cstdint>
#include <exception>
#include <format>
#include <initializer_list>
#include <string_view>
#include <utility>

#include "cdm/core/error.hpp"

namespace cdm {
namespace {

constexpr size_t kNoInvalidByte = static_cast<size_t>(-1);

uint8_t byte_at(std::span<const std::byte> data, size_t pos) {
  return static_cast<uint8_t>(data[pos]);
}

bool has_prefix(std::span<const std::byte> data, std::initializer_list<uint8_t> prefix) {
  if (data.size() < prefix.size()) {
    return false;
  }
  size_t i = 0;
  for (const uint8_t b : prefix) {
    if (byte_at(data, i++) != b) {
      return false;
    }
  }
  return true;
}

// Offset of the first byte that does not start a well-formed UTF-8 sequence.
size_t find_invalid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    const auto lead = static_cast<uint8_t>(s[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp = lead & 0x07;
    } else {
      return i;
    }
    if (i + len > s.size()) {
      return i;
    }
    for (size_t k = 1; k < len; ++k) {
      const auto cont = static_cast<uint8_t>(s[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return i;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    const bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                          (len == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return i;
    }
    i += len;
  }
  return kNoInvalidByte;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

TextEncoding detect_encoding(std::span<const std::byte> data) noexcept {
  return has_prefix(data, {0xFF, 0xFE}) ? TextEncoding::Utf16Le : TextEncoding::Utf8;
}

TextDecoder::TextDecoder(std::span<const std::byte> data, TextEncoding encoding) noexcept
    : data_(data),
      encoding_(encoding == TextEncoding::Auto ? detect_encoding(data) : encoding) {
  if (encoding_ == TextEncoding::Utf8 && has_prefix(data_, {0xEF, 0xBB, 0xBF})) {
    pos_ = 3;
  } else if (encoding_ == TextEncoding::Utf16Le && has_prefix(data_, {0xFF, 0xFE})) {
    pos_ = 2;
  }
}

Expected<std::optional<std::string>> TextDecoder::next_line() noexcept {
  try {
    return encoding_ == TextEncoding::Utf16Le ? next_utf16le_line() : next_utf8_line();
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what(), line_ + 1});
  }
}

Error TextDecoder::decode_error(const std::string& what) const {
  return Error{ErrorCode::DecodeError, what, line_ + 1};
}

Expected<std::optional<std::string>> TextDecoder::next_utf8_line() {
  const size_t size = data_.size();
  if (pos_ >= size) {
    return std::optional<std::string>{};
  }

  const auto* base = reinterpret_cast<const char*>(data_.data());
  size_t end = pos_;
  while (end < size && base[end] != '\n' && base[end] != '\r') {
    ++end;
  }
  const std::string_view raw(base + pos_, end - pos_);

  const size_t bad = find_invalid_utf8(raw);
  if (bad != kNoInvalidByte) {
    return std::unexpected(
        decode_error(std::format("invalid UTF-8 sequence at byte offset {}", pos_ + bad)));
  }

  size_t next = end;
  if (next < size) {
    next += (base[next] == '\r' && next + 1 < size && base[next + 1] == '\n') ? 2 : 1;
  }
  pos_ = next;
  ++line_;
  return std::optional<std::string>{std::string(raw)};
}

Expected<std::optional<std::string>> TextDecoder::next_utf16le_line() {
  const size_t size = data_.size();
  if (pos_ >= size) {
    return std::optional<std::string>{};
  }

  const auto unit_at = [this](size_t p) {
    return static_cast<uint16_t>(byte_at(data_, p) | (byte_at(data_, p + 1) << 8));
  };

  std::string out;
  size_t p = pos_;
  while (p + 1 < size) {
    const uint16_t u = unit_at(p);
    if (u == u'\n') {
      p += 2;
      break;
    }
    if (u == u'\r') {
      p += 2;
      if (p + 1 < size && unit_at(p) == u'\n') {
        p += 2;
      }
      break;
    }

    uint32_t cp = u;
    if (u >= 0xD800 && u <= 0xDBFF) {
      if (p + 3 >= size) {
        return std::unexpected(
            decode_error(std::format("truncated UTF-16 surrogate pair at byte offset {}", p)));
      }
      const uint16_t lo = unit_at(p + 2);
      if (lo < 0xDC00 || lo > 0xDFFF) {
        return std::unexpected(
            decode_error(std::format("unpaired UTF-16 high surrogate at byte offset {}", p)));
      }
      cp = 0x10000 + ((static_cast<uint32_t>(u) - 0xD800) << 10) + (lo - 0xDC00);
      p += 4;
    } else if (u >= 0xDC00 && u <= 0xDFFF) {
      return std::unexpected(
          decode_error(std::format("unpaired UTF-16 low surrogate at byte offset {}", p)));
    } else {
      p += 2;
    }
    append_utf8(out, cp);
  }

  if (p == size - 1) {
    return std::unexpected(
        decode_error(std::format("truncated UTF-16 code unit at byte offset {}", p)));
  }

  pos_ = p;
  ++line_;
  return std::optional<std::string>{std::move(out)};
}

}  // namespace cdm
