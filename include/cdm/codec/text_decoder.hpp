#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>

#include "cdm/core/expected.hpp"
#include "cdm/core/types.hpp"

namespace cdm {

// Resolves TextEncoding::Auto from a leading byte order mark. UTF-16LE is
// chosen only for an FF FE prefix, UTF-8 otherwise.
TextEncoding detect_encoding(std::span<const std::byte> data) noexcept;

// Splits a byte buffer into UTF-8 lines, decoding one line per call. Accepts
// \n, \r\n and \r terminators, which are not part of the returned line. A
// leading byte order mark is skipped. The buffer must outlive the decoder.
class TextDecoder {
 public:
  TextDecoder(std::span<const std::byte> data, TextEncoding encoding) noexcept;

  // nullopt once the buffer is exhausted. DecodeError carries the number of
  // the line that failed to decode.
  Expected<std::optional<std::string>> next_line() noexcept;

  size_t line_number() const noexcept { return line_; }
  TextEncoding encoding() const noexcept { return encoding_; }

 private:
  Expected<std::optional<std::string>> next_utf8_line();
  Expected<std::optional<std::string>> next_utf16le_line();

  Error decode_error(const std::string& what) const;

  std::span<const std::byte> data_;
  TextEncoding encoding_{TextEncoding::Utf8};
  size_t pos_{0};
  size_t line_{0};
};

}  // namespace cdm
