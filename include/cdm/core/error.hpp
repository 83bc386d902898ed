#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace cdm {

enum class ErrorCode {
  InvalidArgument,
  IoError,
  CodecError,
  DecodeError,
  ClassificationError,
  NumericFormatError,
  Unsupported,
  Internal,
};

class Error : public std::exception {
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};
  size_t line_{0};

public:
  Error() = default;
  Error(ErrorCode c, std::string m) : code_(c), message_(std::move(m)) {}
  Error(ErrorCode c, std::string m, size_t line)
      : code_(c), message_(std::move(m)), line_(line) {}
  explicit Error(std::string m) : message_(std::move(m)) {}

  const char *what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }

  // 1-based line number of the offending input line, 0 if not line-bound.
  size_t line() const noexcept { return line_; }

  Error with_line(size_t line) const {
    return Error{code_, message_, line};
  }
};

const char *error_code_name(ErrorCode code) noexcept;

} // namespace cdm
