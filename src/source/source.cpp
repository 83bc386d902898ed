#include "cdm/source/source.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "cdm/codec/codec.hpp"
#include "cdm/codec/text_decoder.hpp"
#include "cdm/core/error.hpp"
#include "cdm/sink/digest_sink.hpp"

namespace cdm {
namespace {

constexpr size_t kReadChunk = 64 * 1024;

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }

 private:
  int fd_{-1};
};

Error io_error(const std::filesystem::path& path, int err) {
  return Error{ErrorCode::IoError, std::format("{}: {}", path.string(), std::strerror(err))};
}

Expected<std::vector<std::byte>> read_all(int fd, const std::filesystem::path& path) {
  std::vector<std::byte> data;

  struct stat st{};
  if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
    data.reserve(static_cast<size_t>(st.st_size));
  }

  size_t done = 0;
  for (;;) {
    data.resize(done + kReadChunk);
    const ssize_t n = ::read(fd, data.data() + done, kReadChunk);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(io_error(path, errno));
    }
    if (n == 0) {
      break;
    }
    done += static_cast<size_t>(n);
  }
  data.resize(done);
  return data;
}

Expected<std::vector<std::byte>> maybe_decompress(std::vector<std::byte> data,
                                                  const SourceOptions& opts) {
  const CodecId id = opts.compression.value_or(detect_codec(data));
  if (id == CodecId::None) {
    return data;
  }

  auto codec = make_codec(CodecParams{.id = id, .level = 0});
  if (!codec) {
    return std::unexpected(codec.error());
  }
  return (*codec)->decompress(data);
}

class DecodedLineSource final : public ILineSource {
 public:
  DecodedLineSource(std::vector<std::byte> data, TextEncoding encoding, DigestSink* digest)
      : data_(std::move(data)), decoder_(data_, encoding), digest_(digest) {}

  DecodedLineSource(const DecodedLineSource&) = delete;
  DecodedLineSource& operator=(const DecodedLineSource&) = delete;

  Expected<std::optional<std::string>> next_line() noexcept override {
    auto line = decoder_.next_line();
    if (line && line->has_value() && digest_ != nullptr) {
      digest_->consume(**line);
    }
    return line;
  }

  size_t line_number() const noexcept override { return decoder_.line_number(); }

 private:
  std::vector<std::byte> data_;
  TextDecoder decoder_;
  DigestSink* digest_;
};

Expected<std::unique_ptr<ILineSource>> make_decoded_source(std::vector<std::byte> data,
                                                           const SourceOptions& opts) {
  auto plain = maybe_decompress(std::move(data), opts);
  if (!plain) {
    return std::unexpected(plain.error());
  }
  return std::unique_ptr<ILineSource>(
      new DecodedLineSource(std::move(*plain), opts.encoding, opts.digest));
}

}  // namespace

Expected<std::vector<std::byte>> read_file_bytes(const std::filesystem::path& path) noexcept {
  try {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      return std::unexpected(io_error(path, errno));
    }
    FileDescriptor guard(fd);
    return read_all(guard.get(), path);
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<std::unique_ptr<ILineSource>> make_memory_source(std::string bytes,
                                                          const SourceOptions& opts) noexcept {
  try {
    std::vector<std::byte> data(bytes.size());
    if (!bytes.empty()) {
      std::memcpy(data.data(), bytes.data(), bytes.size());
    }
    return make_decoded_source(std::move(data), opts);
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<std::unique_ptr<ILineSource>> open_file_source(const std::filesystem::path& path,
                                                        const SourceOptions& opts) noexcept {
  auto data = read_file_bytes(path);
  if (!data) {
    return std::unexpected(data.error());
  }
  try {
    return make_decoded_source(std::move(*data), opts);
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

}  // namespace cdm
