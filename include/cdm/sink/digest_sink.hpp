#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

struct XXH64_state_s;

namespace cdm {

// Order-sensitive xxHash64 fingerprint of a report's decoded lines. Two files
// carrying the same text hash equal regardless of encoding, compression or
// line terminators.
class DigestSink {
 public:
  explicit DigestSink(uint64_t seed = 0);
  ~DigestSink();

  DigestSink(const DigestSink&) = delete;
  DigestSink& operator=(const DigestSink&) = delete;

  void consume(std::string_view line);
  uint64_t digest() const;
  uint64_t bytes() const { return bytes_; }
  uint64_t lines() const { return lines_; }

 private:
  struct StateDeleter {
    void operator()(XXH64_state_s* state) const noexcept;
  };

  uint64_t seed_{0};
  std::unique_ptr<XXH64_state_s, StateDeleter> state_;
  uint64_t bytes_{0};
  uint64_t lines_{0};
};

}  // namespace cdm
