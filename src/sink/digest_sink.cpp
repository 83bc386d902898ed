#include "cdm/sink/digest_sink.hpp"

#include <new>

#include <xxhash.h>

namespace cdm {

namespace {

// Separates lines so that {"ab", "c"} and {"a", "bc"} hash differently.
constexpr char kLineSeparator = '\n';

}  // namespace

void DigestSink::StateDeleter::operator()(XXH64_state_s* state) const noexcept {
  XXH64_freeState(state);
}

DigestSink::DigestSink(uint64_t seed) : seed_(seed), state_(XXH64_createState()) {
  if (!state_) {
    throw std::bad_alloc();
  }
  XXH64_reset(state_.get(), seed_);
}

DigestSink::~DigestSink() = default;

void DigestSink::consume(std::string_view line) {
  XXH64_update(state_.get(), line.data(), line.size());
  XXH64_update(state_.get(), &kLineSeparator, sizeof(kLineSeparator));
  bytes_ += line.size();
  ++lines_;
}

uint64_t DigestSink::digest() const { return XXH64_digest(state_.get()); }

}  // namespace cdm
