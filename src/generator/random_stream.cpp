#include "generator/random_stream.hpp"

namespace zbench::app {
namespace {

// xorshift has a fixed point at zero.
constexpr uint64_t kZeroSeedReplacement = 0x9e3779b97f4a7c15ULL;

}  // namespace

uint64_t xorshift64(uint64_t& s) {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

RandomByteStream::RandomByteStream(uint64_t seed)
    : state_(seed == 0 ? kZeroSeedReplacement : seed) {}

void RandomByteStream::fill(std::span<uint8_t> out) {
  size_t i = 0;
  while (i < out.size() && word_left_ > 0) {
    out[i++] = static_cast<uint8_t>(word_);
    word_ >>= 8;
    --word_left_;
  }

  while (out.size() - i >= sizeof(uint64_t)) {
    uint64_t w = xorshift64(state_);
    for (size_t b = 0; b < sizeof(uint64_t); ++b) {
      out[i++] = static_cast<uint8_t>(w);
      w >>= 8;
    }
  }

  if (i < out.size()) {
    word_ = xorshift64(state_);
    word_left_ = sizeof(uint64_t);
    while (i < out.size()) {
      out[i++] = static_cast<uint8_t>(word_);
      word_ >>= 8;
      --word_left_;
    }
  }

  drawn_ += out.size();
}

}  // namespace zbench::app
