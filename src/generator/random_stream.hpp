#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace zbench::app {

// Sequential xorshift64 byte stream. Output depends only on the seed and on
// how many bytes were drawn before, never on how the draws were chunked.
class RandomByteStream {
 public:
  explicit RandomByteStream(uint64_t seed);

  void fill(std::span<uint8_t> out);
  uint64_t bytes_drawn() const { return drawn_; }

 private:
  uint64_t state_;
  uint64_t word_{0};
  unsigned word_left_{0};
  uint64_t drawn_{0};
};

uint64_t xorshift64(uint64_t& s);

}  // namespace zbench::app
