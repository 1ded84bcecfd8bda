#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include "zbench/core/error.hpp"

struct XXH64_state_s;

namespace zbench::app {

class DatasetDigest {
 public:
  explicit DatasetDigest(uint64_t seed = 0);
  ~DatasetDigest();

  DatasetDigest(const DatasetDigest&) = delete;
  DatasetDigest& operator=(const DatasetDigest&) = delete;

  void consume(std::span<const uint8_t> data);
  uint64_t digest() const;
  uint64_t bytes() const { return bytes_; }

 private:
  uint64_t bytes_{0};
  XXH64_state_s* state_{nullptr};
};

}  // namespace zbench::app
