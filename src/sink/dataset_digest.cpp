#include "sink/dataset_digest.hpp"

#include <new>

#include <xxhash.h>

namespace zbench::app {
DatasetDigest::DatasetDigest(uint64_t seed) : state_(XXH64_createState()) {
  if (state_ == nullptr) {
    throw std::bad_alloc();
  }
  if (XXH64_reset(state_, seed) == XXH_ERROR) {
    XXH64_freeState(state_);
    throw Error{ErrorCode::Internal, "XXH64_reset failed"};
  }
}

DatasetDigest::~DatasetDigest() { XXH64_freeState(state_); }

void DatasetDigest::consume(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  if (XXH64_update(state_, data.data(), data.size()) == XXH_ERROR) {
    throw Error{ErrorCode::Internal, "XXH64_update failed"};
  }
  bytes_ += data.size();
}

uint64_t DatasetDigest::digest() const { return XXH64_digest(state_); }

}  // namespace zbench::app
