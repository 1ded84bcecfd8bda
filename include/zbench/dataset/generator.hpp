#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "zbench/core/expected.hpp"
#include "zbench/core/types.hpp"

namespace zbench {

struct GenerationPlan {
  uint64_t file_size_bytes{};
  uint64_t total_size_bytes{};
  uint64_t file_count{};
};

Expected<GenerationPlan> plan_generation(std::string_view file_size,
                                         std::string_view total_size);

// file_0001.bin for index 1.
std::string dataset_file_name(uint64_t index);

// Checks the filesystem holding the parent of |output_dir| (or its nearest
// existing ancestor). Not byte-exact: filesystem overhead is ignored.
Expected<void> check_disk_space(const std::filesystem::path& output_dir,
                                uint64_t required_bytes);

class FileGenerator {
 public:
  static constexpr uint64_t kSeed = 42;
  static constexpr size_t kChunkSize = 1024 * 1024;

  explicit FileGenerator(const Config& cfg);

  // Reseeds the byte stream on every call, so identical parameters always
  // yield identical files.
  Expected<GenerationResult> generate() const;

 private:
  const Config& cfg_;
};

}  // namespace zbench
