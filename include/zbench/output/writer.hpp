#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "zbench/core/expected.hpp"
#include "zbench/core/types.hpp"

namespace zbench {

enum class SinkFormat { Csv, JsonLines };

// ".csv" in any case selects CSV; every other extension selects JSON Lines.
SinkFormat sink_format_for(const std::filesystem::path& path);

class OutputWriter {
 public:
  static constexpr size_t kFlushThreshold = 100;

  OutputWriter(std::filesystem::path path, bool no_log);

  OutputWriter(const OutputWriter&) = delete;
  OutputWriter& operator=(const OutputWriter&) = delete;

  Expected<void> write_result(const BenchmarkResult& result);

  // Appends every buffered record. The CSV header is emitted only when the
  // target does not exist yet. On failure the buffer is kept.
  Expected<void> flush();

  const std::filesystem::path& path() const noexcept { return path_; }
  SinkFormat format() const noexcept { return format_; }
  size_t pending() const noexcept { return buffer_.size(); }
  uint64_t flush_count() const noexcept { return flushes_; }

 private:
  Expected<void> write_csv();
  Expected<void> write_jsonl();

  std::filesystem::path path_;
  bool no_log_{false};
  SinkFormat format_{SinkFormat::JsonLines};
  std::vector<BenchmarkResult> buffer_;
  uint64_t flushes_{0};
};

}  // namespace zbench
