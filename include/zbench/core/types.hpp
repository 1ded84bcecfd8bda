#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "zbench/core/expected.hpp"

namespace zbench {

enum class Operation { Put, Get, Delete };
enum class RunMode { Generate, Benchmark, FullCycle };

using FileManifest = std::vector<std::filesystem::path>;

struct Config {
  std::optional<std::filesystem::path> output_dir{};
  std::optional<std::filesystem::path> input_dir{};
  std::optional<std::string> file_size{};
  std::optional<std::string> total_size{};

  uint32_t warmup{3};
  uint32_t wait_sec{5};

  std::optional<std::filesystem::path> out_file{};
  bool no_log{false};
  bool reuse_files{false};

  std::optional<std::string> put_cmd{};
  std::optional<std::string> get_cmd{};
  std::optional<std::string> del_cmd{};
};

struct BenchmarkResult {
  uint64_t timestamp_ns{};
  Operation operation{Operation::Get};
  std::string filename{};
  uint64_t size_bytes{};
  uint64_t latency_ns{};
  bool success{false};
  std::string error{};
  bool warmup{false};
};

struct GenerationResult {
  FileManifest files{};
  uint64_t file_size_bytes{};
  uint64_t total_bytes_written{};
  uint64_t digest{};
};

// "PUT", "GET", "DELETE"
const char* operation_to_string(Operation op) noexcept;

// Accepts the lowercase CLI names: put, get, delete.
Expected<Operation> parse_operation(std::string_view name);

const std::optional<std::string>& command_for(const Config& cfg, Operation op) noexcept;

}  // namespace zbench
