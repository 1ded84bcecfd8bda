#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include "generator/random_stream.hpp"
#include "sink/dataset_digest.hpp"
#include "zbench/core/error.hpp"
#include "zbench/dataset/generator.hpp"

namespace {

std::vector<char> read_all(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

uint64_t digest_of(const zbench::FileManifest& files) {
  zbench::app::DatasetDigest digest;
  for (const auto& f : files) {
    const auto bytes = read_all(f);
    digest.consume(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
  }
  return digest.digest();
}

zbench::Config make_config(const std::filesystem::path& dir, const std::string& file_size,
                           const std::string& total_size) {
  zbench::Config cfg{};
  cfg.output_dir = dir;
  cfg.file_size = file_size;
  cfg.total_size = total_size;
  return cfg;
}

bool test_stream_is_chunking_independent() {
  zbench::app::RandomByteStream whole(42);
  zbench::app::RandomByteStream pieces(42);
  zbench::app::RandomByteStream other(99);

  std::vector<uint8_t> a(1000);
  std::vector<uint8_t> b(1000);
  std::vector<uint8_t> c(1000);

  whole.fill(a);
  size_t off = 0;
  for (const size_t n : {3u, 5u, 17u, 1u, 974u}) {
    pieces.fill(std::span<uint8_t>(b.data() + off, n));
    off += n;
  }
  other.fill(c);

  if (a != b) {
    std::cerr << "Determinism failed: chunked draws differ from a single draw\n";
    return false;
  }
  if (a == c) {
    std::cerr << "Diversity failed: different seed produced identical output\n";
    return false;
  }
  if (whole.bytes_drawn() != 1000 || pieces.bytes_drawn() != 1000) {
    std::cerr << "bytes_drawn mismatch\n";
    return false;
  }
  return true;
}

bool test_generation_is_reproducible() {
  const std::filesystem::path dir_a = "./zbench_test_gen_a";
  const std::filesystem::path dir_b = "./zbench_test_gen_b";
  std::error_code ec;
  std::filesystem::remove_all(dir_a, ec);
  std::filesystem::remove_all(dir_b, ec);

  // 1.5 MiB per file forces a full chunk plus a partial one.
  const auto cfg_a = make_config(dir_a, "1.5MB", "4.5MB");
  const auto cfg_b = make_config(dir_b, "1.5MB", "4.5MB");

  auto ra = zbench::FileGenerator(cfg_a).generate();
  auto rb = zbench::FileGenerator(cfg_b).generate();
  if (!ra || !rb) {
    std::cerr << "generate failed\n";
    return false;
  }
  if (ra->files.size() != 3 || rb->files.size() != 3) {
    std::cerr << "expected 3 files, got " << ra->files.size() << " and " << rb->files.size() << "\n";
    return false;
  }

  for (size_t i = 0; i < ra->files.size(); ++i) {
    if (ra->files[i].filename() != rb->files[i].filename()) {
      std::cerr << "file names differ at index " << i << "\n";
      return false;
    }
    if (ra->files[i].filename() != zbench::dataset_file_name(i + 1)) {
      std::cerr << "unexpected file name " << ra->files[i].filename() << "\n";
      return false;
    }
    const auto a = read_all(ra->files[i]);
    const auto b = read_all(rb->files[i]);
    if (a.size() != 1572864 || a != b) {
      std::cerr << "file contents differ or have wrong size at index " << i << "\n";
      return false;
    }
  }

  // The stream is shared across files, so consecutive files never repeat.
  if (read_all(ra->files[0]) == read_all(ra->files[1])) {
    std::cerr << "file 1 and file 2 are identical\n";
    return false;
  }

  if (ra->digest != rb->digest) {
    std::cerr << "dataset digests differ\n";
    return false;
  }
  if (digest_of(ra->files) != ra->digest) {
    std::cerr << "digest of files on disk does not match the generation digest\n";
    return false;
  }
  if (ra->total_bytes_written != 3ULL * 1572864ULL) {
    std::cerr << "total_bytes_written mismatch\n";
    return false;
  }

  std::filesystem::remove_all(dir_a, ec);
  std::filesystem::remove_all(dir_b, ec);
  return true;
}

bool test_file_count_is_floor_division() {
  auto plan = zbench::plan_generation("3KB", "10KB");
  if (!plan) {
    std::cerr << "plan_generation failed: " << plan.error().what() << "\n";
    return false;
  }
  if (plan->file_count != 3 || plan->file_size_bytes != 3072 || plan->total_size_bytes != 10240) {
    std::cerr << "unexpected plan " << plan->file_count << "\n";
    return false;
  }
  return true;
}

bool test_file_larger_than_total_rejected() {
  const std::filesystem::path dir = "./zbench_test_gen_reject";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  const auto cfg = make_config(dir, "2MB", "1MB");
  auto r = zbench::FileGenerator(cfg).generate();
  if (r || r.error().code() != zbench::ErrorCode::InvalidConfiguration) {
    std::cerr << "expected InvalidConfiguration for file size > total size\n";
    return false;
  }
  if (std::filesystem::exists(dir)) {
    std::cerr << "output directory created despite invalid configuration\n";
    return false;
  }
  return true;
}

bool test_missing_parameters_rejected() {
  zbench::Config cfg{};
  cfg.output_dir = std::filesystem::path("./zbench_test_gen_missing");
  auto r = zbench::FileGenerator(cfg).generate();
  if (r || r.error().code() != zbench::ErrorCode::InvalidConfiguration) {
    std::cerr << "expected InvalidConfiguration for missing sizes\n";
    return false;
  }
  return true;
}

bool test_insufficient_disk_space() {
  const std::filesystem::path dir = "./zbench_test_gen_space/nested";
  const auto cfg = make_config(dir, "1TB", "100000TB");
  auto r = zbench::FileGenerator(cfg).generate();
  if (r || r.error().code() != zbench::ErrorCode::InsufficientDiskSpace) {
    std::cerr << "expected InsufficientDiskSpace\n";
    return false;
  }
  if (std::filesystem::exists(dir)) {
    std::cerr << "output directory created despite failed space check\n";
    return false;
  }
  return true;
}

bool test_invalid_size_propagates() {
  const auto cfg = make_config("./zbench_test_gen_bogus", "bogus", "1MB");
  auto r = zbench::FileGenerator(cfg).generate();
  if (r || r.error().code() != zbench::ErrorCode::InvalidSizeFormat) {
    std::cerr << "expected InvalidSizeFormat\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_stream_is_chunking_independent()) {
    return 1;
  }
  if (!test_generation_is_reproducible()) {
    return 1;
  }
  if (!test_file_count_is_floor_division()) {
    return 1;
  }
  if (!test_file_larger_than_total_rejected()) {
    return 1;
  }
  if (!test_missing_parameters_rejected()) {
    return 1;
  }
  if (!test_insufficient_disk_space()) {
    return 1;
  }
  if (!test_invalid_size_propagates()) {
    return 1;
  }
  return 0;
}
