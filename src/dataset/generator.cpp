#include "zbench/dataset/generator.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <span>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "generator/random_stream.hpp"
#include "sink/dataset_digest.hpp"
#include "zbench/core/interrupt.hpp"
#include "zbench/dataset/size.hpp"

namespace zbench {
namespace {

using app::DatasetDigest;
using app::RandomByteStream;

Expected<void> write_all_fd(int fd, const uint8_t* data, size_t size) {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::write(fd, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(ErrorCode::IoError, "write failed: " + std::string(std::strerror(errno)));
    }
    done += static_cast<size_t>(n);
  }
  return {};
}

Expected<int> open_file_write(const std::filesystem::path& p) {
  const int fd = ::open(p.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    return fail(ErrorCode::IoError,
                "open for write failed: " + p.string() + ": " + std::strerror(errno));
  }
  return fd;
}

Expected<void> ensure_dir(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) {
    return fail(ErrorCode::IoError, "create directory failed: " + p.string() + ": " + ec.message());
  }
  return {};
}

std::filesystem::path nearest_existing(std::filesystem::path p) {
  if (p.empty()) {
    return ".";
  }
  std::error_code ec;
  while (!std::filesystem::exists(p, ec)) {
    const auto parent = p.parent_path();
    if (parent.empty() || parent == p) {
      return ".";
    }
    p = parent;
  }
  return p;
}

Expected<void> write_dataset_file(const std::filesystem::path& path,
                                  uint64_t size,
                                  RandomByteStream& stream,
                                  DatasetDigest& digest,
                                  std::vector<uint8_t>& chunk) {
  auto fd = open_file_write(path);
  if (!fd) {
    return unexpected<Error>(fd.error());
  }

  uint64_t remaining = size;
  while (remaining > 0) {
    const auto n = static_cast<size_t>(std::min<uint64_t>(chunk.size(), remaining));
    const std::span<uint8_t> view(chunk.data(), n);
    stream.fill(view);
    digest.consume(view);

    auto wr = write_all_fd(*fd, view.data(), view.size());
    if (!wr) {
      ::close(*fd);
      return wr;
    }
    remaining -= n;
  }

  if (::close(*fd) != 0) {
    return fail(ErrorCode::IoError, "close failed: " + path.string() + ": " + std::strerror(errno));
  }
  return {};
}

}  // namespace

Expected<GenerationPlan> plan_generation(std::string_view file_size,
                                         std::string_view total_size) {
  auto file_bytes = parse_size(file_size);
  if (!file_bytes) {
    return unexpected<Error>(file_bytes.error());
  }
  auto total_bytes = parse_size(total_size);
  if (!total_bytes) {
    return unexpected<Error>(total_bytes.error());
  }

  GenerationPlan plan{};
  plan.file_size_bytes = *file_bytes;
  plan.total_size_bytes = *total_bytes;
  plan.file_count = plan.file_size_bytes == 0 ? 0 : plan.total_size_bytes / plan.file_size_bytes;
  if (plan.file_count == 0) {
    return fail(ErrorCode::InvalidConfiguration,
                "File size (" + std::string(file_size) + ") is larger than total size (" +
                    std::string(total_size) + ")");
  }
  return plan;
}

std::string dataset_file_name(uint64_t index) {
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "file_%04llu.bin", static_cast<unsigned long long>(index));
  return std::string(buf.data());
}

Expected<void> check_disk_space(const std::filesystem::path& output_dir,
                                uint64_t required_bytes) {
  const auto probe = nearest_existing(output_dir.parent_path());
  std::error_code ec;
  const auto info = std::filesystem::space(probe, ec);
  if (ec) {
    return fail(ErrorCode::IoError, "disk space query failed: " + probe.string() + ": " + ec.message());
  }
  if (info.available < required_bytes) {
    return fail(ErrorCode::InsufficientDiskSpace,
                "Insufficient disk space. Required: " + std::to_string(required_bytes) +
                    " bytes, Available: " + std::to_string(info.available) + " bytes");
  }
  return {};
}

FileGenerator::FileGenerator(const Config& cfg) : cfg_(cfg) {}

Expected<GenerationResult> FileGenerator::generate() const {
  if (!cfg_.output_dir || !cfg_.file_size || !cfg_.total_size) {
    return fail(ErrorCode::InvalidConfiguration, "Missing required parameters for file generation");
  }

  auto plan = plan_generation(*cfg_.file_size, *cfg_.total_size);
  if (!plan) {
    return unexpected<Error>(plan.error());
  }

  auto space = check_disk_space(*cfg_.output_dir, plan->total_size_bytes);
  if (!space) {
    return unexpected<Error>(space.error());
  }

  auto mk = ensure_dir(*cfg_.output_dir);
  if (!mk) {
    return unexpected<Error>(mk.error());
  }

  RandomByteStream stream(kSeed);
  DatasetDigest digest;
  std::vector<uint8_t> chunk(static_cast<size_t>(std::min<uint64_t>(kChunkSize, plan->file_size_bytes)));

  std::cout << "Generating " << plan->file_count << " files of " << plan->file_size_bytes
            << " bytes each...\n";

  GenerationResult out{};
  out.file_size_bytes = plan->file_size_bytes;
  out.files.reserve(static_cast<size_t>(plan->file_count));

  for (uint64_t i = 0; i < plan->file_count; ++i) {
    if (interrupt_requested()) {
      return fail(ErrorCode::Interrupted, "Benchmark interrupted by user");
    }
    const auto path = *cfg_.output_dir / dataset_file_name(i + 1);
    auto wr = write_dataset_file(path, plan->file_size_bytes, stream, digest, chunk);
    if (!wr) {
      return unexpected<Error>(wr.error());
    }
    out.files.push_back(path);
  }

  out.total_bytes_written = digest.bytes();
  out.digest = digest.digest();

  std::cout << "Generated " << out.files.size() << " files, total size: " << out.total_bytes_written
            << " bytes, digest xxh64:" << std::hex << std::setw(16) << std::setfill('0')
            << out.digest << std::dec << std::setfill(' ') << "\n";
  return out;
}

}  // namespace zbench
