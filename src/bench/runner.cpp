#include "zbench/bench/runner.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <system_error>
#include <utility>

#include "zbench/core/interrupt.hpp"

namespace zbench {
namespace {

uint64_t monotonic_ns() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

uint64_t size_or_zero(const std::filesystem::path& file) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(file, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

std::string op_name_lower(Operation op) {
  switch (op) {
    case Operation::Put:
      return "put";
    case Operation::Get:
      return "get";
    case Operation::Delete:
      return "delete";
  }
  return "get";
}

}  // namespace

BenchmarkRunner::BenchmarkRunner(const Config& cfg, ICommandExecutor& executor)
    : cfg_(cfg), executor_(executor) {}

Expected<CommandTemplate> BenchmarkRunner::template_for(Operation op) const {
  const auto& cmd = command_for(cfg_, op);
  if (!cmd || cmd->empty()) {
    return fail(ErrorCode::MissingCommandTemplate,
                "No command template provided for " + op_name_lower(op) + " operation");
  }
  return CommandTemplate(*cmd);
}

const BenchmarkResult& BenchmarkRunner::run_one(Operation op,
                                                const CommandTemplate& tmpl,
                                                const std::filesystem::path& file,
                                                bool warmup) {
  // Taken before the command so a DELETE that removes the file still
  // reports the size it operated on.
  const uint64_t size = size_or_zero(file);
  const auto outcome = executor_.execute(tmpl.render(file));

  BenchmarkResult r{};
  r.timestamp_ns = monotonic_ns();
  r.operation = op;
  r.filename = file.filename().string();
  r.size_bytes = size;
  r.latency_ns = outcome.latency_ns;
  r.success = outcome.success;
  r.error = outcome.success ? std::string{} : outcome.error;
  r.warmup = warmup;
  results_.push_back(std::move(r));
  return results_.back();
}

Expected<void> BenchmarkRunner::run_warmup(Operation op, const FileManifest& files) {
  if (cfg_.warmup == 0) {
    return {};
  }
  auto tmpl = template_for(op);
  if (!tmpl) {
    return unexpected<Error>(tmpl.error());
  }

  const size_t count = std::min<size_t>(cfg_.warmup, files.size());
  for (size_t i = 0; i < count; ++i) {
    if (interrupt_requested()) {
      return fail(ErrorCode::Interrupted, "Benchmark interrupted by user");
    }
    static_cast<void>(run_one(op, *tmpl, files[i], true));
  }
  return {};
}

Expected<void> BenchmarkRunner::run_measured(Operation op, const FileManifest& files) {
  auto tmpl = template_for(op);
  if (!tmpl) {
    return unexpected<Error>(tmpl.error());
  }

  for (const auto& file : files) {
    if (interrupt_requested()) {
      return fail(ErrorCode::Interrupted, "Benchmark interrupted by user");
    }
    const auto& r = run_one(op, *tmpl, file, false);
    if (!r.success) {
      if (interrupt_requested()) {
        return fail(ErrorCode::Interrupted, "Benchmark interrupted by user");
      }
      return fail(ErrorCode::CommandExecutionFailure, "Command failed: " + r.error);
    }
  }
  return {};
}

}  // namespace zbench
