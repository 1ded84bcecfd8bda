#include "app/cli_runner.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include <argparse/argparse.hpp>

#include "zbench/bench/orchestrator.hpp"
#include "zbench/core/error.hpp"
#include "zbench/core/interrupt.hpp"

namespace {

using zbench::Config;
using zbench::ErrorCode;
using zbench::Operation;
using zbench::Orchestrator;
using zbench::RunMode;
using zbench::app::CliInvocation;

template <typename T>
using Result = zbench::Expected<T>;

constexpr const char* kEpilog =
    "Examples:\n"
    "  # Generate test files\n"
    "  zbench generate --output-dir ./testfiles --file-size 10MB --total-size 1GB\n\n"
    "  # Benchmark PUT operations\n"
    "  zbench benchmark --op put --input-dir ./testfiles --put-cmd \"aws s3 cp {file} s3://bucket/\"\n\n"
    "  # Full benchmark cycle\n"
    "  zbench --ALL --output-dir ./testfiles --file-size 10MB --total-size 1GB\n";

void add_common_options(argparse::ArgumentParser& p) {
  p.add_argument("--put-cmd").help("PUT command template");
  p.add_argument("--get-cmd").help("GET command template");
  p.add_argument("--del-cmd").help("DELETE command template");
  p.add_argument("--out")
      .default_value(std::string("results.csv"))
      .help("Output file (CSV or JSONL)");
  p.add_argument("--warmup")
      .scan<'i', int>()
      .default_value(3)
      .help("Number of warm-up operations per type");
  p.add_argument("--wait")
      .scan<'i', int>()
      .default_value(5)
      .help("Wait time between phases (seconds)");
  p.add_argument("--no-log")
      .default_value(false)
      .implicit_value(true)
      .help("Disable logging for ultra-low-overhead timing");
}

// Options accepted both before and after the subcommand; the subcommand's
// copy wins when both are given.
template <typename T>
T pick(const argparse::ArgumentParser* sub, const argparse::ArgumentParser& top,
       const std::string& name) {
  if (sub != nullptr && sub->is_used(name)) {
    return sub->get<T>(name);
  }
  return top.get<T>(name);
}

std::optional<std::string> pick_present(const argparse::ArgumentParser* sub,
                                        const argparse::ArgumentParser& top,
                                        const std::string& name) {
  if (sub != nullptr) {
    if (auto v = sub->present(name)) {
      return v;
    }
  }
  return top.present(name);
}

Result<uint32_t> non_negative(int v, const char* name) {
  if (v < 0) {
    return zbench::fail(ErrorCode::InvalidConfiguration, std::string(name) + " must be >= 0");
  }
  return static_cast<uint32_t>(v);
}

int report_failure(const zbench::Error& e) {
  if (e.code() == ErrorCode::Interrupted) {
    std::cerr << "\nBenchmark interrupted by user\n";
  } else {
    std::cerr << "error: " << e.what() << "\n";
  }
  return 1;
}

Result<int> dispatch(const CliInvocation& inv) {
  Orchestrator orchestrator(inv.config);
  switch (inv.mode) {
    case RunMode::Generate: {
      auto gen = orchestrator.run_generate();
      if (!gen) {
        return zbench::unexpected<zbench::Error>(gen.error());
      }
      return 0;
    }
    case RunMode::Benchmark: {
      auto run = orchestrator.run_benchmark(inv.op);
      if (!run) {
        return zbench::unexpected<zbench::Error>(run.error());
      }
      return 0;
    }
    case RunMode::FullCycle: {
      auto run = orchestrator.run_full_cycle();
      if (!run) {
        return zbench::unexpected<zbench::Error>(run.error());
      }
      return 0;
    }
  }
  return zbench::fail(ErrorCode::Internal, "unknown run mode");
}

}  // namespace

namespace zbench::app {

zbench::Expected<CliInvocation> parse_args(int argc, char** argv) {
  argparse::ArgumentParser program("zbench", "0.1.0");
  program.add_description("zbench - Object Storage Benchmark");
  program.add_epilog(kEpilog);

  program.add_argument("--ALL")
      .default_value(false)
      .implicit_value(true)
      .help("Run full benchmark cycle (generate -> PUT -> GET -> DELETE)");
  add_common_options(program);
  program.add_argument("--reuse-files")
      .default_value(false)
      .implicit_value(true)
      .help("Skip file generation if files exist (--ALL mode)");
  program.add_argument("--output-dir").help("Directory for generated files (--ALL mode)");
  program.add_argument("--input-dir").help("Directory with existing files (--ALL mode, skips generation)");
  program.add_argument("--file-size").help("Size per file (--ALL mode)");
  program.add_argument("--total-size").help("Total dataset size (--ALL mode)");

  argparse::ArgumentParser generate("generate");
  generate.add_description("Generate test files");
  generate.add_argument("--output-dir").required().help("Directory for generated files");
  generate.add_argument("--file-size").required().help("Size per file (e.g., 10MB)");
  generate.add_argument("--total-size").required().help("Total dataset size (e.g., 1GB)");

  argparse::ArgumentParser benchmark("benchmark");
  benchmark.add_description("Run benchmark operations");
  benchmark.add_argument("--op").required().help("Operation type to benchmark: put, get or delete");
  benchmark.add_argument("--input-dir").required().help("Directory containing test files");
  add_common_options(benchmark);

  program.add_subparser(generate);
  program.add_subparser(benchmark);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return zbench::fail(ErrorCode::InvalidConfiguration, "argument parsing failed");
  }

  const bool all = program.get<bool>("--ALL");
  const bool use_generate = program.is_subcommand_used(generate);
  const bool use_benchmark = program.is_subcommand_used(benchmark);
  if (!all && !use_generate && !use_benchmark) {
    std::cerr << program;
    return zbench::fail(ErrorCode::InvalidConfiguration,
                        "Must specify either --ALL or a subcommand (generate/benchmark)");
  }

  const argparse::ArgumentParser* sub = use_benchmark ? &benchmark : nullptr;

  CliInvocation inv{};
  Config cfg{};

  auto warmup = non_negative(pick<int>(sub, program, "--warmup"), "--warmup");
  if (!warmup) {
    return zbench::unexpected<zbench::Error>(warmup.error());
  }
  auto wait = non_negative(pick<int>(sub, program, "--wait"), "--wait");
  if (!wait) {
    return zbench::unexpected<zbench::Error>(wait.error());
  }
  cfg.warmup = *warmup;
  cfg.wait_sec = *wait;
  cfg.out_file = std::filesystem::path(pick<std::string>(sub, program, "--out"));
  cfg.no_log = pick<bool>(sub, program, "--no-log");
  cfg.reuse_files = program.get<bool>("--reuse-files");
  cfg.put_cmd = pick_present(sub, program, "--put-cmd");
  cfg.get_cmd = pick_present(sub, program, "--get-cmd");
  cfg.del_cmd = pick_present(sub, program, "--del-cmd");

  if (all) {
    inv.mode = RunMode::FullCycle;
    if (auto v = program.present("--output-dir")) {
      cfg.output_dir = std::filesystem::path(*v);
    }
    if (auto v = program.present("--input-dir")) {
      cfg.input_dir = std::filesystem::path(*v);
    }
    cfg.file_size = program.present("--file-size");
    cfg.total_size = program.present("--total-size");
  } else if (use_generate) {
    inv.mode = RunMode::Generate;
    cfg.output_dir = std::filesystem::path(generate.get<std::string>("--output-dir"));
    cfg.file_size = generate.get<std::string>("--file-size");
    cfg.total_size = generate.get<std::string>("--total-size");
  } else {
    inv.mode = RunMode::Benchmark;
    auto op = zbench::parse_operation(benchmark.get<std::string>("--op"));
    if (!op) {
      return zbench::unexpected<zbench::Error>(op.error());
    }
    inv.op = *op;
    cfg.input_dir = std::filesystem::path(benchmark.get<std::string>("--input-dir"));
  }

  inv.config = std::move(cfg);
  return inv;
}

}  // namespace zbench::app

int run_cli_impl(int argc, char** argv) {
  auto inv = zbench::app::parse_args(argc, argv);
  if (!inv) {
    std::cerr << "error: " << inv.error().what() << "\n";
    return 2;
  }

  if (!zbench::install_interrupt_handlers()) {
    std::cerr << "[warn] failed to install interrupt handlers\n";
  }

  try {
    auto run = dispatch(*inv);
    if (!run) {
      return report_failure(run.error());
    }
    if (zbench::interrupt_requested()) {
      return report_failure(zbench::Error{ErrorCode::Interrupted, "interrupted"});
    }
    return *run;
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
