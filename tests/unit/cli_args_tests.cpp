#include <iostream>
#include <string>
#include <vector>

#include "app/cli_runner.hpp"
#include "zbench/core/error.hpp"

namespace {

zbench::Expected<zbench::app::CliInvocation> parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  return zbench::app::parse_args(static_cast<int>(argv.size()), argv.data());
}

bool test_generate_subcommand() {
  auto inv = parse({"zbench", "generate", "--output-dir", "./files", "--file-size", "10MB",
                    "--total-size", "1GB"});
  if (!inv) {
    std::cerr << "generate parse failed: " << inv.error().what() << "\n";
    return false;
  }
  const auto& cfg = inv->config;
  if (inv->mode != zbench::RunMode::Generate || !cfg.output_dir || *cfg.output_dir != "./files" ||
      cfg.file_size != "10MB" || cfg.total_size != "1GB") {
    std::cerr << "generate options not mapped\n";
    return false;
  }
  if (cfg.warmup != 3 || cfg.wait_sec != 5 || !cfg.out_file || *cfg.out_file != "results.csv") {
    std::cerr << "defaults not applied\n";
    return false;
  }
  return true;
}

bool test_benchmark_subcommand() {
  auto inv = parse({"zbench", "benchmark", "--op", "delete", "--input-dir", "./files", "--del-cmd",
                    "rm-remote {file}", "--warmup", "0", "--out", "r.jsonl", "--no-log"});
  if (!inv) {
    std::cerr << "benchmark parse failed: " << inv.error().what() << "\n";
    return false;
  }
  const auto& cfg = inv->config;
  if (inv->mode != zbench::RunMode::Benchmark || inv->op != zbench::Operation::Delete) {
    std::cerr << "benchmark mode/op not mapped\n";
    return false;
  }
  if (!cfg.input_dir || *cfg.input_dir != "./files" || cfg.del_cmd != "rm-remote {file}" ||
      cfg.put_cmd.has_value() || cfg.warmup != 0 || !cfg.no_log || *cfg.out_file != "r.jsonl") {
    std::cerr << "benchmark options not mapped\n";
    return false;
  }
  return true;
}

bool test_top_level_templates_apply_to_benchmark() {
  auto inv = parse({"zbench", "--get-cmd", "fetch {file}", "benchmark", "--op", "get", "--input-dir",
                    "d"});
  if (!inv || inv->config.get_cmd != "fetch {file}") {
    std::cerr << "top-level --get-cmd should reach the benchmark config\n";
    return false;
  }
  return true;
}

bool test_full_cycle_flag() {
  auto inv = parse({"zbench", "--ALL", "--output-dir", "./files", "--file-size", "1MB",
                    "--total-size", "4MB", "--reuse-files"});
  if (!inv || inv->mode != zbench::RunMode::FullCycle || !inv->config.reuse_files ||
      inv->config.file_size != "1MB") {
    std::cerr << "--ALL options not mapped\n";
    return false;
  }
  return true;
}

bool test_rejections() {
  if (parse({"zbench"})) {
    std::cerr << "a mode is required\n";
    return false;
  }
  auto bad_op = parse({"zbench", "benchmark", "--op", "list", "--input-dir", "d"});
  if (bad_op || bad_op.error().code() != zbench::ErrorCode::InvalidConfiguration) {
    std::cerr << "unknown --op must be rejected\n";
    return false;
  }
  if (parse({"zbench", "benchmark", "--op", "get", "--input-dir", "d", "--warmup", "-1"})) {
    std::cerr << "negative --warmup must be rejected\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_generate_subcommand()) {
    return 1;
  }
  if (!test_benchmark_subcommand()) {
    return 1;
  }
  if (!test_top_level_templates_apply_to_benchmark()) {
    return 1;
  }
  if (!test_full_cycle_flag()) {
    return 1;
  }
  if (!test_rejections()) {
    return 1;
  }
  return 0;
}
