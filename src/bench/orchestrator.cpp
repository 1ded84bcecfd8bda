#include "zbench/bench/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include "zbench/bench/runner.hpp"
#include "zbench/dataset/generator.hpp"
#include "zbench/output/writer.hpp"

namespace zbench {
namespace {

std::string op_label(Operation op) {
  std::string s = operation_to_string(op);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

Expected<FileManifest> discover_input_files(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return fail(ErrorCode::NoInputFiles, "Input directory does not exist: " + dir.string());
  }

  FileManifest files;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return fail(ErrorCode::IoError, "failed to list " + dir.string() + ": " + ec.message());
  }
  for (const auto& entry : it) {
    const auto name = entry.path().filename().string();
    if (!name.ends_with(".bin")) {
      continue;
    }
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    files.push_back(entry.path());
  }

  if (files.empty()) {
    return fail(ErrorCode::NoInputFiles, "No .bin files found in input directory: " + dir.string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

Orchestrator::Orchestrator(Config cfg) : Orchestrator(std::move(cfg), make_shell_executor()) {}

Orchestrator::Orchestrator(Config cfg, std::unique_ptr<ICommandExecutor> executor)
    : cfg_(std::move(cfg)), executor_(std::move(executor)) {}

Expected<GenerationResult> Orchestrator::run_generate() {
  FileGenerator generator(cfg_);
  return generator.generate();
}

Expected<void> Orchestrator::run_benchmark(Operation op) {
  if (!cfg_.input_dir) {
    return fail(ErrorCode::NoInputFiles, "Input directory does not exist");
  }
  auto files = discover_input_files(*cfg_.input_dir);
  if (!files) {
    return unexpected<Error>(files.error());
  }

  std::cout << "Running " << op_label(op) << " benchmark on " << files->size() << " files...\n";

  BenchmarkRunner runner(cfg_, *executor_);
  auto run = runner.run_warmup(op, *files);
  if (run) {
    run = runner.run_measured(op, *files);
  }
  last_results_ = runner.results();

  auto saved = persist(last_results_);
  if (!run) {
    if (!saved) {
      std::cerr << "[warn] " << saved.error().what() << "\n";
    }
    return run;
  }
  if (!saved) {
    return saved;
  }

  std::cout << "Completed " << op_label(op) << " benchmark\n";
  return {};
}

Expected<void> Orchestrator::run_full_cycle() {
  std::cout << "Running full benchmark cycle\n";
  return {};
}

Expected<void> Orchestrator::persist(const std::vector<BenchmarkResult>& results) {
  if (!cfg_.out_file) {
    return {};
  }
  OutputWriter writer(*cfg_.out_file, cfg_.no_log);
  for (const auto& r : results) {
    auto wr = writer.write_result(r);
    if (!wr) {
      return wr;
    }
  }
  return writer.flush();
}

}  // namespace zbench
