#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "zbench/core/expected.hpp"
#include "zbench/core/types.hpp"
#include "zbench/exec/command.hpp"

namespace zbench {

// Regular files directly inside |dir| whose names end in .bin, dotfiles
// included, sorted by path.
Expected<FileManifest> discover_input_files(const std::filesystem::path& dir);

class Orchestrator {
 public:
  explicit Orchestrator(Config cfg);
  Orchestrator(Config cfg, std::unique_ptr<ICommandExecutor> executor);

  Expected<GenerationResult> run_generate();

  // Warmup, measured phase, then every recorded result goes to the sink,
  // including when the measured phase aborted.
  Expected<void> run_benchmark(Operation op);

  // Acknowledges invocation only; generate/PUT/GET/DELETE sequencing is not
  // defined yet.
  Expected<void> run_full_cycle();

  const std::vector<BenchmarkResult>& last_results() const noexcept { return last_results_; }

 private:
  Expected<void> persist(const std::vector<BenchmarkResult>& results);

  const Config cfg_;
  std::unique_ptr<ICommandExecutor> executor_;
  std::vector<BenchmarkResult> last_results_;
};

}  // namespace zbench
