#pragma once

#include <vector>

#include "zbench/core/expected.hpp"
#include "zbench/core/types.hpp"
#include "zbench/exec/command.hpp"

namespace zbench {

// Runs one operation's command template over a manifest. Warmup failures
// are recorded and ignored; the first measured failure stops the phase.
// Results of both phases accumulate in one log, in execution order.
class BenchmarkRunner {
 public:
  BenchmarkRunner(const Config& cfg, ICommandExecutor& executor);

  Expected<void> run_warmup(Operation op, const FileManifest& files);
  Expected<void> run_measured(Operation op, const FileManifest& files);

  const std::vector<BenchmarkResult>& results() const noexcept { return results_; }

 private:
  Expected<CommandTemplate> template_for(Operation op) const;
  const BenchmarkResult& run_one(Operation op,
                                 const CommandTemplate& tmpl,
                                 const std::filesystem::path& file,
                                 bool warmup);

  const Config& cfg_;
  ICommandExecutor& executor_;
  std::vector<BenchmarkResult> results_;
};

}  // namespace zbench
