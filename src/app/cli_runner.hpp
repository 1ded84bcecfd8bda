#pragma once

#include "zbench/core/expected.hpp"
#include "zbench/core/types.hpp"

int run_cli_impl(int argc, char** argv);

namespace zbench::app {

struct CliInvocation {
  RunMode mode{RunMode::Benchmark};
  Operation op{Operation::Get};
  Config config{};
};

zbench::Expected<CliInvocation> parse_args(int argc, char** argv);

}  // namespace zbench::app
