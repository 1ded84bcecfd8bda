#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "zbench/exec/command.hpp"

namespace {

bool test_template_substitutes_every_placeholder() {
  const zbench::CommandTemplate tmpl("cp {file} /tmp/x && stat {file}");
  const auto cmd = tmpl.render("data/file_0001.bin");
  if (cmd != "cp data/file_0001.bin /tmp/x && stat data/file_0001.bin") {
    std::cerr << "unexpected rendering: " << cmd << "\n";
    return false;
  }
  return true;
}

bool test_template_leaves_other_braces_alone() {
  const zbench::CommandTemplate tmpl("echo {size} {FILE} {file");
  const auto cmd = tmpl.render("a.bin");
  if (cmd != "echo {size} {FILE} {file") {
    std::cerr << "only {file} may be substituted, got: " << cmd << "\n";
    return false;
  }
  const zbench::CommandTemplate plain("true");
  if (plain.render("a.bin") != "true" || plain.empty()) {
    std::cerr << "template without placeholder must render unchanged\n";
    return false;
  }
  return true;
}

bool test_success_reports_latency() {
  auto exec = zbench::make_shell_executor();
  const auto out = exec->execute("true");
  if (!out.success || !out.error.empty()) {
    std::cerr << "expected success for 'true', got error: " << out.error << "\n";
    return false;
  }
  if (out.latency_ns == 0) {
    std::cerr << "expected positive latency\n";
    return false;
  }
  return true;
}

bool test_failure_captures_trimmed_stderr() {
  auto exec = zbench::make_shell_executor();
  const auto out = exec->execute("echo '  upload refused  ' >&2; echo ignored; exit 3");
  if (out.success) {
    std::cerr << "expected failure for exit 3\n";
    return false;
  }
  if (out.error != "upload refused") {
    std::cerr << "unexpected error text: [" << out.error << "]\n";
    return false;
  }
  if (out.latency_ns == 0) {
    std::cerr << "latency must be measured for failed commands too\n";
    return false;
  }
  return true;
}

bool test_failure_without_stderr_has_generic_message() {
  auto exec = zbench::make_shell_executor();
  const auto out = exec->execute("exit 7");
  if (out.success || out.error.empty()) {
    std::cerr << "expected failure with a generic description\n";
    return false;
  }
  if (out.error.find("7") == std::string::npos) {
    std::cerr << "generic description should name the exit status: " << out.error << "\n";
    return false;
  }
  return true;
}

bool test_rendered_command_reaches_the_file() {
  const std::filesystem::path dir = "./zbench_test_exec";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  const auto src = dir / "file_0001.bin";
  {
    std::ofstream f(src, std::ios::binary);
    f << "payload";
  }

  const zbench::CommandTemplate tmpl("cp {file} " + (dir / "copy.bin").string());
  auto exec = zbench::make_shell_executor();
  const auto out = exec->execute(tmpl.render(src));
  if (!out.success) {
    std::cerr << "cp failed: " << out.error << "\n";
    return false;
  }
  if (!std::filesystem::exists(dir / "copy.bin")) {
    std::cerr << "copy was not created\n";
    return false;
  }
  std::filesystem::remove_all(dir, ec);
  return true;
}

}  // namespace

int main() {
  if (!test_template_substitutes_every_placeholder()) {
    return 1;
  }
  if (!test_template_leaves_other_braces_alone()) {
    return 1;
  }
  if (!test_success_reports_latency()) {
    return 1;
  }
  if (!test_failure_captures_trimmed_stderr()) {
    return 1;
  }
  if (!test_failure_without_stderr_has_generic_message()) {
    return 1;
  }
  if (!test_rendered_command_reaches_the_file()) {
    return 1;
  }
  return 0;
}
