#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace zbench {

// A user-supplied shell command with a single substitution point. Nothing
// but the placeholder is rewritten; the rendered string goes to /bin/sh.
class CommandTemplate {
 public:
  static constexpr std::string_view kPlaceholder = "{file}";

  explicit CommandTemplate(std::string text);

  const std::string& text() const noexcept { return text_; }
  bool empty() const noexcept { return text_.empty(); }

  std::string render(const std::filesystem::path& file) const;

 private:
  std::string text_;
};

struct CommandOutcome {
  bool success{false};
  std::string error{};
  uint64_t latency_ns{};
};

class ICommandExecutor {
 public:
  virtual ~ICommandExecutor() = default;

  // Never throws: launch failures are reported through the outcome.
  virtual CommandOutcome execute(const std::string& command) noexcept = 0;
};

std::unique_ptr<ICommandExecutor> make_shell_executor();

}  // namespace zbench
