#pragma once

#include <exception>
#include <string>
#include <utility>

namespace zbench {

enum class ErrorCode {
  InvalidSizeFormat,
  InsufficientDiskSpace,
  InvalidConfiguration,
  MissingCommandTemplate,
  CommandExecutionFailure,
  NoInputFiles,
  IoError,
  Interrupted,
  Internal,
};

const char* error_code_name(ErrorCode code) noexcept;

class Error : public std::exception {
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};

public:
  Error() = default;
  Error(ErrorCode c, std::string m) : code_(c), message_(std::move(m)) {}

  const char *what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }
};

} // namespace zbench
