#include "zbench/core/error.hpp"

namespace zbench {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidSizeFormat:
      return "InvalidSizeFormat";
    case ErrorCode::InsufficientDiskSpace:
      return "InsufficientDiskSpace";
    case ErrorCode::InvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorCode::MissingCommandTemplate:
      return "MissingCommandTemplate";
    case ErrorCode::CommandExecutionFailure:
      return "CommandExecutionFailure";
    case ErrorCode::NoInputFiles:
      return "NoInputFiles";
    case ErrorCode::IoError:
      return "IoError";
    case ErrorCode::Interrupted:
      return "Interrupted";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Internal";
}

}  // namespace zbench
