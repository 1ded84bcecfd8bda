#include "zbench/core/types.hpp"

#include <string>

namespace zbench {

const char* operation_to_string(Operation op) noexcept {
  switch (op) {
    case Operation::Put:
      return "PUT";
    case Operation::Get:
      return "GET";
    case Operation::Delete:
      return "DELETE";
  }
  return "GET";
}

Expected<Operation> parse_operation(std::string_view name) {
  if (name == "put") {
    return Operation::Put;
  }
  if (name == "get") {
    return Operation::Get;
  }
  if (name == "delete") {
    return Operation::Delete;
  }
  return fail(ErrorCode::InvalidConfiguration,
              "invalid operation '" + std::string(name) + "' (expected put, get or delete)");
}

const std::optional<std::string>& command_for(const Config& cfg, Operation op) noexcept {
  switch (op) {
    case Operation::Put:
      return cfg.put_cmd;
    case Operation::Get:
      return cfg.get_cmd;
    case Operation::Delete:
      return cfg.del_cmd;
  }
  return cfg.get_cmd;
}

}  // namespace zbench
