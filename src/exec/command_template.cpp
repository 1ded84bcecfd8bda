#include "zbench/exec/command.hpp"

#include <utility>

namespace zbench {

CommandTemplate::CommandTemplate(std::string text) : text_(std::move(text)) {}

std::string CommandTemplate::render(const std::filesystem::path& file) const {
  const std::string target = file.string();
  std::string out;
  out.reserve(text_.size() + target.size());

  size_t pos = 0;
  while (true) {
    const size_t hit = text_.find(kPlaceholder, pos);
    if (hit == std::string::npos) {
      out.append(text_, pos, std::string::npos);
      break;
    }
    out.append(text_, pos, hit - pos);
    out.append(target);
    pos = hit + kPlaceholder.size();
  }
  return out;
}

}  // namespace zbench
