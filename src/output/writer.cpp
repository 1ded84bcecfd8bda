#include "zbench/output/writer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "output/record_format.hpp"

namespace zbench {
namespace {

Expected<std::ofstream> open_append(const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::out | std::ios::app | std::ios::binary);
  if (!out.is_open()) {
    return fail(ErrorCode::IoError, "failed to open output file: " + path.string());
  }
  return out;
}

Expected<void> finish(std::ofstream& out, const std::filesystem::path& path) {
  out.flush();
  if (!out) {
    return fail(ErrorCode::IoError, "failed to write output file: " + path.string());
  }
  return {};
}

}  // namespace

SinkFormat sink_format_for(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".csv" ? SinkFormat::Csv : SinkFormat::JsonLines;
}

OutputWriter::OutputWriter(std::filesystem::path path, bool no_log)
    : path_(std::move(path)), no_log_(no_log), format_(sink_format_for(path_)) {}

Expected<void> OutputWriter::write_result(const BenchmarkResult& result) {
  if (no_log_) {
    return {};
  }
  buffer_.push_back(result);
  if (buffer_.size() >= kFlushThreshold) {
    return flush();
  }
  return {};
}

Expected<void> OutputWriter::flush() {
  if (no_log_ || buffer_.empty()) {
    return {};
  }
  auto wr = format_ == SinkFormat::Csv ? write_csv() : write_jsonl();
  if (!wr) {
    return wr;
  }
  buffer_.clear();
  ++flushes_;
  return {};
}

Expected<void> OutputWriter::write_csv() {
  std::error_code ec;
  const bool existed = std::filesystem::exists(path_, ec);

  auto out = open_append(path_);
  if (!out) {
    return unexpected<Error>(out.error());
  }
  if (!existed) {
    *out << app::csv_header();
  }
  for (const auto& r : buffer_) {
    *out << app::format_csv_row(r);
  }
  return finish(*out, path_);
}

Expected<void> OutputWriter::write_jsonl() {
  auto out = open_append(path_);
  if (!out) {
    return unexpected<Error>(out.error());
  }
  for (const auto& r : buffer_) {
    *out << app::format_json_line(r);
  }
  return finish(*out, path_);
}

}  // namespace zbench
