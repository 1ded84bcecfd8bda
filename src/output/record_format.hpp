#pragma once

#include <string>
#include <string_view>

#include "zbench/core/types.hpp"

namespace zbench::app {

// timestamp_ns,operation,filename,size_bytes,latency_ns,status,error,warmup
const std::string& csv_header();

std::string csv_escape(std::string_view field);
std::string json_escape(std::string_view s);

// Both return a complete line including the trailing '\n'.
std::string format_csv_row(const BenchmarkResult& r);
std::string format_json_line(const BenchmarkResult& r);

}  // namespace zbench::app
