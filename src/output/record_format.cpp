#include "output/record_format.hpp"

#include <cstdio>
#include <sstream>

namespace zbench::app {
namespace {

const char* status_text(bool success) { return success ? "success" : "fail"; }

const char* bool_text(bool v) { return v ? "true" : "false"; }

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 when the
// bytes there are not valid UTF-8 (overlong forms and surrogates included).
size_t utf8_sequence_length(std::string_view s, size_t i) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) {
      lo = 0xA0;
    } else if (b0 == 0xED) {
      hi = 0x9F;
    }
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) {
      lo = 0x90;
    } else if (b0 == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }
  if (i + len > s.size()) {
    return 0;
  }
  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b1 < lo || b1 > hi) {
    return 0;
  }
  for (size_t k = 2; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (b < 0x80 || b > 0xBF) {
      return 0;
    }
  }
  return len;
}

}  // namespace

const std::string& csv_header() {
  static const std::string header =
      "timestamp_ns,operation,filename,size_bytes,latency_ns,status,error,warmup\n";
  return header;
}

std::string csv_escape(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char c : field) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  size_t i = 0;
  while (i < s.size()) {
    const char ch = s[i];
    const auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      const size_t len = utf8_sequence_length(s, i);
      if (len == 0) {
        out += "\\ufffd";
        ++i;
      } else {
        out.append(s.substr(i, len));
        i += len;
      }
      continue;
    }
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
    ++i;
  }
  return out;
}

std::string format_csv_row(const BenchmarkResult& r) {
  std::ostringstream os;
  os << r.timestamp_ns << ',' << operation_to_string(r.operation) << ',' << csv_escape(r.filename)
     << ',' << r.size_bytes << ',' << r.latency_ns << ',' << status_text(r.success) << ','
     << csv_escape(r.error) << ',' << bool_text(r.warmup) << '\n';
  return os.str();
}

std::string format_json_line(const BenchmarkResult& r) {
  std::ostringstream os;
  os << "{\"timestamp_ns\":" << r.timestamp_ns << ",\"operation\":\""
     << operation_to_string(r.operation) << "\",\"filename\":\"" << json_escape(r.filename)
     << "\",\"size_bytes\":" << r.size_bytes << ",\"latency_ns\":" << r.latency_ns
     << ",\"status\":\"" << status_text(r.success) << "\",\"error\":\"" << json_escape(r.error)
     << "\",\"warmup\":" << bool_text(r.warmup) << "}\n";
  return os.str();
}

}  // namespace zbench::app
