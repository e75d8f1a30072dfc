#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace camctl::core::logging {

namespace {

thread_local std::string tls_thread_tag = "main";

std::string FormatUtcTimestamp(const std::chrono::system_clock::time_point ts) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const int millis_component = static_cast<int>((millis % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis_component << 'Z';
  return out.str();
}

// Quotes `raw`; backslash, quote and control bytes are escaped so one record
// always stays on one line.
void AppendQuoted(std::ostringstream& out, std::string_view raw) {
  out << '"';
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out << "\\\\";
      break;
    case '"':
      out << "\\\"";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned char>(c));
        out << hex;
      } else {
        out << c;
      }
      break;
    }
  }
  out << '"';
}

} // namespace

const char* ToString(const LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid log level '" + std::string(raw) + "' (expected debug|info|warn|error)";
    return false;
  }
  return true;
}

ScopedThreadTag::ScopedThreadTag(std::string tag) : previous_(std::move(tls_thread_tag)) {
  tls_thread_tag = std::move(tag);
}

ScopedThreadTag::~ScopedThreadTag() {
  tls_thread_tag = std::move(previous_);
}

std::string CurrentThreadTag() {
  return tls_thread_tag;
}

Logger::Logger(const LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

void Logger::SetMinLevel(const LogLevel level) {
  min_level_.store(level);
}

LogLevel Logger::MinLevel() const {
  return min_level_.load();
}

bool Logger::ShouldLog(const LogLevel level) const {
  return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

void Logger::SetDevice(std::string device_path) {
  std::lock_guard<std::mutex> lock(mu_);
  device_ = device_path.empty() ? "-" : std::move(device_path);
}

std::string Logger::Device() const {
  std::lock_guard<std::mutex> lock(mu_);
  return device_;
}

std::uint64_t Logger::RecordCount() const {
  return records_.load();
}

void Logger::Log(const LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) {
  if (!ShouldLog(level)) {
    return;
  }

  std::ostringstream line;
  line << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
       << " level=" << ToString(level) << " device=";
  AppendQuoted(line, Device());
  line << " thread=";
  AppendQuoted(line, tls_thread_tag);
  line << " msg=";
  AppendQuoted(line, message);
  for (const LogFieldView& field : fields) {
    line << ' ' << field.key << '=';
    AppendQuoted(line, field.value);
  }
  line << '\n';

  const std::string text = line.str();
  std::lock_guard<std::mutex> lock(mu_);
  (*out_) << text;
  out_->flush();
  records_.fetch_add(1U);
}

} // namespace camctl::core::logging
