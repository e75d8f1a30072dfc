#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace camctl::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

const char* ToString(LogLevel level);

// Accepts debug|info|warn|warning|error, case-insensitive.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// Names the calling thread in every record it emits ("main" when unset).
// Tags are thread-local, so the producer and each consumer worker label
// their own lines without coordinating.
class ScopedThreadTag {
public:
  explicit ScopedThreadTag(std::string tag);
  ~ScopedThreadTag();

  ScopedThreadTag(const ScopedThreadTag&) = delete;
  ScopedThreadTag& operator=(const ScopedThreadTag&) = delete;

private:
  std::string previous_;
};

std::string CurrentThreadTag();

// Line-oriented key=value logger shared by the producer and every consumer.
//
// Output shape:
//   ts_utc=<iso8601> level=<LEVEL> device="<path>" thread="<tag>" msg="<text>" k="v"...
// Each record is formatted off-lock and written with one stream insertion,
// so concurrent records never interleave within a line.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level);
  LogLevel MinLevel() const;
  bool ShouldLog(LogLevel level) const;

  // Device path of the active session; "-" when none is open.
  void SetDevice(std::string device_path);
  std::string Device() const;

  // Records written since construction, across all levels that passed the filter.
  std::uint64_t RecordCount() const;

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {});

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }
  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }
  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }
  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  std::atomic<LogLevel> min_level_;
  std::atomic<std::uint64_t> records_{0U};
  std::ostream* out_;

  mutable std::mutex mu_;
  std::string device_ = "-";
};

} // namespace camctl::core::logging
