#pragma once

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace picam::core::logging {

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

// Accepts debug|info|warn|warning|error in any case.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// One line per record:
//   ts_utc=2024-01-01T00:00:00.000Z level=INFO component="still" msg="..." k="v"
//
// Values are always quoted. Control bytes are escaped, so forwarded stderr
// from a capture process can never split a record across lines.
//
// One logger is shared between API callers and the stream worker thread;
// records are written under a mutex and never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level);
  LogLevel MinLevel() const;

  void SetComponent(std::string component);
  std::string Component() const;

  bool ShouldLog(LogLevel level) const;

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
  mutable std::mutex mu_;
  LogLevel min_level_;
  std::ostream* out_;
  std::string component_ = "picam";
};

// Exposed for tests.
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts);
std::string QuoteLogValue(std::string_view raw);

} // namespace picam::core::logging
