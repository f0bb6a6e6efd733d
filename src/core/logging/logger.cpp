#include "core/logging/logger.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace picam::core::logging {

namespace {

constexpr std::string_view kExpectedLevels = "debug|info|warn|error";

struct LevelName {
  std::string_view name;
  LogLevel level;
};

constexpr std::array<LevelName, 5> kLevelNames = {{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto a = static_cast<unsigned char>(lhs[i]);
    const auto b = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(a) != std::tolower(b)) {
      return false;
    }
  }
  return true;
}

void AppendEscaped(std::string_view raw, std::string& out) {
  constexpr char kHex[] = "0123456789abcdef";
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
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
    default: {
      const auto byte = static_cast<unsigned char>(c);
      if (byte < 0x20U || byte == 0x7FU) {
        out += "\\x";
        out.push_back(kHex[byte >> 4U]);
        out.push_back(kHex[byte & 0x0FU]);
      } else {
        out.push_back(c);
      }
      break;
    }
    }
  }
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
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kExpectedLevels) + ")";
    return false;
  }

  for (const auto& entry : kLevelNames) {
    if (EqualsIgnoreCase(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " +
          std::string(kExpectedLevels) + ")";
  return false;
}

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

std::string QuoteLogValue(std::string_view raw) {
  std::string quoted;
  quoted.reserve(raw.size() + 2U);
  quoted.push_back('"');
  AppendEscaped(raw, quoted);
  quoted.push_back('"');
  return quoted;
}

Logger::Logger(const LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

void Logger::SetMinLevel(const LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  min_level_ = level;
}

LogLevel Logger::MinLevel() const {
  std::lock_guard<std::mutex> lock(mu_);
  return min_level_;
}

void Logger::SetComponent(std::string component) {
  std::lock_guard<std::mutex> lock(mu_);
  component_ = std::move(component);
}

std::string Logger::Component() const {
  std::lock_guard<std::mutex> lock(mu_);
  return component_;
}

bool Logger::ShouldLog(const LogLevel level) const {
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(const LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) {
  const std::string timestamp = FormatUtcTimestamp(std::chrono::system_clock::now());

  std::lock_guard<std::mutex> lock(mu_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }

  // Build the whole record first so a failing stream never sees half a line.
  std::string line;
  line.reserve(96U + message.size());
  line += "ts_utc=";
  line += timestamp;
  line += " level=";
  line += ToString(level);
  line += " component=";
  line += QuoteLogValue(component_);
  line += " msg=";
  line += QuoteLogValue(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    line += QuoteLogValue(field.value);
  }
  line.push_back('\n');

  (*out_) << line;
  out_->flush();
}

} // namespace picam::core::logging
