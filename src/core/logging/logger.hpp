#pragma once

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diststage::core::logging {

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

inline const char* ToString(LogLevel level) {
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

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

// Accepts the same spellings from `--log-level` and the `log_level` config key.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  static const std::pair<std::string_view, LogLevel> kSpellings[] = {
      {"debug", LogLevel::kDebug}, {"info", LogLevel::kInfo},   {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
  };
  for (const auto& [spelling, parsed] : kSpellings) {
    if (normalized == spelling) {
      level = parsed;
      return true;
    }
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis_component << 'Z';
  return out.str();
}

// Line-oriented key=value logger shared by every goal.
//
// Output shape:
//   ts_utc=<iso8601> level=<LEVEL> goal="<goal>" msg="<text>" key="value" ...
//
// Registered secrets (svn passwords) are replaced by ******** wherever they
// occur in a message or field value.
class Logger {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }
  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetGoal(std::string goal) {
    goal_ = std::move(goal);
  }
  const std::string& Goal() const {
    return goal_;
  }

  // Tests pin the timestamp; production uses system_clock.
  void SetClock(Clock clock) {
    clock_ = std::move(clock);
  }

  // Empty values are ignored.
  void RedactSecret(std::string secret) {
    if (!secret.empty()) {
      secrets_.push_back(std::move(secret));
    }
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcTimestamp(clock_ ? clock_()
                                                              : std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " goal=" + Quote(goal_);
    line += " msg=" + Quote(Redact(message));
    for (const auto& field : fields) {
      line += ' ';
      line.append(field.key.data(), field.key.size());
      line += '=' + Quote(Redact(field.value));
    }
    line += '\n';

    (*out_) << line;
    out_->flush();
  }

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
  std::string Redact(std::string_view raw) const {
    std::string text(raw);
    for (const std::string& secret : secrets_) {
      std::size_t pos = 0;
      while ((pos = text.find(secret, pos)) != std::string::npos) {
        text.replace(pos, secret.size(), "********");
        pos += 8;
      }
    }
    return text;
  }

  static std::string Quote(std::string_view raw) {
    std::string quoted;
    quoted.reserve(raw.size() + 2);
    quoted.push_back('"');
    for (const char c : raw) {
      switch (c) {
      case '\\':
        quoted += "\\\\";
        break;
      case '"':
        quoted += "\\\"";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        quoted.push_back(c);
        break;
      }
    }
    quoted.push_back('"');
    return quoted;
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string goal_ = "-";
  Clock clock_;
  std::vector<std::string> secrets_;
};

} // namespace diststage::core::logging
