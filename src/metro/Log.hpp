#pragma once

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace metro {

// Leveled diagnostics for the headless core.
//
// Messages go to std::cerr as "[metro:LEVEL] text" unless a sink is installed.
// The core never logs on the hot path of a healthy tick; logging is reserved for
// skipped inconsistencies, persistence problems and lifecycle events.

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug,
  Info,
  Warn,
  Error,
  None,
};

// Accepted values (case-insensitive):
//   trace, debug, info, warn, warning, error, none, off, quiet
// Returns `fallback` if `s` is not recognized.
LogLevel ParseLogLevel(const std::string& s, LogLevel fallback);

const char* LogLevelName(LogLevel level);

void SetLogLevel(LogLevel minLevel);
LogLevel GetLogLevel();

// Replace the output sink (tests capture messages this way). Pass an empty
// function to restore the default std::cerr sink.
using LogSink = std::function<void(LogLevel level, const std::string& message)>;
void SetLogSink(LogSink sink);

void LogMessage(LogLevel level, const std::string& message);

inline bool LogEnabled(LogLevel level) { return level != LogLevel::None && level >= GetLogLevel(); }

// Builds one message and hands it to LogMessage when the statement ends:
//
//   LogLine(LogLevel::Warn) << "train " << id << " has no line";
//
// Nothing is formatted when the level is filtered out.
class LogLine {
public:
  explicit LogLine(LogLevel level) : m_level(level), m_enabled(LogEnabled(level)) {}
  ~LogLine()
  {
    if (m_enabled) LogMessage(m_level, m_oss.str());
  }

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value)
  {
    if (m_enabled) m_oss << value;
    return *this;
  }

private:
  LogLevel m_level;
  bool m_enabled;
  std::ostringstream m_oss;
};

} // namespace metro
