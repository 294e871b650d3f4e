#include "metro/Log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace metro {

namespace {

std::mutex g_mutex;
LogLevel g_minLevel = LogLevel::Info;
LogSink g_sink;

std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

LogLevel ParseLogLevel(const std::string& s, LogLevel fallback)
{
  const std::string k = ToLower(s);
  if (k == "trace" || k == "all") return LogLevel::Trace;
  if (k == "debug") return LogLevel::Debug;
  if (k == "info") return LogLevel::Info;
  if (k == "warn" || k == "warning") return LogLevel::Warn;
  if (k == "error") return LogLevel::Error;
  if (k == "none" || k == "off" || k == "quiet") return LogLevel::None;
  return fallback;
}

const char* LogLevelName(LogLevel level)
{
  switch (level) {
  case LogLevel::Trace: return "TRACE";
  case LogLevel::Debug: return "DEBUG";
  case LogLevel::Info: return "INFO";
  case LogLevel::Warn: return "WARN";
  case LogLevel::Error: return "ERROR";
  case LogLevel::None: return "NONE";
  default: return "LOG";
  }
}

void SetLogLevel(LogLevel minLevel)
{
  std::scoped_lock<std::mutex> lock(g_mutex);
  g_minLevel = minLevel;
}

LogLevel GetLogLevel()
{
  std::scoped_lock<std::mutex> lock(g_mutex);
  return g_minLevel;
}

void SetLogSink(LogSink sink)
{
  std::scoped_lock<std::mutex> lock(g_mutex);
  g_sink = std::move(sink);
}

void LogMessage(LogLevel level, const std::string& message)
{
  std::scoped_lock<std::mutex> lock(g_mutex);
  if (level == LogLevel::None || level < g_minLevel) return;

  if (g_sink) {
    g_sink(level, message);
    return;
  }

  std::ostream& os = std::cerr;
  os << "[metro:" << LogLevelName(level) << "] " << message;
  if (message.empty() || message.back() != '\n') os << "\n";
  os.flush();
}

} // namespace metro
