// ============================================================================
// log.cpp — implementation for meshview/log.hpp
// ============================================================================
#include "meshview/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace meshview {

namespace {
std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::mutex g_sink_mu;                 // one writer at a time; guards g_sink too
std::ostream* g_sink = nullptr;       // nullptr = std::cerr

bool needs_quotes(const std::string& v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}
} // namespace

void set_log_level(LogLevel lvl) { g_level.store(static_cast<uint8_t>(lvl)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_stream(std::ostream* os) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink = os;
}

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
  if (s == "debug") return LogLevel::Debug;
  if (s == "info")  return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return std::nullopt;
}

LogLine::LogLine(LogLevel lvl, const char* event)
: enabled_(static_cast<uint8_t>(lvl) >= g_level.load()) {
  if (!enabled_) return;
  line_.reserve(128);
  line_ += "level=";
  line_ += log_level_name(lvl);
  line_ += " event=";
  line_ += event;
}

LogLine::~LogLine() {
  if (!enabled_) return;
  line_ += '\n';
  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << line_;
  os.flush();
}

// append() — POLICY: quote values a shell `read`/awk split would mangle; escape inner quotes.
void LogLine::append(const char* key, const std::string& value) {
  line_ += ' ';
  line_ += key;
  line_ += '=';
  if (!needs_quotes(value)) {
    line_ += value;
    return;
  }
  line_ += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') line_ += '\\';
    if (c == '\n') { line_ += "\\n"; continue; }
    line_ += c;
  }
  line_ += '"';
}

} // namespace meshview
