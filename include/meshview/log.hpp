/**
 * @file log.hpp
 * @brief Shell-friendly `key=value` log lines on stderr.
 *
 * @details
 * Every line looks like the status lines the CLI tools print:
 *
 * @code
 *   level=warn event=store_drop packet=!0000002a/77 attempts=4
 * @endcode
 *
 * A line is assembled in a LogLine and written once, under a process-wide
 * sink mutex, when the LogLine goes out of scope. Lines from concurrent
 * workers therefore never interleave. Values containing spaces, quotes or
 * `=` are double-quoted.
 *
 * Lines below the current threshold cost one comparison; the builder
 * discards `kv()` calls without formatting.
 */

#ifndef MESHVIEW_LOG_HPP
#define MESHVIEW_LOG_HPP

#include <stdint.h>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace meshview {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Current threshold (default Info).
void set_log_level(LogLevel lvl);
LogLevel log_level();

/// Redirect the sink (tests); nullptr restores std::cerr.
void set_log_stream(std::ostream* os);

const char* log_level_name(LogLevel lvl);
std::optional<LogLevel> parse_log_level(const std::string& s);

class LogLine {
public:
  LogLine(LogLevel lvl, const char* event);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& kv(const char* key, const T& value) {
    if (!enabled_) return *this;
    std::ostringstream tmp;
    tmp << value;
    append(key, tmp.str());
    return *this;
  }

  LogLine& kv(const char* key, const std::string& value) {
    if (enabled_) append(key, value);
    return *this;
  }

  LogLine& kv(const char* key, const char* value) {
    if (enabled_) append(key, value ? std::string(value) : std::string());
    return *this;
  }

private:
  void append(const char* key, const std::string& value);

  bool enabled_;
  std::string line_;
};

} // namespace meshview

#endif // MESHVIEW_LOG_HPP
