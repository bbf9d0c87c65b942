#pragma once
#include <cstdio>
#include <string>

namespace endon {

enum class LogLevel { Info, Warn, Error, Fatal };

// Включается один раз при старте из Config::log_color
void set_log_color(bool enabled);
bool log_color_enabled();

// "2024/01/31 12:00:00 INFO [tag]: msg\n" в out, с fflush
void write_log_line(std::FILE *out, LogLevel level, const std::string &tag,
                    const std::string &msg);

inline void log_info(const char *tag, const std::string &msg) {
  write_log_line(stderr, LogLevel::Info, tag, msg);
}

inline void log_warn(const char *tag, const std::string &msg) {
  write_log_line(stderr, LogLevel::Warn, tag, msg);
}

inline void log_err(const char *tag, const std::string &msg) {
  write_log_line(stderr, LogLevel::Error, tag, msg);
}

inline void log_fatal(const char *tag, const std::string &msg) {
  write_log_line(stderr, LogLevel::Fatal, tag, msg);
}

} // namespace endon
