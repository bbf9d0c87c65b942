#include "endon/log.hpp"
#include "endon/time_utils.hpp"

#include <atomic>
#include <ctime>

namespace endon {

namespace {

std::atomic<bool> g_color{true};

constexpr const char *kReset = "\033[0m";

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  }
  return "INFO";
}

const char *level_color(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warn:
    return "\033[33m";
  case LogLevel::Error:
  case LogLevel::Fatal:
    return "\033[31m";
  }
  return kReset;
}

} // namespace

void set_log_color(bool enabled) {
  g_color.store(enabled, std::memory_order_relaxed);
}

bool log_color_enabled() { return g_color.load(std::memory_order_relaxed); }

void write_log_line(std::FILE *out, LogLevel level, const std::string &tag,
                    const std::string &msg) {
  const std::string when = format_log_time(std::time(nullptr));
  // одна fprintf на строку — строки из разных потоков не перемешиваются
  if (log_color_enabled()) {
    std::fprintf(out, "%s %s%s [%s]:%s %s\n", when.c_str(), level_color(level),
                 level_name(level), tag.c_str(), kReset, msg.c_str());
  } else {
    std::fprintf(out, "%s %s [%s]: %s\n", when.c_str(), level_name(level),
                 tag.c_str(), msg.c_str());
  }
  std::fflush(out);
}

} // namespace endon
