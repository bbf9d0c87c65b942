#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace endon {

// Наносекунды с начала эпохи (UTC) — точность, в которой пишем точки.
inline std::int64_t to_unix_nanos(std::chrono::system_clock::time_point tp) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          tp.time_since_epoch())
          .count());
}

// "YYYY/MM/DD HH:MM:SS" в локальном времени, префикс строк лога
inline std::string format_log_time(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y/%m/%d %H:%M:%S", &tm);
  return std::string(buf, n);
}

} // namespace endon
