#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace endon {

// имя measurement'а для всех отчётов об ошибках
inline constexpr const char *kErrorMeasurement = "error_logs";

// Отчёт об ошибке, как он приходит в теле POST /
struct ErrorReport {
  std::string service;
  std::string endpoint;
  std::string error;
  std::string traceback; // необязательное поле
};

using FieldValue = std::variant<std::string, double, std::int64_t, bool>;

// Точка timeseries: measurement + теги (индексируются) + поля + время
struct Point {
  std::string measurement;
  std::map<std::string, std::string> tags;
  std::map<std::string, FieldValue> fields;
  std::chrono::system_clock::time_point ts;
};

struct Config {
  std::string host = "0.0.0.0";
  unsigned short port = 80;
  std::size_t http_threads = 4;
  std::size_t handler_threads = 8;
  std::size_t max_body_bytes = 1024 * 1024;
  int write_timeout_ms = 5000; // дедлайн одного запроса к хранилищу
  bool log_color = true;

  std::string store = "influxdb"; // influxdb | clickhouse

  // InfluxDB 2
  std::string influx_host;
  std::string influx_token;
  std::string influx_org;
  std::string influx_bucket;

  // ClickHouse
  std::string ch_host = "127.0.0.1";
  int ch_port = 9000;
  std::string ch_user = "default";
  std::string ch_password = "";
  std::string ch_database = "endon";
  std::string ch_table = "error_logs";
  std::size_t ch_pool_size = 4;
};

} // namespace endon
