#include "endon/config.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace endon {

Config load_config(const std::string &path) {
  Config c;
  std::ifstream f(path);
  if (!f)
    return c;

  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw ConfigError("config " + path + ": " + e.what());
  }
  if (!j.is_object())
    throw ConfigError("config " + path + ": top level must be an object");

  auto get = [&](auto key, auto def) {
    try {
      return j.contains(key) ? j[key].template get<std::decay_t<decltype(def)>>()
                             : def;
    } catch (const json::type_error &e) {
      throw ConfigError("config " + path + ": key \"" + key + "\": " +
                        e.what());
    }
  };

  // счётчики и размеры: только неотрицательные целые, иначе -1 станет 2^64-1
  auto get_count = [&](const char *key, std::size_t def) -> std::size_t {
    if (!j.contains(key))
      return def;
    if (!j[key].is_number_unsigned())
      throw ConfigError("config " + path + ": key \"" + key +
                        "\" must be a non-negative integer");
    return j[key].get<std::size_t>();
  };

  c.host = get("host", c.host);
  const int port = get("port", static_cast<int>(c.port));
  if (port < 0 || port > 65535)
    throw ConfigError("config " + path + ": port " + std::to_string(port) +
                      " out of range");
  c.port = static_cast<unsigned short>(port);
  c.http_threads = get_count("http_threads", c.http_threads);
  c.handler_threads = get_count("handler_threads", c.handler_threads);
  c.max_body_bytes = get_count("max_body_bytes", c.max_body_bytes);
  c.write_timeout_ms = get("write_timeout_ms", c.write_timeout_ms);
  c.log_color = get("log_color", c.log_color);

  c.store = get("store", c.store);

  c.influx_host = get("influx_host", c.influx_host);
  c.influx_token = get("influx_token", c.influx_token);
  c.influx_org = get("influx_org", c.influx_org);
  c.influx_bucket = get("influx_bucket", c.influx_bucket);

  c.ch_host = get("ch_host", c.ch_host);
  c.ch_port = get("ch_port", c.ch_port);
  c.ch_user = get("ch_user", c.ch_user);
  c.ch_password = get("ch_password", c.ch_password);
  c.ch_database = get("ch_database", c.ch_database);
  c.ch_table = get("ch_table", c.ch_table);
  c.ch_pool_size = get_count("ch_pool_size", c.ch_pool_size);

  return c;
}

std::optional<std::string> process_env(const char *name) {
  const char *v = std::getenv(name);
  if (!v)
    return std::nullopt;
  return std::string(v);
}

void apply_env(Config &cfg, const EnvLookup &lookup) {
  if (auto v = lookup("DOCKER_INFLUXDB_HOST"))
    cfg.influx_host = *v;
  if (auto v = lookup("DOCKER_INFLUXDB_TOKEN"))
    cfg.influx_token = *v;
  if (auto v = lookup("DOCKER_INFLUXDB_ORGANIZATION"))
    cfg.influx_org = *v;
  if (auto v = lookup("DOCKER_INFLUXDB_BUCKET"))
    cfg.influx_bucket = *v;
  if (auto v = lookup("ENDON_STORE"))
    cfg.store = *v;
  if (auto v = lookup("ENDON_PORT")) {
    char *end = nullptr;
    const long port = std::strtol(v->c_str(), &end, 10);
    if (v->empty() || *end != '\0' || port < 0 || port > 65535)
      throw ConfigError("ENDON_PORT is not a valid port: " + *v);
    cfg.port = static_cast<unsigned short>(port);
  }
}

void validate_config(const Config &cfg) {
  std::vector<std::string> problems;

  if (cfg.store == "influxdb") {
    if (cfg.influx_host.empty())
      problems.emplace_back("missing InfluxDB host (DOCKER_INFLUXDB_HOST)");
    if (cfg.influx_token.empty())
      problems.emplace_back("missing InfluxDB token (DOCKER_INFLUXDB_TOKEN)");
    if (cfg.influx_org.empty())
      problems.emplace_back(
          "missing InfluxDB organization (DOCKER_INFLUXDB_ORGANIZATION)");
    if (cfg.influx_bucket.empty())
      problems.emplace_back("missing InfluxDB bucket (DOCKER_INFLUXDB_BUCKET)");
  } else if (cfg.store == "clickhouse") {
    if (cfg.ch_port < 0 || cfg.ch_port > 65535)
      problems.emplace_back("ch_port is out of range (0..65535)");
    if (cfg.ch_table.empty())
      problems.emplace_back("ch_table is empty");
    if (cfg.ch_pool_size == 0)
      problems.emplace_back("ch_pool_size must be >= 1");
  } else {
    problems.emplace_back("unknown store \"" + cfg.store +
                          "\" (expected influxdb or clickhouse)");
  }

  if (cfg.http_threads == 0)
    problems.emplace_back("http_threads must be >= 1");
  if (cfg.handler_threads == 0)
    problems.emplace_back("handler_threads must be >= 1");
  if (cfg.max_body_bytes == 0)
    problems.emplace_back("max_body_bytes must be > 0");
  if (cfg.write_timeout_ms <= 0)
    problems.emplace_back("write_timeout_ms must be > 0");

  if (problems.empty())
    return;

  std::string msg = "invalid configuration:";
  for (const auto &p : problems)
    msg += "\n  - " + p;
  throw ConfigError(msg);
}

} // namespace endon
