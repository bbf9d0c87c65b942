#include <gtest/gtest.h>
#include <endon/config.hpp>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

using namespace endon;

namespace {

std::string write_temp(const std::string &content) {
  char path[] = "/tmp/endon_cfg_XXXXXX";
  const int fd = mkstemp(path);
  if (fd >= 0)
    close(fd);
  std::ofstream(path) << content;
  return path;
}

EnvLookup env_of(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const char *name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end())
      return std::nullopt;
    return it->second;
  };
}

Config influx_ready() {
  Config c;
  c.influx_host = "http://endon-db:8086";
  c.influx_token = "t0ken";
  c.influx_org = "endon";
  c.influx_bucket = "errors";
  return c;
}

} // namespace

TEST(Config, MissingFileGivesDefaults) {
  const Config c = load_config("/nonexistent/endon/server.json");
  EXPECT_EQ(c.host, "0.0.0.0");
  EXPECT_EQ(c.port, 80);
  EXPECT_EQ(c.store, "influxdb");
  EXPECT_EQ(c.max_body_bytes, 1024u * 1024u);
}

TEST(Config, LoadsKeysFromFile) {
  const auto path = write_temp(R"({
    "port": 8081,
    "http_threads": 2,
    "write_timeout_ms": 750,
    "log_color": false,
    "store": "clickhouse",
    "ch_table": "errs"
  })");

  const Config c = load_config(path);
  EXPECT_EQ(c.port, 8081);
  EXPECT_EQ(c.http_threads, 2u);
  EXPECT_EQ(c.write_timeout_ms, 750);
  EXPECT_FALSE(c.log_color);
  EXPECT_EQ(c.store, "clickhouse");
  EXPECT_EQ(c.ch_table, "errs");
  EXPECT_EQ(c.ch_host, "127.0.0.1"); // не задан — по умолчанию
  std::remove(path.c_str());
}

TEST(Config, MalformedFileThrows) {
  const auto path = write_temp("{ \"port\": ");
  EXPECT_THROW(load_config(path), ConfigError);
  std::remove(path.c_str());
}

TEST(Config, WrongTypeThrows) {
  const auto path = write_temp(R"({"host": 12})");
  EXPECT_THROW(load_config(path), ConfigError);
  std::remove(path.c_str());
}

TEST(Config, PortOutOfRangeInFileThrows) {
  for (const char *body : {R"({"port": 70000})", R"({"port": -1})"}) {
    const auto path = write_temp(body);
    EXPECT_THROW(load_config(path), ConfigError) << body;
    std::remove(path.c_str());
  }
}

TEST(Config, NegativeCountsInFileThrow) {
  for (const char *body :
       {R"({"handler_threads": -1})", R"({"http_threads": -2})",
        R"({"max_body_bytes": -1})", R"({"ch_pool_size": -4})",
        R"({"handler_threads": 1.5})"}) {
    const auto path = write_temp(body);
    EXPECT_THROW(load_config(path), ConfigError) << body;
    std::remove(path.c_str());
  }
}

TEST(Config, MaxPortInFileIsAccepted) {
  const auto path = write_temp(R"({"port": 65535, "handler_threads": 3})");
  const Config c = load_config(path);
  EXPECT_EQ(c.port, 65535);
  EXPECT_EQ(c.handler_threads, 3u);
  std::remove(path.c_str());
}

TEST(Config, EnvOverridesFile) {
  Config c;
  c.influx_bucket = "from-file";
  apply_env(c, env_of({{"DOCKER_INFLUXDB_HOST", "http://db:8086"},
                       {"DOCKER_INFLUXDB_TOKEN", "tok"},
                       {"DOCKER_INFLUXDB_ORGANIZATION", "org"},
                       {"DOCKER_INFLUXDB_BUCKET", "bucket"},
                       {"ENDON_PORT", "8080"}}));

  EXPECT_EQ(c.influx_host, "http://db:8086");
  EXPECT_EQ(c.influx_token, "tok");
  EXPECT_EQ(c.influx_org, "org");
  EXPECT_EQ(c.influx_bucket, "bucket");
  EXPECT_EQ(c.port, 8080);
  EXPECT_NO_THROW(validate_config(c));
}

TEST(Config, BadPortInEnvThrows) {
  Config c;
  EXPECT_THROW(apply_env(c, env_of({{"ENDON_PORT", "80x"}})), ConfigError);
  EXPECT_THROW(apply_env(c, env_of({{"ENDON_PORT", "70000"}})), ConfigError);
}

TEST(Config, InfluxSettingsAreRequired) {
  Config c;
  try {
    validate_config(c);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError &e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("DOCKER_INFLUXDB_HOST"), std::string::npos);
    EXPECT_NE(msg.find("DOCKER_INFLUXDB_TOKEN"), std::string::npos);
    EXPECT_NE(msg.find("DOCKER_INFLUXDB_ORGANIZATION"), std::string::npos);
    EXPECT_NE(msg.find("DOCKER_INFLUXDB_BUCKET"), std::string::npos);
  }

  c = influx_ready();
  c.influx_token.clear();
  EXPECT_THROW(validate_config(c), ConfigError);
}

TEST(Config, ClickHouseDoesNotNeedInflux) {
  Config c;
  c.store = "clickhouse";
  EXPECT_NO_THROW(validate_config(c));

  c.ch_pool_size = 0;
  EXPECT_THROW(validate_config(c), ConfigError);
}

TEST(Config, RejectsUnknownStoreAndZeroThreads) {
  Config c = influx_ready();
  c.store = "postgres";
  EXPECT_THROW(validate_config(c), ConfigError);

  c = influx_ready();
  c.handler_threads = 0;
  EXPECT_THROW(validate_config(c), ConfigError);

  c = influx_ready();
  c.write_timeout_ms = 0;
  EXPECT_THROW(validate_config(c), ConfigError);
}
