#include "endon/clickhouse_pool.hpp"
#include "endon/log.hpp"
#include "endon/time_utils.hpp"
#include <clickhouse/client.h>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <vector>

using namespace clickhouse;

namespace endon {

namespace {

struct FieldToString {
  std::string operator()(const std::string &s) const { return s; }
  std::string operator()(double d) const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
  }
  std::string operator()(std::int64_t i) const { return std::to_string(i); }
  std::string operator()(bool b) const { return b ? "true" : "false"; }
};

// Одна строка на точку:
//   measurement String, ts DateTime64(9),
//   tag_keys/tag_values/field_keys/field_values Array(String)
Block make_block(const Point &p) {
  auto col_measurement = std::make_shared<ColumnString>();
  auto col_ts = std::make_shared<ColumnDateTime64>(9); // наносекунды (UTC)
  auto col_tag_keys = std::make_shared<ColumnArrayT<ColumnString>>();
  auto col_tag_values = std::make_shared<ColumnArrayT<ColumnString>>();
  auto col_field_keys = std::make_shared<ColumnArrayT<ColumnString>>();
  auto col_field_values = std::make_shared<ColumnArrayT<ColumnString>>();

  std::vector<std::string> tag_keys, tag_values, field_keys, field_values;
  for (const auto &[k, v] : p.tags) {
    tag_keys.push_back(k);
    tag_values.push_back(v);
  }
  for (const auto &[k, v] : p.fields) {
    field_keys.push_back(k);
    field_values.push_back(std::visit(FieldToString{}, v));
  }

  col_measurement->Append(p.measurement);
  col_ts->Append(to_unix_nanos(p.ts));
  col_tag_keys->Append(tag_keys);
  col_tag_values->Append(tag_values);
  col_field_keys->Append(field_keys);
  col_field_values->Append(field_values);

  Block block;
  block.AppendColumn("measurement", col_measurement);
  block.AppendColumn("ts", col_ts);
  block.AppendColumn("tag_keys", col_tag_keys);
  block.AppendColumn("tag_values", col_tag_values);
  block.AppendColumn("field_keys", col_field_keys);
  block.AppendColumn("field_values", col_field_values);
  return block;
}

} // namespace

ClickHouseWriter::ClickHouseWriter(const Config &cfg)
    : cfg_(cfg) {}

ClickHouseWriter::~ClickHouseWriter() { stop(); }

ClickHouseWriter::ClientPtr ClickHouseWriter::connect() const {
  if (cfg_.ch_port < 0 || cfg_.ch_port > 65535) {
    throw StoreError("ClickHouse port is out of range (0..65535)");
  }

  ClientOptions opts;
  opts.SetHost(cfg_.ch_host)
      .SetPort(static_cast<uint16_t>(cfg_.ch_port))
      .SetDefaultDatabase(cfg_.ch_database);

  if (!cfg_.ch_user.empty())
    opts.SetUser(cfg_.ch_user);
  if (!cfg_.ch_password.empty())
    opts.SetPassword(cfg_.ch_password);

  auto client = std::make_unique<Client>(opts);
  client->Execute("SELECT 1");
  return client;
}

void ClickHouseWriter::start() {
  if (running_.exchange(true))
    return;

  const std::size_t n = cfg_.ch_pool_size ? cfg_.ch_pool_size : 1;
  for (std::size_t i = 0; i < n; ++i) {
    try {
      idle_.release(connect());
    } catch (const std::exception &e) {
      running_ = false;
      throw StoreError(
          std::string("clickhouse: handshake failed: ") + e.what() +
          " (host=" + cfg_.ch_host + " port=" + std::to_string(cfg_.ch_port) +
          " db=" + (cfg_.ch_database.empty() ? "(default)" : cfg_.ch_database) +
          ")");
    }
  }

  log_info("CH", "connected: host=" + cfg_.ch_host +
                     " port=" + std::to_string(cfg_.ch_port) +
                     " table=" + cfg_.ch_table +
                     " pool=" + std::to_string(n));
}

void ClickHouseWriter::stop() {
  if (!running_.exchange(false))
    return;
  idle_.close();
}

void ClickHouseWriter::write(const Point &point, const RequestContext &ctx) {
  if (!running_)
    throw StoreError("clickhouse: pool is not running");
  if (ctx.cancelled())
    throw WriteCancelled("clickhouse: request cancelled before insert");

  auto slot = idle_.acquire();
  if (!slot.has_value())
    throw StoreError("clickhouse: pool stopped");
  ClientPtr client = std::move(*slot);

  // пока ждали свободный клиент, запрос могли отменить
  if (ctx.cancelled()) {
    idle_.release(std::move(client));
    throw WriteCancelled("clickhouse: request cancelled while waiting for a "
                         "connection");
  }

  try {
    if (!client)
      client = connect();
    client->Insert(cfg_.ch_table, make_block(point));
  } catch (const std::exception &ex) {
    const std::string msg = std::string("insert error: ") + ex.what();
    // соединение могло сломаться — в пул возвращаем свежий клиент
    client.reset();
    try {
      client = connect();
    } catch (const std::exception &re) {
      log_warn("CH", std::string("reconnect failed, will retry on next "
                                 "write: ") +
                         re.what());
    }
    idle_.release(std::move(client));
    throw StoreError("clickhouse: " + msg);
  }

  idle_.release(std::move(client));
}

} // namespace endon
