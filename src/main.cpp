#include "endon/clickhouse_pool.hpp"
#include "endon/config.hpp"
#include "endon/http_server.hpp"
#include "endon/influxdb_client.hpp"
#include "endon/ingest_handler.hpp"
#include "endon/log.hpp"
#include "endon/types.hpp"
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path = "server.json";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      cfg_path = argv[++i];
  }

  endon::Config cfg;
  try {
    cfg = endon::load_config(cfg_path);
    endon::apply_env(cfg);
    endon::validate_config(cfg);
  } catch (const endon::ConfigError &e) {
    endon::log_fatal("startup", e.what());
    return 1;
  }
  endon::set_log_color(cfg.log_color);

  // Хранилище поднимаем до того, как начнём принимать запросы
  std::unique_ptr<endon::InfluxDbClient> influx;
  std::unique_ptr<endon::PointWriter> writer;
  try {
    if (cfg.store == "influxdb") {
      influx = std::make_unique<endon::InfluxDbClient>(
          cfg.influx_host, cfg.influx_token,
          std::chrono::milliseconds(cfg.write_timeout_ms));

      endon::Organization org;
      try {
        org = influx->find_organization(cfg.influx_org);
      } catch (const endon::StoreError &e) {
        endon::log_err("startup", "Failed to lookup organization named \"" +
                                      cfg.influx_org + "\": " + e.what());
        endon::log_fatal("startup",
                         "Cannot start server without InfluxDB organization "
                         "access");
        return 1;
      }
      endon::log_info("startup", "Organization found: " + org.name +
                                     " (id " + org.id + ")");
      writer = std::make_unique<endon::InfluxDbWriter>(*influx, org.id,
                                                       cfg.influx_bucket);
    } else {
      auto ch = std::make_unique<endon::ClickHouseWriter>(cfg);
      ch->start();
      writer = std::move(ch);
    }
  } catch (const std::exception &e) {
    endon::log_fatal("startup", e.what());
    return 1;
  }

  endon::IngestHandler handler(*writer);

  boost::asio::io_context ioc;

  std::unique_ptr<endon::HttpServer> server;
  try {
    server = std::make_unique<endon::HttpServer>(ioc, cfg, handler);
    server->run();
  } catch (const std::exception &e) {
    endon::log_fatal("startup", e.what());
    return 1;
  }

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (ec)
      return;
    endon::log_info("main", "stopping...");
    // новые соединения не принимаем, начатые записи дописываем;
    // run() вернётся сам, когда последний ответ уйдёт клиенту
    server->shutdown(std::chrono::milliseconds(cfg.write_timeout_ms) +
                     std::chrono::seconds(1));
  });

  const std::size_t n_threads = std::max<std::size_t>(1, cfg.http_threads);

  std::vector<std::unique_ptr<boost::thread>> threads;
  threads.reserve(n_threads - 1);

  for (std::size_t i = 0; i + 1 < n_threads; ++i) {
    threads.emplace_back(
        std::make_unique<boost::thread>([&ioc] { ioc.run(); }));
  }

  endon::log_info("main", "Server listening on " + cfg.host + ":" +
                              std::to_string(server->local_port()) +
                              " (store: " + writer->name() + ")");

  // Главный поток тоже крутит ioc
  ioc.run();

  for (auto &t : threads)
    t->join();

  server.reset(); // join пула обработчиков
  return 0;
}
