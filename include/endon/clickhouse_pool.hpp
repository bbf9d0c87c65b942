#pragma once
#include "point_writer.hpp"
#include "blocking_pool.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>

namespace clickhouse {
class Client;
} // namespace clickhouse

namespace endon {

// Пул клиентов ClickHouse: write() берёт свободный клиент, вставляет одну
// строку и возвращает его обратно. Слот пула — nullptr, если клиент
// не удалось пересоздать; переподключимся при следующем заимствовании.
class ClickHouseWriter : public PointWriter {
public:
  explicit ClickHouseWriter(const Config &cfg);
  ~ClickHouseWriter() override;

  // подключает все клиенты и делает SELECT 1; бросает StoreError
  void start();
  void stop();

  void write(const Point &point, const RequestContext &ctx) override;
  std::string name() const override { return "ClickHouse"; }

private:
  using ClientPtr = std::unique_ptr<clickhouse::Client>;

  ClientPtr connect() const;

  const Config cfg_;
  BlockingPool<ClientPtr> idle_;
  std::atomic<bool> running_{false};
};

} // namespace endon
