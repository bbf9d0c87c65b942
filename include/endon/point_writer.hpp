#pragma once
#include "request_context.hpp"
#include "types.hpp"
#include <stdexcept>
#include <string>

namespace endon {

// Ошибка хранилища; текст идёт только в лог, не клиенту
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Запись брошена, потому что клиент ушёл
class WriteCancelled : public StoreError {
public:
  using StoreError::StoreError;
};

// Синхронная запись одной точки. Реализации должны быть потокобезопасны:
// write() зовут одновременно из всех потоков обработчика.
class PointWriter {
public:
  virtual ~PointWriter() = default;

  // бросает StoreError / WriteCancelled
  virtual void write(const Point &point, const RequestContext &ctx) = 0;

  // "InfluxDB", "ClickHouse" — для ответа 500
  virtual std::string name() const = 0;
};

} // namespace endon
