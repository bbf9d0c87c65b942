#pragma once
#include "point_writer.hpp"
#include "request_context.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

namespace endon {

struct InfluxEndpoint {
  std::string host;
  std::string port;      // строкой — так удобнее резолверу
  std::string base_path; // без завершающего '/', обычно пустой
};

// "http://host[:port][/path]"; https не поддерживается
InfluxEndpoint parse_influx_url(const std::string &url);

struct Organization {
  std::string id;
  std::string name;
};

// Разбор ответа GET /api/v2/orgs?org=<name>
Organization parse_organization_lookup(const std::string &body,
                                       const std::string &name);

// Клиент HTTP API InfluxDB 2. Каждый вызов — своё соединение,
// поэтому объект можно звать из любого числа потоков.
class InfluxDbClient {
public:
  InfluxDbClient(const std::string &url, std::string token,
                 std::chrono::milliseconds timeout);

  // бросает StoreError
  Organization find_organization(const std::string &name) const;

  // строки line protocol через '\n'; бросает StoreError / WriteCancelled
  void write_lines(const std::string &org_id, const std::string &bucket,
                   const std::string &lines,
                   const CancelToken *cancel = nullptr) const;

  const InfluxEndpoint &endpoint() const noexcept { return endpoint_; }

private:
  struct Response {
    unsigned status;
    std::string body;
  };

  Response perform(const std::string &method, const std::string &target,
                   const std::string &body, const CancelToken *cancel) const;

  InfluxEndpoint endpoint_;
  std::string token_;
  std::chrono::milliseconds timeout_;
};

// PointWriter поверх InfluxDbClient; id организации получен при старте
class InfluxDbWriter : public PointWriter {
public:
  InfluxDbWriter(const InfluxDbClient &client, std::string org_id,
                 std::string bucket);

  void write(const Point &point, const RequestContext &ctx) override;
  std::string name() const override { return "InfluxDB"; }

private:
  const InfluxDbClient &client_;
  const std::string org_id_;
  const std::string bucket_;
};

} // namespace endon
