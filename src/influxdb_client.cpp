// src/influxdb_client.cpp
#include "endon/influxdb_client.hpp"
#include "endon/line_protocol.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <cctype>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace endon {

namespace {

constexpr const char *kUserAgent = "endon-ingestor";
// как часто проверяем отмену/дедлайн, пока идёт запрос
constexpr std::chrono::milliseconds kPollInterval{20};

std::string url_encode(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

// InfluxDB отвечает на ошибки {"code":"...","message":"..."}
std::string influx_message(const std::string &body) {
  const auto j = json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    auto it = j.find("message");
    if (it != j.end() && it->is_string())
      return it->get<std::string>();
  }
  return body;
}

} // namespace

InfluxEndpoint parse_influx_url(const std::string &url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    throw std::invalid_argument("InfluxDB URL must start with http://: " + url);

  std::string scheme = url.substr(0, scheme_end);
  for (auto &c : scheme)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (scheme == "https")
    throw std::invalid_argument("InfluxDB over https is not supported: " + url);
  if (scheme != "http")
    throw std::invalid_argument("unsupported InfluxDB URL scheme: " + scheme);

  const std::string rest = url.substr(scheme_end + 3);
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);

  InfluxEndpoint ep;
  ep.port = "80";
  if (slash != std::string::npos) {
    ep.base_path = rest.substr(slash);
    while (!ep.base_path.empty() && ep.base_path.back() == '/')
      ep.base_path.pop_back();
  }

  if (!authority.empty() && authority.front() == '[') {
    // [::1]:8086
    const auto close = authority.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument("malformed IPv6 host in InfluxDB URL: " + url);
    ep.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        throw std::invalid_argument("malformed InfluxDB URL: " + url);
      ep.port = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    ep.host = authority.substr(0, colon);
    if (colon != std::string::npos)
      ep.port = authority.substr(colon + 1);
  }

  if (ep.host.empty())
    throw std::invalid_argument("InfluxDB URL has no host: " + url);
  if (ep.port.empty() ||
      ep.port.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("InfluxDB URL has a bad port: " + url);
  return ep;
}

Organization parse_organization_lookup(const std::string &body,
                                       const std::string &name) {
  const auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw StoreError("influxdb: malformed organization lookup response");

  auto orgs = j.find("orgs");
  if (orgs == j.end() || !orgs->is_array())
    throw StoreError("influxdb: organization lookup response has no orgs");

  for (const auto &o : *orgs) {
    if (!o.is_object())
      continue;
    auto id = o.find("id");
    auto nm = o.find("name");
    if (id == o.end() || !id->is_string() || nm == o.end() ||
        !nm->is_string())
      continue;
    if (nm->get<std::string>() == name)
      return Organization{id->get<std::string>(), nm->get<std::string>()};
  }
  throw StoreError("influxdb: organization \"" + name + "\" not found");
}

InfluxDbClient::InfluxDbClient(const std::string &url, std::string token,
                               std::chrono::milliseconds timeout)
    : endpoint_(parse_influx_url(url)), token_(std::move(token)),
      timeout_(timeout) {}

InfluxDbClient::Response
InfluxDbClient::perform(const std::string &method, const std::string &target,
                        const std::string &body,
                        const CancelToken *cancel) const {
  if (cancel && cancel->cancelled())
    throw WriteCancelled("influxdb: request cancelled before start");

  // Свой io_context на запрос: вызывающий поток сам крутит его и
  // между итерациями смотрит на отмену и дедлайн.
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;

  http::request<http::string_body> req{http::string_to_verb(method),
                                       endpoint_.base_path + target, 11};
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::authorization, "Token " + token_);
  req.set(http::field::accept, "application/json");
  if (!body.empty()) {
    req.set(http::field::content_type, "text/plain; charset=utf-8");
    req.body() = body;
  }
  req.keep_alive(false);
  req.prepare_payload();

  http::response<http::string_body> res;
  beast::error_code result;
  std::string stage = "resolve";

  resolver.async_resolve(
      endpoint_.host, endpoint_.port,
      [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
        if (resolve_ec) {
          result = resolve_ec;
          return;
        }
        stage = "connect";
        stream.async_connect(results, [&](beast::error_code connect_ec,
                                          const tcp::endpoint &) {
          if (connect_ec) {
            result = connect_ec;
            return;
          }
          stage = "write";
          http::async_write(
              stream, req, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                  result = write_ec;
                  return;
                }
                stage = "read";
                http::async_read(stream, buffer, res,
                                 [&](beast::error_code read_ec, std::size_t) {
                                   result = read_ec;
                                 });
              });
        });
      });

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  bool abandoned = false;
  bool timed_out = false;
  while (!ioc.stopped()) {
    ioc.run_for(kPollInterval);
    if (ioc.stopped() || abandoned || timed_out)
      continue;
    if (cancel && cancel->cancelled()) {
      abandoned = true;
    } else if (std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
    } else {
      continue;
    }
    resolver.cancel();
    stream.cancel();
  }

  if (abandoned)
    throw WriteCancelled("influxdb: request abandoned during " + stage);
  if (timed_out)
    throw StoreError("influxdb: timed out after " +
                     std::to_string(timeout_.count()) + "ms during " + stage);
  if (result)
    throw StoreError("influxdb: " + stage + " failed: " + result.message());

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  // not_connected здесь нормально: сервер уже закрыл соединение

  return Response{res.result_int(), std::move(res.body())};
}

Organization InfluxDbClient::find_organization(const std::string &name) const {
  const auto r =
      perform("GET", "/api/v2/orgs?org=" + url_encode(name), "", nullptr);
  if (r.status / 100 != 2)
    throw StoreError("influxdb: organization lookup returned HTTP " +
                     std::to_string(r.status) + ": " + influx_message(r.body));
  return parse_organization_lookup(r.body, name);
}

void InfluxDbClient::write_lines(const std::string &org_id,
                                 const std::string &bucket,
                                 const std::string &lines,
                                 const CancelToken *cancel) const {
  const std::string target = "/api/v2/write?orgID=" + url_encode(org_id) +
                             "&bucket=" + url_encode(bucket) +
                             "&precision=ns";
  const auto r = perform("POST", target, lines, cancel);
  if (r.status / 100 != 2)
    throw StoreError("influxdb: write returned HTTP " +
                     std::to_string(r.status) + ": " + influx_message(r.body));
}

InfluxDbWriter::InfluxDbWriter(const InfluxDbClient &client,
                               std::string org_id, std::string bucket)
    : client_(client), org_id_(std::move(org_id)), bucket_(std::move(bucket)) {}

void InfluxDbWriter::write(const Point &point, const RequestContext &ctx) {
  std::string line;
  try {
    line = encode_line(point);
  } catch (const std::invalid_argument &e) {
    throw StoreError(std::string("influxdb: cannot encode point: ") + e.what());
  }
  client_.write_lines(org_id_, bucket_, line, ctx.cancel.get());
}

} // namespace endon
