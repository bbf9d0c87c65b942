// src/http_server.cpp
#include "endon/http_server.hpp"
#include "endon/log.hpp"
#include "endon/request_context.hpp"
#include <boost/beast.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace endon {

struct HttpServer::Session
    : public std::enable_shared_from_this<HttpServer::Session> {
  tcp::socket socket;
  net::io_context &ioc;
  const IngestHandler &handler;
  net::thread_pool &workers;
  const std::size_t max_body_bytes;
  std::shared_ptr<std::atomic<std::size_t>> active;

  beast::flat_buffer buffer;
  std::optional<http::request_parser<http::string_body>> parser;
  http::response<http::string_body> res;
  std::shared_ptr<RequestContext> ctx;
  bool responded = false;

  // strand от executora сокета — корректный тип под any_io_executor
  net::strand<net::any_io_executor> strand;

  Session(tcp::socket s, net::io_context &io, const IngestHandler &h,
          net::thread_pool &w, std::size_t max_body,
          std::shared_ptr<std::atomic<std::size_t>> counter)
      : socket(std::move(s)), ioc(io), handler(h), workers(w),
        max_body_bytes(max_body), active(std::move(counter)),
        strand(net::make_strand(socket.get_executor())) {
    ++*active;
  }

  ~Session() { --*active; }

  void run() { read_request(); }

  void read_request() {
    parser.emplace();
    parser->body_limit(max_body_bytes);

    auto self = shared_from_this();
    http::async_read(
        socket, buffer, *parser,
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          self->on_read(ec);
        }));
  }

  static bool client_gone(const beast::error_code &ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::operation_aborted;
  }

  void on_read(beast::error_code ec) {
    if (ec && !parser->is_header_done()) {
      // до заголовка: клиент ушёл или прислал мусор
      if (!client_gone(ec))
        write_response(Reply{400, R"({"message":"Bad Request"})"});
      return;
    }

    const auto &req = parser->get();
    const std::string_view target(req.target().data(), req.target().size());
    if (target.substr(0, target.find('?')) != "/") {
      write_response(Reply{404, R"({"message":"Not Found"})"});
      return;
    }
    if (req.method() != http::verb::post) {
      write_response(Reply{405, R"({"message":"Method Not Allowed"})"});
      return;
    }

    ctx = std::make_shared<RequestContext>(make_request_id());
    const auto ct = req[http::field::content_type];
    std::string content_type(ct.data(), ct.size());

    if (ec) {
      // заголовок есть, тело не дочитали (обрыв, превышен лимит)
      write_response(handler.handle_unreadable(content_type, ec.message(), *ctx));
      return;
    }

    std::string body = std::move(parser->get().body());
    watch_disconnect();

    // пока запись идёт в пуле, io_context не должен выйти из run()
    auto self = shared_from_this();
    net::post(workers, [self, work = net::make_work_guard(ioc),
                        content_type = std::move(content_type),
                        body = std::move(body)]() mutable {
      Reply reply;
      try {
        reply = self->handler.handle(content_type, body, *self->ctx);
      } catch (const std::exception &e) {
        self->ctx->log.error(std::string("handler failed: ") + e.what());
        reply = Reply{500, R"("Internal Server Error")"};
      }
      net::dispatch(self->strand, [self, work = std::move(work),
                                   reply = std::move(reply)]() mutable {
        self->write_response(std::move(reply));
      });
    });
  }

  // Пока идёт запись в хранилище, ждём чтения из сокета: если клиент
  // закрыл соединение, отменяем запись.
  void watch_disconnect() {
    auto self = shared_from_this();
    socket.async_wait(
        tcp::socket::wait_read,
        net::bind_executor(strand, [self](beast::error_code ec) {
          if (ec || self->responded)
            return;
          beast::error_code aec;
          const auto pending = self->socket.available(aec);
          if (aec || pending == 0) {
            self->ctx->log.warn("Client disconnected, abandoning write");
            self->ctx->cancel->cancel();
          }
        }));
  }

  void write_response(Reply reply) {
    responded = true;

    res.version(parser && parser->is_header_done() ? parser->get().version()
                                                   : 11);
    res.keep_alive(false);
    res.result(static_cast<http::status>(reply.status));
    res.set(http::field::server, "endon-ingestor");
    res.set(http::field::content_type, "application/json");
    if (reply.status == 405)
      res.set(http::field::allow, "POST");
    res.body() = std::move(reply.body);
    res.prepare_payload();

    auto self = shared_from_this();
    http::async_write(
        socket, res,
        net::bind_executor(strand, [self](beast::error_code, std::size_t) {
          beast::error_code ec;
          self->socket.shutdown(tcp::socket::shutdown_send, ec);
          self->socket.cancel(ec); // снимаем watch_disconnect
        }));
  }
};

HttpServer::HttpServer(net::io_context &ioc, const Config &cfg,
                       const IngestHandler &handler)
    : ioc_(ioc), cfg_(cfg), handler_(handler), acceptor_(ioc),
      workers_(cfg.handler_threads ? cfg.handler_threads : 1),
      work_guard_(net::make_work_guard(ioc_)),
      active_(std::make_shared<std::atomic<std::size_t>>(0)),
      drain_timer_(ioc) {
  tcp::endpoint ep{net::ip::make_address(cfg_.host), cfg_.port};
  beast::error_code ec;
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("cannot listen on " + cfg_.host + ":" +
                             std::to_string(cfg_.port) + ": " + ec.message());
  }
}

HttpServer::~HttpServer() {
  stop();
  workers_.join();
}

void HttpServer::run() {
  if (running_.exchange(true))
    return;
  do_accept();
}

void HttpServer::stop() {
  if (!running_.exchange(false))
    return;
  work_guard_.reset(); // отпускаем io_context
  beast::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::shutdown(std::chrono::milliseconds grace) {
  stop();
  const auto deadline = std::chrono::steady_clock::now() + grace;
  net::post(ioc_, [this, deadline] { drain(deadline); });
}

void HttpServer::drain(std::chrono::steady_clock::time_point deadline) {
  const std::size_t open = *active_;
  if (open == 0)
    return; // таймер не взводим: io_context выйдет сам
  if (std::chrono::steady_clock::now() >= deadline) {
    log_warn("http", std::to_string(open) +
                         " connection(s) still open after grace period, "
                         "stopping io_context");
    ioc_.stop();
    return;
  }
  drain_timer_.expires_after(std::chrono::milliseconds(50));
  drain_timer_.async_wait([this, deadline](const beast::error_code &ec) {
    if (!ec)
      drain(deadline);
  });
}

std::size_t HttpServer::active_sessions() const { return *active_; }

unsigned short HttpServer::local_port() const {
  beast::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket s) {
    if (!ec) {
      std::make_shared<Session>(std::move(s), ioc_, handler_, workers_,
                                cfg_.max_body_bytes, active_)
          ->run();
    }
    if (running_)
      do_accept();
  });
}

} // namespace endon
