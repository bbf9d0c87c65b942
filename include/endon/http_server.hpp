// include/endon/http_server.hpp
#pragma once
#include "ingest_handler.hpp"
#include "types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace endon {

// Принимает соединения на общем io_context; обработчик (с блокирующей
// записью в хранилище) выполняется в отдельном пуле handler_threads.
class HttpServer {
public:
  // бросает std::runtime_error, если не удалось занять адрес
  HttpServer(boost::asio::io_context& ioc, const Config& cfg,
             const IngestHandler& handler);
  ~HttpServer();

  void run();
  // перестаёт принимать соединения и отпускает io_context
  void stop();
  // stop() + ждём, пока допишутся ответы открытых соединений; через grace
  // оставшиеся бросаем и останавливаем io_context
  void shutdown(std::chrono::milliseconds grace);

  // реальный порт (если в конфиге 0)
  unsigned short local_port() const;
  std::size_t active_sessions() const;

private:
  struct Session;
  void do_accept();
  void drain(std::chrono::steady_clock::time_point deadline);

  boost::asio::io_context& ioc_;
  const Config cfg_;
  const IngestHandler& handler_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool workers_;
  std::atomic<bool> running_{false};
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  // разделяется с сессиями: они могут пережить сервер в очереди io_context
  std::shared_ptr<std::atomic<std::size_t>> active_;
  boost::asio::steady_timer drain_timer_;
};

} // namespace endon
