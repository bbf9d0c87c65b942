#pragma once
#include "log.hpp"
#include <atomic>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace endon {

// 12 символов [0-9a-z], id корреляции для строк лога одного запроса
std::string make_request_id();

// Флаг отмены: соединение взводит его, хранилище проверяет
class CancelToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
};

class RequestLogger {
public:
  explicit RequestLogger(std::string request_id, std::FILE *out = stderr)
      : request_id_(std::move(request_id)), out_(out) {}

  const std::string &request_id() const noexcept { return request_id_; }

  void info(const std::string &msg) const {
    write_log_line(out_, LogLevel::Info, request_id_, msg);
  }
  void warn(const std::string &msg) const {
    write_log_line(out_, LogLevel::Warn, request_id_, msg);
  }
  void error(const std::string &msg) const {
    write_log_line(out_, LogLevel::Error, request_id_, msg);
  }

private:
  std::string request_id_;
  std::FILE *out_;
};

// Создаётся один раз на запрос и явно передаётся в обработчик и хранилище
struct RequestContext {
  RequestLogger log;
  std::shared_ptr<CancelToken> cancel = std::make_shared<CancelToken>();

  explicit RequestContext(std::string request_id, std::FILE *out = stderr)
      : log(std::move(request_id), out) {}

  bool cancelled() const noexcept { return cancel && cancel->cancelled(); }
};

} // namespace endon
