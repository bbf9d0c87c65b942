// include/endon/ingest_handler.hpp
#pragma once
#include "point_writer.hpp"
#include "request_context.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace endon {

// Ответ клиенту: HTTP-статус и тело (JSON-строка)
struct Reply {
  unsigned status;
  std::string body;
};

// Тело не JSON / не объект / известный ключ не строка
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Ключи сравниваются без учёта регистра (точное совпадение в приоритете),
// битые UTF-8 байты заменяются на U+FFFD.
ErrorReport decode_report(const std::string &body);

bool has_required_fields(const ErrorReport &report) noexcept;

// Только точное "application/json", без параметров
bool is_json_content_type(std::string_view content_type) noexcept;

Point make_point(const ErrorReport &report,
                 std::chrono::system_clock::time_point now);

// POST / : проверка Content-Type → тело → JSON → обязательные поля → запись.
// Обработчик без состояния, один экземпляр на все потоки.
class IngestHandler {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit IngestHandler(PointWriter &writer, Clock clock = [] {
    return std::chrono::system_clock::now();
  });

  Reply handle(std::string_view content_type, const std::string &body,
               const RequestContext &ctx) const;

  // тело прочитать не удалось (обрыв, превышен лимит)
  Reply handle_unreadable(std::string_view content_type, std::string_view why,
                          const RequestContext &ctx) const;

private:
  bool check_content_type(std::string_view content_type,
                          const RequestContext &ctx) const;

  PointWriter &writer_;
  Clock clock_;
};

} // namespace endon
