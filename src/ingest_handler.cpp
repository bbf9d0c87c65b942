// src/ingest_handler.cpp
#include "endon/ingest_handler.hpp"

#include <cctype>
#include <exception>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace endon {

namespace {

Reply make_reply(unsigned status, const std::string &msg) {
  // тело — JSON-строка, как и раньше отвечал сервис
  return Reply{status, json(msg).dump()};
}

// Длина корректной UTF-8 последовательности с позиции i, 0 — если битая
std::size_t utf8_sequence_length(const std::string &s, std::size_t i) {
  const auto b = [&](std::size_t k) {
    return static_cast<unsigned char>(s[k]);
  };
  const auto cont = [&](std::size_t k, unsigned char lo = 0x80,
                        unsigned char hi = 0xBF) {
    return k < s.size() && b(k) >= lo && b(k) <= hi;
  };
  const unsigned char c = b(i);
  if (c < 0x80)
    return 1;
  if (c >= 0xC2 && c <= 0xDF)
    return cont(i + 1) ? 2 : 0;
  if (c == 0xE0)
    return cont(i + 1, 0xA0) && cont(i + 2) ? 3 : 0;
  if (c == 0xED)
    return cont(i + 1, 0x80, 0x9F) && cont(i + 2) ? 3 : 0;
  if (c >= 0xE1 && c <= 0xEF)
    return cont(i + 1) && cont(i + 2) ? 3 : 0;
  if (c == 0xF0)
    return cont(i + 1, 0x90) && cont(i + 2) && cont(i + 3) ? 4 : 0;
  if (c == 0xF4)
    return cont(i + 1, 0x80, 0x8F) && cont(i + 2) && cont(i + 3) ? 4 : 0;
  if (c >= 0xF1 && c <= 0xF3)
    return cont(i + 1) && cont(i + 2) && cont(i + 3) ? 4 : 0;
  return 0;
}

// каждый битый байт -> U+FFFD
std::string replace_invalid_utf8(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size();) {
    const auto n = utf8_sequence_length(s, i);
    if (n == 0) {
      out += "\xEF\xBF\xBD";
      ++i;
      continue;
    }
    out.append(s, i, n);
    i += n;
  }
  return out;
}

bool iequals(const std::string &a, const char *b) {
  std::size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return i == a.size() && b[i] == '\0';
}

// Точное совпадение ключа, иначе первый ключ без учёта регистра
json::const_iterator find_member(const json &j, const char *key) {
  auto it = j.find(key);
  if (it != j.end())
    return it;
  for (it = j.begin(); it != j.end(); ++it) {
    if (iequals(it.key(), key))
      return it;
  }
  return j.end();
}

// null и отсутствие ключа — пустая строка, не-строка — ошибка
std::string string_member(const json &j, const char *key) {
  auto it = find_member(j, key);
  if (it == j.end() || it->is_null())
    return {};
  if (!it->is_string())
    throw DecodeError(std::string("field \"") + key + "\" must be a string");
  return it->get<std::string>();
}

} // namespace

ErrorReport decode_report(const std::string &body) {
  json j;
  try {
    j = json::parse(replace_invalid_utf8(body));
  } catch (const json::parse_error &e) {
    throw DecodeError(e.what());
  }
  if (j.is_null())
    return {}; // null как пустой объект: дальше отсеется по полям
  if (!j.is_object())
    throw DecodeError("payload must be a JSON object");

  ErrorReport r;
  r.service = string_member(j, "service");
  r.endpoint = string_member(j, "endpoint");
  r.error = string_member(j, "error");
  r.traceback = string_member(j, "traceback");
  return r;
}

bool has_required_fields(const ErrorReport &report) noexcept {
  return !report.service.empty() && !report.endpoint.empty() &&
         !report.error.empty();
}

bool is_json_content_type(std::string_view content_type) noexcept {
  return content_type == "application/json";
}

Point make_point(const ErrorReport &report,
                 std::chrono::system_clock::time_point now) {
  Point p;
  p.measurement = kErrorMeasurement;
  p.tags.emplace("service", report.service);
  p.tags.emplace("endpoint", report.endpoint);
  p.fields.emplace("error", report.error);
  if (!report.traceback.empty())
    p.fields.emplace("traceback", report.traceback);
  p.ts = now;
  return p;
}

IngestHandler::IngestHandler(PointWriter &writer, Clock clock)
    : writer_(writer), clock_(std::move(clock)) {}

bool IngestHandler::check_content_type(std::string_view content_type,
                                       const RequestContext &ctx) const {
  if (is_json_content_type(content_type))
    return true;
  ctx.log.error("Invalid Content-Type. Expected application/json, got " +
                std::string(content_type));
  return false;
}

Reply IngestHandler::handle_unreadable(std::string_view content_type,
                                       std::string_view why,
                                       const RequestContext &ctx) const {
  if (!check_content_type(content_type, ctx))
    return make_reply(415, "Content-Type must be application/json");

  ctx.log.error("Error reading request body: " + std::string(why));
  return make_reply(400, "Error reading request body");
}

Reply IngestHandler::handle(std::string_view content_type,
                            const std::string &body,
                            const RequestContext &ctx) const {
  if (!check_content_type(content_type, ctx))
    return make_reply(415, "Content-Type must be application/json");

  ctx.log.info("Attempting ingestion to DB");

  ErrorReport report;
  try {
    report = decode_report(body);
  } catch (const DecodeError &e) {
    ctx.log.error(std::string("Error unmarshalling JSON: ") + e.what());
    return make_reply(400, "Error unmarshalling JSON");
  }

  if (!has_required_fields(report)) {
    ctx.log.error("Missing required fields in the JSON payload");
    return make_reply(400, "Missing required fields in the JSON payload");
  }

  const Point point = make_point(report, clock_());

  try {
    writer_.write(point, ctx);
  } catch (const WriteCancelled &e) {
    ctx.log.error(std::string("Write abandoned: ") + e.what());
    return make_reply(500, "Error writing point to " + writer_.name());
  } catch (const std::exception &e) {
    // StoreError и всё, что вылетело из клиента хранилища
    ctx.log.error("Error writing point to " + writer_.name() + ": " +
                  e.what());
    return make_reply(500, "Error writing point to " + writer_.name());
  }

  ctx.log.info("Error logged: service=" + report.service +
               " endpoint=" + report.endpoint);
  return make_reply(200, "Error logged");
}

} // namespace endon
