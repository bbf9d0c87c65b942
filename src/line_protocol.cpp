#include "endon/line_protocol.hpp"
#include "endon/time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace endon {

namespace {

// Обратные слэши прямо перед разделителем (или в конце имени) склеили бы
// его с экранирующим '\\', и парсер InfluxDB прочитал бы тег иначе.
// Такие слэши отбрасываем, остальные пишем как есть.
bool is_special(const char *specials, char c) {
  return c != '\0' && std::strchr(specials, c) != nullptr;
}

void append_escaped(std::string &out, const std::string &s,
                    const char *specials) {
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\\') {
      std::size_t run_end = s.find_first_not_of('\\', i);
      if (run_end == std::string::npos ||
          is_special(specials, s[run_end])) {
        i = run_end == std::string::npos ? s.size() : run_end - 1;
        continue;
      }
    }
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    if (is_special(specials, c))
      out += '\\';
    out += c;
  }
}

// measurement: ',' и ' '
void append_measurement(std::string &out, const std::string &s) {
  append_escaped(out, s, ", ");
}

// ключи тегов/полей и значения тегов: ',', '=', ' '
void append_key(std::string &out, const std::string &s) {
  append_escaped(out, s, ",= ");
}

// имя пустое или из одних обратных слэшей
bool blank_name(const std::string &s) {
  return s.find_first_not_of('\\') == std::string::npos;
}

void append_string_field(std::string &out, const std::string &s) {
  out += '"';
  for (char c : s) {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  out += '"';
}

void append_double(std::string &out, double v) {
  if (!std::isfinite(v))
    throw std::invalid_argument("line protocol: non-finite float field");

  // 15 знаков хватает почти всегда, иначе 17 — гарантированный round-trip
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  if (std::strtod(buf, nullptr) != v)
    std::snprintf(buf, sizeof(buf), "%.17g", v);
  out += buf;
}

struct FieldAppender {
  std::string &out;

  void operator()(const std::string &s) const { append_string_field(out, s); }
  void operator()(double d) const { append_double(out, d); }
  void operator()(std::int64_t i) const {
    out += std::to_string(i);
    out += 'i';
  }
  void operator()(bool b) const { out += b ? "true" : "false"; }
};

} // namespace

std::string encode_line(const Point &point) {
  if (blank_name(point.measurement))
    throw std::invalid_argument("line protocol: empty measurement");
  if (point.fields.empty())
    throw std::invalid_argument("line protocol: point has no fields");

  std::string out;
  out.reserve(128);
  append_measurement(out, point.measurement);

  // std::map уже отсортирован по ключу — так InfluxDB и рекомендует
  for (const auto &[key, value] : point.tags) {
    if (blank_name(key) || blank_name(value))
      continue;
    out += ',';
    append_key(out, key);
    out += '=';
    append_key(out, value);
  }

  char sep = ' ';
  for (const auto &[key, value] : point.fields) {
    if (blank_name(key))
      throw std::invalid_argument("line protocol: empty field key");
    out += sep;
    sep = ',';
    append_key(out, key);
    out += '=';
    std::visit(FieldAppender{out}, value);
  }

  out += ' ';
  out += std::to_string(to_unix_nanos(point.ts));
  return out;
}

} // namespace endon
