#include <gtest/gtest.h>
#include <endon/line_protocol.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>

using endon::encode_line;
using endon::Point;

namespace {

Point base_point() {
  Point p;
  p.measurement = "error_logs";
  p.ts = std::chrono::system_clock::time_point{
      std::chrono::nanoseconds(1'700'000'000'000'000'123LL)};
  return p;
}

} // namespace

TEST(LineProtocol, TagsSortedAndStringField) {
  Point p = base_point();
  p.tags = {{"service", "api"}, {"endpoint", "/v1/x"}};
  p.fields = {{"error", std::string("timeout")}};

  EXPECT_EQ(encode_line(p),
            "error_logs,endpoint=/v1/x,service=api error=\"timeout\" "
            "1700000000000000123");
}

TEST(LineProtocol, EscapesTagsAndKeys) {
  Point p = base_point();
  p.measurement = "error logs,x";
  p.tags = {{"service", "my api,v=2"}};
  p.fields = {{"the error", std::string("x")}};

  EXPECT_EQ(encode_line(p), "error\\ logs\\,x,service=my\\ api\\,v\\=2 "
                            "the\\ error=\"x\" 1700000000000000123");
}

TEST(LineProtocol, EscapesQuotesAndBackslashesInStringFields) {
  Point p = base_point();
  p.fields = {{"traceback", std::string("File \"a.py\"\n  C:\\dir")}};

  EXPECT_EQ(encode_line(p),
            "error_logs traceback=\"File \\\"a.py\\\"\n  C:\\\\dir\" "
            "1700000000000000123");
}

TEST(LineProtocol, NewlineInTagValueIsEscaped) {
  Point p = base_point();
  p.tags = {{"endpoint", "a\nb"}};
  p.fields = {{"error", std::string("e")}};

  EXPECT_EQ(encode_line(p),
            "error_logs,endpoint=a\\nb error=\"e\" 1700000000000000123");
}

TEST(LineProtocol, EmptyTagValueIsSkipped) {
  Point p = base_point();
  p.tags = {{"service", ""}, {"endpoint", "/x"}};
  p.fields = {{"error", std::string("e")}};

  EXPECT_EQ(encode_line(p),
            "error_logs,endpoint=/x error=\"e\" 1700000000000000123");
}

TEST(LineProtocol, TrailingBackslashInTagsIsDropped) {
  Point p = base_point();
  p.tags = {{"endpoint", "C:\\"}, {"service", "api\\"}};
  p.fields = {{"error", std::string("timeout")}};

  EXPECT_EQ(encode_line(p), "error_logs,endpoint=C:,service=api "
                            "error=\"timeout\" 1700000000000000123");
}

TEST(LineProtocol, BackslashBeforeEscapedDelimiterIsDropped) {
  Point p = base_point();
  p.tags = {{"service", "a\\,b"}, {"host\\", "\\\\"}};
  p.fields = {{"error", std::string("e")}};

  // значение из одних слэшей: тег пропускается
  EXPECT_EQ(encode_line(p),
            "error_logs,service=a\\,b error=\"e\" 1700000000000000123");
}

TEST(LineProtocol, InnerBackslashInTagIsKept) {
  Point p = base_point();
  p.tags = {{"endpoint", "C:\\dir\\x"}};
  p.fields = {{"error", std::string("e")}};

  EXPECT_EQ(encode_line(p), "error_logs,endpoint=C:\\dir\\x error=\"e\" "
                            "1700000000000000123");
}

TEST(LineProtocol, ScalarFields) {
  Point p = base_point();
  p.fields = {{"count", std::int64_t{42}},
              {"ok", false},
              {"ratio", 0.5},
              {"whole", 3.0}};

  EXPECT_EQ(encode_line(p),
            "error_logs count=42i,ok=false,ratio=0.5,whole=3 "
            "1700000000000000123");
}

TEST(LineProtocol, DoubleRoundTrips) {
  Point p = base_point();
  p.fields = {{"v", 0.1}};
  EXPECT_EQ(encode_line(p), "error_logs v=0.1 1700000000000000123");
}

TEST(LineProtocol, RejectsNonFiniteFloat) {
  Point p = base_point();
  p.fields = {{"v", std::numeric_limits<double>::infinity()}};
  EXPECT_THROW(encode_line(p), std::invalid_argument);

  p.fields = {{"v", std::numeric_limits<double>::quiet_NaN()}};
  EXPECT_THROW(encode_line(p), std::invalid_argument);
}

TEST(LineProtocol, RejectsPointWithoutFields) {
  Point p = base_point();
  p.tags = {{"service", "api"}};
  EXPECT_THROW(encode_line(p), std::invalid_argument);
}

TEST(LineProtocol, RejectsEmptyMeasurement) {
  Point p = base_point();
  p.measurement.clear();
  p.fields = {{"error", std::string("e")}};
  EXPECT_THROW(encode_line(p), std::invalid_argument);
}
