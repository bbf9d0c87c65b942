#include <gtest/gtest.h>
#include <endon/request_context.hpp>

#include <cstdio>
#include <set>
#include <string>

using namespace endon;

TEST(RequestId, LengthAndAlphabet) {
  for (int i = 0; i < 100; ++i) {
    const auto id = make_request_id();
    ASSERT_EQ(id.size(), 12u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz"),
              std::string::npos)
        << id;
  }
}

TEST(RequestId, Distinct) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i)
    ids.insert(make_request_id());
  EXPECT_EQ(ids.size(), 1000u);
}

TEST(CancelToken, StartsClearAndStaysCancelled) {
  RequestContext ctx("abc");
  EXPECT_FALSE(ctx.cancelled());
  ctx.cancel->cancel();
  EXPECT_TRUE(ctx.cancelled());
  ctx.cancel->cancel();
  EXPECT_TRUE(ctx.cancelled());
}

TEST(RequestLogger, PrefixesLinesWithRequestId) {
  std::FILE *f = std::tmpfile();
  ASSERT_NE(f, nullptr);

  set_log_color(false);
  RequestLogger log("req123456789", f);
  log.error("Missing required fields in the JSON payload");
  set_log_color(true);

  std::rewind(f);
  char buf[256] = {};
  ASSERT_NE(std::fgets(buf, sizeof(buf), f), nullptr);
  std::fclose(f);

  const std::string line = buf;
  EXPECT_NE(line.find("ERROR [req123456789]: Missing required fields"),
            std::string::npos)
      << line;
}
