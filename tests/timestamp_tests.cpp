#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitactivity/contribution.hpp>
#include <gitactivity/timestamp.hpp>

using namespace gitactivity;
using namespace std::chrono;

static long long epoch_ms(const char* s) {
  auto tp = parse_timestamp(s);
  REQUIRE(tp.has_value());
  return duration_cast<milliseconds>(tp->time_since_epoch()).count();
}

TEST_CASE("parse ISO-8601 timestamps") {
  REQUIRE(epoch_ms("1970-01-01T00:00:00Z") == 0);
  REQUIRE(epoch_ms("2026-01-01T10:00:00Z") == 1767261600000LL);
  REQUIRE(epoch_ms("2026-01-01T10:00:00.250Z") == 1767261600250LL);
  REQUIRE(epoch_ms("2026-01-01T12:00:00+02:00") == 1767261600000LL);
  REQUIRE(epoch_ms("2026-01-01T05:30:00-0430") == 1767261600000LL);
  REQUIRE(epoch_ms("2026-01-01 10:00") == 1767261600000LL);
  REQUIRE(epoch_ms("2026-01-01") == 1767225600000LL);
  REQUIRE(epoch_ms("2024-02-29T00:00:00Z") == 1709164800000LL);
}

TEST_CASE("reject malformed timestamps") {
  REQUIRE_FALSE(parse_timestamp("").has_value());
  REQUIRE_FALSE(parse_timestamp("yesterday").has_value());
  REQUIRE_FALSE(parse_timestamp("2026-13-01").has_value());
  REQUIRE_FALSE(parse_timestamp("2025-02-29").has_value());
  REQUIRE_FALSE(parse_timestamp("2026-01-01T25:00:00Z").has_value());
  REQUIRE_FALSE(parse_timestamp("2026-01-01T10:00:00+99:00").has_value());
  REQUIRE_FALSE(parse_timestamp("2300-01-01T00:00:00Z").has_value());
  REQUIRE_FALSE(parse_timestamp("1600-01-01T00:00:00Z").has_value());
}

TEST_CASE("format helpers") {
  auto tp = *parse_timestamp("2026-01-02T03:04:05.999Z");
  REQUIRE(format_utc_date(tp) == "2026-01-02");
  REQUIRE(format_utc_time(tp) == "03:04:05");
  REQUIRE(format_git_date(tp) == "1767323045 +0000");
}

TEST_CASE("sort_by_timestamp is stable and puts unparseable last") {
  std::vector<Contribution> in{
      {"commit", "2026-01-03", {}, {}, {}, std::string("c"), {}},
      {"commit", "garbage", {}, {}, {}, std::string("x"), {}},
      {"commit", "2026-01-01", {}, {}, {}, std::string("a1"), {}},
      {"pr", "2026-01-01T00:00:00Z", {}, {}, {}, std::string("a2"), {}},
      {"commit", "2026-01-02", {}, {}, {}, std::string("b"), {}},
  };
  auto out = sort_by_timestamp(in);
  REQUIRE(out.size() == 5);
  REQUIRE(*out[0].text == "a1");
  REQUIRE(*out[1].text == "a2");
  REQUIRE(*out[2].text == "b");
  REQUIRE(*out[3].text == "c");
  REQUIRE(*out[4].text == "x");
}
