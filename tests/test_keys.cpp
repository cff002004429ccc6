#include "nscache/keys.hpp"
#include "nscache/manager.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using namespace nscache;

TEST_CASE("generated keys are deterministic and order independent",
          "[keys]") {
  KeyParams a{{"page", "2"}, {"grade", "10"}};
  KeyParams b;
  b["grade"] = "10";
  b["page"] = "2";
  REQUIRE(generate_key("textbook", "42", a) == generate_key("textbook", "42", b));
  REQUIRE(generate_key("textbook", "42") == "textbook:42");
  REQUIRE(generate_key("textbook", "42", a) == "textbook:42:grade=10&page=2");
  CHECK(generate_key("textbook", "42", {{"page", "3"}}) !=
        generate_key("textbook", "42", {{"page", "2"}}));
}

TEST_CASE("reserved characters cannot produce colliding keys", "[keys]") {
  const auto k1 = generate_key("a:b", "c");
  const auto k2 = generate_key("a", "b:c");
  CHECK(k1 != k2);
  CHECK(generate_key("t", "i", {{"x", "1&y=2"}}) !=
        generate_key("t", "i", {{"x", "1"}, {"y", "2"}}));
}

TEST_CASE("parse_key inverts generate_key", "[keys][parse]") {
  const std::vector<std::pair<std::string, std::string>> cases = {
      {"user", "1"},
      {"chapter", "ch-07_b"},
      {"odd:type", "id%with=reserved&chars"},
      {"unicode", "r\xC3\xA9sum\xC3\xA9"},
  };
  for (const auto &[type, id] : cases) {
    auto parsed = parse_key(generate_key(type, id));
    REQUIRE(parsed.has_value());
    CHECK(parsed->entity_type == type);
    CHECK(parsed->entity_id == id);
    CHECK(parsed->params.empty());
  }

  KeyParams params{{"lang", "en"}, {"q", "a=b"}};
  auto parsed = parse_key(generate_key("search", "7", params));
  REQUIRE(parsed.has_value());
  CHECK(*parsed == (ParsedKey{"search", "7", params}));
}

TEST_CASE("parse_key rejects malformed keys", "[keys][parse]") {
  const std::vector<std::string> bad = {
      "",          "nocolon",     "a:b:c:d", ":id",      "type:",
      "t:i:novalue", "t:i:=v",    "t:i%ZZ",  "t:i%4",    "t:i:k=v&",
  };
  for (const auto &key : bad) {
    Error err;
    CHECK_FALSE(parse_key(key, &err).has_value());
    CHECK(err.code == ErrorCode::ParseError);
    CHECK(std::string(to_string(err.code)) == "parse_error");
    CHECK_FALSE(err.message.empty());
  }
}

TEST_CASE("namespace validation", "[keys][namespace]") {
  CHECK(validate_namespace("textbooks"));
  CHECK(validate_namespace("user_profiles-v2"));
  CHECK(validate_namespace(std::string(50, 'a')));
  CHECK_FALSE(validate_namespace(""));
  CHECK_FALSE(validate_namespace(std::string(51, 'a')));
  CHECK_FALSE(validate_namespace("user profiles"));
  CHECK_FALSE(validate_namespace("a/b"));
  CHECK_FALSE(validate_namespace("ns:1"));
}

TEST_CASE("size estimates never throw", "[keys][size]") {
  struct Opaque {
    std::string name;
    std::vector<int> values;
  };
  CHECK(estimate_size(std::string("hello")) == 5);
  CHECK(estimate_size(std::int64_t{7}) == sizeof(std::int64_t));
  CHECK(estimate_size(std::vector<std::uint8_t>(32, 0)) == 32);
  CHECK(estimate_size(std::vector<std::string>{"ab", "cde"}) == 5);
  CHECK(estimate_size(Opaque{"x", {1, 2}}) == kUnknownSizeBytes);
}

TEST_CASE("expiry prefers explicit ttl then default", "[keys][ttl]") {
  const auto now = Clock::now();
  using std::chrono::milliseconds;
  CHECK(calculate_expiry(100, 5000, now) == now + milliseconds(100));
  CHECK(calculate_expiry(std::nullopt, 5000, now) == now + milliseconds(5000));
  CHECK(calculate_expiry(0, 5000, now) == now + milliseconds(5000));
  CHECK_FALSE(calculate_expiry(0, std::nullopt, now).has_value());
  CHECK_FALSE(calculate_expiry(-5, std::nullopt, now).has_value());
  CHECK_FALSE(calculate_expiry(std::nullopt, std::nullopt, now).has_value());

  CacheEntry e;
  CHECK_FALSE(is_expired(e, now));
  e.expires_at = now;
  CHECK_FALSE(is_expired(e, now));
  CHECK(is_expired(e, now + milliseconds(1)));
}

TEST_CASE("very long ttl saturates instead of wrapping", "[keys][ttl]") {
  const auto now = Clock::now();
  CHECK(calculate_expiry(10'000'000'000'000, std::nullopt, now) ==
        TimePoint::max());
  CHECK(calculate_expiry(std::nullopt, INT64_MAX, now) == TimePoint::max());

  CacheManager m;
  SetOptions so;
  so.ttl_ms = 10'000'000'000'000;
  REQUIRE(m.set("forever", "k", 1, so));
  CHECK(m.get<int>("forever", "k") == 1);
  CHECK_FALSE(m.is_stale("forever", "k"));
  CHECK(m.cleanup("forever") == 0);
}
