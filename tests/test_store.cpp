#include "nscache/store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace nscache;

namespace {
CacheStore make_store(const std::string &strategy, std::size_t max_entries,
                      NamespaceConfig cfg = {}) {
  cfg.max_entries = max_entries;
  cfg.strategy = strategy;
  return CacheStore("test", cfg, *make_strategy_by_name(strategy));
}

int value_of(const std::optional<std::any> &v) {
  return std::any_cast<int>(*v);
}
} // namespace

TEST_CASE("LRU store keeps recently read keys", "[store][lru]") {
  auto s = make_store("lru", 3);
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.set("c", 3, sizeof(int));
  REQUIRE(s.get("a").has_value());
  s.set("d", 4, sizeof(int));

  CHECK_FALSE(s.get("b").has_value());
  CHECK(value_of(s.get("a")) == 1);
  CHECK(value_of(s.get("c")) == 3);
  CHECK(value_of(s.get("d")) == 4);
  CHECK(s.size() == 3);
  CHECK(s.stats().evictions == 1);
}

TEST_CASE("oldest untouched key is evicted first", "[store][lru]") {
  auto s = make_store("lru", 2);
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.set("c", 3, sizeof(int));
  CHECK_FALSE(s.get("a").has_value());
  CHECK(value_of(s.get("b")) == 2);
  CHECK(value_of(s.get("c")) == 3);
}

TEST_CASE("TTL entries expire lazily on read", "[store][ttl]") {
  auto s = make_store("ttl", 10);
  SetOptions short_ttl;
  short_ttl.ttl_ms = 50;
  s.set("k", std::string("v"), 1, short_ttl);
  s.set("keep", std::string("v"), 1);
  REQUIRE(s.size() == 2);
  REQUIRE(s.get("k").has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK(s.is_stale("k"));
  CHECK_FALSE(s.get("k").has_value());
  CHECK(s.size() == 1);
  CHECK(s.stats().expirations == 1);
  CHECK(s.stats().misses == 1);
  CHECK(s.get("keep").has_value());
}

TEST_CASE("LRU store honours the namespace default TTL", "[store][lru][ttl]") {
  NamespaceConfig cfg;
  cfg.default_ttl_ms = 30;
  auto s = make_store("lru", 10, cfg);
  s.set("k", 1, sizeof(int));
  SetOptions longer;
  longer.ttl_ms = 60000;
  s.set("long", 2, sizeof(int), longer);
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  CHECK_FALSE(s.get("k").has_value());
  CHECK(s.get("long").has_value());
}

TEST_CASE("cleanup sweeps dead entries without reads", "[store][cleanup]") {
  auto s = make_store("lru", 10);
  SetOptions ttl;
  ttl.ttl_ms = 10;
  for (int i = 0; i < 4; ++i)
    s.set("t" + std::to_string(i), i, sizeof(int), ttl);
  s.set("forever", 9, sizeof(int));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  CHECK(s.cleanup() == 4);
  CHECK(s.size() == 1);
  CHECK(s.stats().expirations == 4);
  CHECK(s.stats().misses == 0);
  CHECK(s.cleanup() == 0);
}

TEST_CASE("overwrite resets access count and never evicts",
          "[store][overwrite]") {
  auto s = make_store("lru", 2);
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.get("a");
  s.get("a");
  REQUIRE(s.peek("a")->access_count == 2);

  s.set("a", 10, sizeof(int));
  CHECK(s.peek("a")->access_count == 0);
  CHECK(s.size() == 2);
  CHECK(s.stats().evictions == 0);
  CHECK(value_of(s.get("a")) == 10);
  CHECK(s.stats().sets == 3);
}

TEST_CASE("delete is idempotent", "[store][delete]") {
  auto s = make_store("lru", 4);
  s.set("k", 1, sizeof(int));
  CHECK(s.del("k"));
  CHECK(s.stats().deletes == 1);
  CHECK_FALSE(s.del("k"));
  CHECK_FALSE(s.del("missing"));
  CHECK(s.stats().deletes == 1);
}

TEST_CASE("hit rate and derived stats come from live entries",
          "[store][stats]") {
  auto s = make_store("lru", 4);
  CHECK_FALSE(s.stats().oldest_entry.has_value());
  CHECK_FALSE(s.stats().newest_entry.has_value());

  s.set("a", 1, 4);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  s.set("b", 2, 6);
  s.get("a");
  s.get("a");
  s.get("b");
  s.get("missing");

  const auto st = s.stats();
  CHECK(st.hits == 3);
  CHECK(st.misses == 1);
  CHECK(st.hit_rate == 0.75);
  CHECK(st.avg_access_count == 1.5);
  CHECK(st.size == 2);
  CHECK(st.memory_bytes == 10);
  REQUIRE(st.oldest_entry.has_value());
  REQUIRE(st.newest_entry.has_value());
  CHECK(*st.oldest_entry == s.peek("a")->created_at);
  CHECK(*st.newest_entry == s.peek("b")->created_at);

  const auto info = s.info();
  CHECK(info.find("topk_hits:a:2,b:1") != std::string::npos);
  CHECK(info.find("strategy:lru") != std::string::npos);
}

TEST_CASE("clear drops entries and statistics", "[store][clear]") {
  auto s = make_store("swr", 4);
  s.set("a", 1, sizeof(int));
  s.get("a");
  s.get("nope");
  s.clear();
  const auto st = s.stats();
  CHECK(st.size == 0);
  CHECK(st.hits == 0);
  CHECK(st.misses == 0);
  CHECK(st.sets == 0);
  CHECK(st.memory_bytes == 0);
  CHECK(s.strategy().as<SwrStrategy>()->recency().empty());
  s.set("b", 2, sizeof(int));
  CHECK(value_of(s.get("b")) == 2);
}

TEST_CASE("disabled stats keep counters at zero", "[store][stats]") {
  NamespaceConfig cfg;
  cfg.enable_stats = false;
  auto s = make_store("lru", 1, cfg);
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.get("b");
  s.get("a");
  const auto st = s.stats();
  CHECK(st.hits == 0);
  CHECK(st.misses == 0);
  CHECK(st.sets == 0);
  CHECK(st.evictions == 0);
  CHECK(st.size == 1);
}

TEST_CASE("store grows past capacity when tracking has no usable candidate",
          "[store][capacity]") {
  // Tracking already holds a key the table has never seen.
  LruStrategy lru;
  CacheEntry ghost;
  ghost.key = "ghost";
  lru.on_set(ghost);

  NamespaceConfig cfg;
  cfg.max_entries = 2;
  CacheStore s("test", cfg, EvictionStrategy(std::move(lru)));
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.set("c", 3, sizeof(int));
  CHECK(s.size() == 3);
  CHECK(s.stats().evictions == 0);
  CHECK(s.drain_events().empty());

  // The stale key is dropped from tracking, so real eviction resumes.
  s.set("d", 4, sizeof(int));
  CHECK(s.size() == 3);
  CHECK(s.stats().evictions == 1);
  CHECK_FALSE(s.get("a").has_value());
  CHECK(value_of(s.get("d")) == 4);
}

TEST_CASE("eviction hook sees the evicted entry", "[store][hooks]") {
  std::vector<std::string> evicted;
  NamespaceConfig cfg;
  cfg.on_evict = [&](const CacheEntry &e) {
    evicted.push_back(e.key + "=" + std::to_string(std::any_cast<int>(e.value)));
  };
  auto s = make_store("lru", 2, cfg);
  s.set("a", 1, sizeof(int));
  s.set("b", 2, sizeof(int));
  s.set("c", 3, sizeof(int));
  s.set("d", 4, sizeof(int));
  CHECK(evicted == std::vector<std::string>{"a=1", "b=2"});

  auto events = s.drain_events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].kind == EventKind::Evicted);
  CHECK(events[0].key == "a");
  REQUIRE(events[0].entry.has_value());
  CHECK(events[0].entry->ns == "test");
  CHECK(s.drain_events().empty());
}

TEST_CASE("a throwing eviction hook does not fail the write",
          "[store][hooks]") {
  NamespaceConfig cfg;
  cfg.on_evict = [](const CacheEntry &) {
    throw std::runtime_error("hook exploded");
  };
  auto s = make_store("ttl", 1, cfg);
  s.set("a", 1, sizeof(int));
  REQUIRE_NOTHROW(s.set("b", 2, sizeof(int)));
  CHECK(value_of(s.get("b")) == 2);
  CHECK(s.size() == 1);
  CHECK(s.stats().hook_failures == 1);
  CHECK(s.stats().evictions == 1);
}

TEST_CASE("event channel is bounded", "[store][events]") {
  NamespaceConfig cfg;
  cfg.event_capacity = 2;
  auto s = make_store("lru", 1, cfg);
  for (int i = 0; i < 5; ++i)
    s.set("k" + std::to_string(i), i, sizeof(int));
  const auto events = s.drain_events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].key == "k2");
  CHECK(events[1].key == "k3");
  CHECK(s.stats().events_dropped == 2);
}

TEST_CASE("SWR serves stale values and requests a refresh", "[store][swr]") {
  std::vector<std::string> refresh;
  NamespaceConfig cfg;
  cfg.on_stale = [&](const CacheEntry &e) { refresh.push_back(e.key); };
  auto s = make_store("swr", 4, cfg);
  SetOptions ttl;
  ttl.ttl_ms = 10;
  s.set("k", 7, sizeof(int), ttl);
  REQUIRE(value_of(s.get("k")) == 7);
  CHECK(refresh.empty());

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  CHECK(s.cleanup() == 0);
  CHECK(value_of(s.get("k")) == 7);
  CHECK(value_of(s.get("k")) == 7);
  CHECK(refresh == std::vector<std::string>{"k", "k"});
  CHECK(s.stats().hits == 3);

  const auto events = s.drain_events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].kind == EventKind::RefreshNeeded);
  CHECK_FALSE(events[0].entry.has_value());
}
