#pragma once

#include "nscache/config.hpp"
#include "nscache/recency_list.hpp"
#include "nscache/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace nscache {

// Every strategy provides the same members; EvictionStrategy dispatches to
// them with std::visit, so a missing member fails to compile.
//
//   on_access  - after a successful read; returns true if the value served
//                was stale and a refresh should be requested.
//   on_set     - after every write (new key or overwrite).
//   on_erase   - after a key left the store for any reason.
//   should_evict - lazy check on the read path, independent of capacity.
//   select_eviction_candidate - only when inserting a new key at capacity.

class LruStrategy {
public:
  static constexpr const char *kName = "lru";

  std::string name() const { return kName; }
  bool on_access(const CacheEntry &entry, TimePoint now);
  void on_set(const CacheEntry &entry);
  void on_erase(const std::string &key);
  bool should_evict(const CacheEntry &entry, const NamespaceConfig &cfg,
                    TimePoint now) const;
  std::optional<std::string>
  select_eviction_candidate(const EntryTable &entries,
                            const NamespaceConfig &cfg, TimePoint now) const;
  void clear();

  const RecencyList &recency() const { return recency_; }

private:
  RecencyList recency_;
};

class TtlStrategy {
public:
  static constexpr const char *kName = "ttl";

  std::string name() const { return kName; }
  bool on_access(const CacheEntry &entry, TimePoint now);
  void on_set(const CacheEntry &entry);
  void on_erase(const std::string &key);
  bool should_evict(const CacheEntry &entry, const NamespaceConfig &cfg,
                    TimePoint now) const;
  // Single O(n) scan: earliest expiry wins, falling back to the oldest
  // created_at when nothing has a TTL. Ties go to the lowest sequence.
  std::optional<std::string>
  select_eviction_candidate(const EntryTable &entries,
                            const NamespaceConfig &cfg, TimePoint now) const;
  void clear();
};

class SwrStrategy {
public:
  static constexpr const char *kName = "swr";

  SwrStrategy() = default;
  explicit SwrStrategy(std::chrono::milliseconds very_stale_after)
      : very_stale_after_(very_stale_after) {}

  std::string name() const { return kName; }
  bool on_access(const CacheEntry &entry, TimePoint now);
  void on_set(const CacheEntry &entry);
  void on_erase(const std::string &key);
  // Always false: entries only leave through capacity eviction, delete or
  // clear.
  bool should_evict(const CacheEntry &entry, const NamespaceConfig &cfg,
                    TimePoint now) const;
  // Prefers an entry expired for longer than very_stale_after, then the
  // least recently used one.
  std::optional<std::string>
  select_eviction_candidate(const EntryTable &entries,
                            const NamespaceConfig &cfg, TimePoint now) const;
  void clear();

  std::chrono::milliseconds very_stale_after() const {
    return very_stale_after_;
  }
  const RecencyList &recency() const { return recency_; }

private:
  std::chrono::milliseconds very_stale_after_{std::chrono::hours(1)};
  RecencyList recency_;
};

class EvictionStrategy {
public:
  using Variant = std::variant<LruStrategy, TtlStrategy, SwrStrategy>;

  EvictionStrategy() = default;
  EvictionStrategy(LruStrategy s) : impl_(std::move(s)) {}
  EvictionStrategy(TtlStrategy s) : impl_(std::move(s)) {}
  EvictionStrategy(SwrStrategy s) : impl_(std::move(s)) {}

  std::string name() const;
  bool on_access(const CacheEntry &entry, TimePoint now);
  void on_set(const CacheEntry &entry);
  void on_erase(const std::string &key);
  bool should_evict(const CacheEntry &entry, const NamespaceConfig &cfg,
                    TimePoint now) const;
  std::optional<std::string>
  select_eviction_candidate(const EntryTable &entries,
                            const NamespaceConfig &cfg, TimePoint now) const;
  void clear();

  // Copy of this strategy's parameters with no tracked keys.
  EvictionStrategy fresh() const;

  template <typename S> const S *as() const { return std::get_if<S>(&impl_); }

private:
  Variant impl_;
};

std::optional<EvictionStrategy> make_strategy_by_name(const std::string &name);

} // namespace nscache
