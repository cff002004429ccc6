#pragma once

#include "nscache/config.hpp"
#include "nscache/events.hpp"
#include "nscache/policy.hpp"
#include "nscache/types.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nscache {

struct StoreCounters {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t hook_failures{0};
};

struct NamespaceStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t hook_failures{0};
  std::uint64_t events_dropped{0};
  std::size_t size{0};
  std::size_t memory_bytes{0};
  // Derived from the live entry set on every call.
  double hit_rate{0.0};
  double avg_access_count{0.0};
  std::optional<TimePoint> oldest_entry;
  std::optional<TimePoint> newest_entry;
};

// Entries of a single namespace. Not thread-safe; callers serialize.
class CacheStore {
public:
  CacheStore(std::string ns, NamespaceConfig cfg, EvictionStrategy strategy);

  std::optional<std::any> get(const std::string &key);
  bool has(const std::string &key) { return get(key).has_value(); }
  void set(const std::string &key, std::any value, std::size_t approx_size,
           const SetOptions &opts = {});
  bool del(const std::string &key);
  void clear();
  // Removes every entry the strategy reports as dead. Returns the count.
  std::size_t cleanup();

  NamespaceStats stats() const;
  std::string info() const;

  // Side-effect free lookups.
  const CacheEntry *peek(const std::string &key) const;
  bool is_stale(const std::string &key) const;

  std::vector<CacheEvent> drain_events() { return events_.drain(); }

  const std::string &name() const { return name_; }
  const NamespaceConfig &config() const { return cfg_; }
  const EvictionStrategy &strategy() const { return strategy_; }
  const StoreCounters &counters() const { return counters_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t memory_used() const { return memory_used_; }

private:
  void erase_internal(const std::string &key, bool eviction, bool expiration);
  std::optional<CacheEntry> evict_one(TimePoint now);
  void notify(EventKind kind, const CacheEntry &entry, TimePoint now);
  void bump(std::uint64_t &counter) {
    if (cfg_.enable_stats)
      ++counter;
  }

  std::string name_;
  NamespaceConfig cfg_;
  EvictionStrategy strategy_;
  EntryTable entries_;
  EventChannel events_;
  StoreCounters counters_;
  std::size_t memory_used_{0};
  std::uint64_t seq_{0};
};

} // namespace nscache
