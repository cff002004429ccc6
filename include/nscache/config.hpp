#pragma once

#include "nscache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace nscache {

using EntryHook = std::function<void(const CacheEntry &)>;

// Recency slots are indexed with 32 bits; this keeps well inside that.
inline constexpr std::size_t kMaxEntriesLimit = 100000000;

// Fixed when a namespace is created; later writers cannot change it.
struct NamespaceConfig {
  std::size_t max_entries{1000};
  std::optional<std::int64_t> default_ttl_ms;
  std::string strategy{"lru"};
  bool enable_stats{true};
  std::size_t event_capacity{256};
  EntryHook on_evict;
  EntryHook on_stale;
};

// Per-call overrides merged over the manager defaults.
struct NamespaceOptions {
  std::optional<std::size_t> max_entries;
  std::optional<std::int64_t> default_ttl_ms;
  std::optional<std::string> strategy;
  std::optional<bool> enable_stats;
  std::optional<std::size_t> event_capacity;
  EntryHook on_evict;
  EntryHook on_stale;
};

NamespaceConfig merge_config(const NamespaceConfig &base,
                             const NamespaceOptions &overrides);

bool validate_config(const NamespaceConfig &cfg, Error *err = nullptr);

// Reads max_entries, default_ttl_ms, strategy, enable_stats and
// event_capacity from a JSON document. |cfg| is only modified on success.
bool load_namespace_defaults(const std::string &path, NamespaceConfig &cfg,
                             std::string *err = nullptr);

} // namespace nscache
