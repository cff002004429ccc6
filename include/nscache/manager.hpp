#pragma once

#include "nscache/config.hpp"
#include "nscache/events.hpp"
#include "nscache/keys.hpp"
#include "nscache/logger.hpp"
#include "nscache/policy.hpp"
#include "nscache/store.hpp"

#include <any>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nscache {

struct GlobalStats {
  std::size_t total_namespaces{0};
  std::size_t total_entries{0};
  std::size_t total_memory_bytes{0};
  std::map<std::string, NamespaceStats> namespaces;
};

// Process-wide cache context. Construct one, hand it to collaborators by
// reference, and call reset() to tear it down between tests.
//
// Reads of unknown namespaces are misses; namespaces are created by the
// first write, which also fixes their configuration.
class CacheManager {
public:
  explicit CacheManager(NamespaceConfig defaults = {});

  std::optional<std::any> get_any(const std::string &ns,
                                  const std::string &key);

  // Absent on miss, or when the stored value is not a T.
  template <typename T>
  std::optional<T> get(const std::string &ns, const std::string &key) {
    auto value = get_any(ns, key);
    if (!value.has_value())
      return std::nullopt;
    if (const T *typed = std::any_cast<T>(&*value))
      return *typed;
    NSCACHE_DEBUG("nscache: type mismatch reading {}/{}", ns, key);
    return std::nullopt;
  }

  bool set_any(const std::string &ns, const std::string &key, std::any value,
               std::size_t approx_size, const SetOptions &opts = {},
               const NamespaceOptions *ns_opts = nullptr,
               Error *err = nullptr);

  // Character arrays, pointers and views are stored as an owned std::string.
  template <typename T>
  bool set(const std::string &ns, const std::string &key, T value,
           const SetOptions &opts = {}, Error *err = nullptr) {
    return set_typed(ns, key, std::move(value), opts, nullptr, err);
  }

  template <typename T>
  bool set(const std::string &ns, const std::string &key, T value,
           const SetOptions &opts, const NamespaceOptions &ns_opts,
           Error *err = nullptr) {
    return set_typed(ns, key, std::move(value), opts, &ns_opts, err);
  }

  bool del(const std::string &ns, const std::string &key);
  bool has(const std::string &ns, const std::string &key);
  void clear(const std::string &ns);
  void clear_all();

  NamespaceStats stats(const std::string &ns) const;
  GlobalStats stats() const;

  std::size_t cleanup(const std::string &ns);
  std::size_t cleanup();

  // Adds or replaces a named prototype. Namespaces created afterwards get a
  // fresh copy; existing namespaces are unaffected.
  bool register_strategy(const std::string &name, EvictionStrategy prototype,
                         Error *err = nullptr);
  bool has_strategy(const std::string &name) const {
    return strategies_.contains(name);
  }

  // Read-through. |fetch| has the shape std::optional<T>(std::string *err);
  // nullopt is reported as FetchError with fetch's message and nothing is
  // cached. Concurrent misses are not deduplicated.
  template <typename T, typename Fetch>
  std::optional<T> get_or_fetch(const std::string &ns, const std::string &key,
                                Fetch &&fetch, const SetOptions &opts = {},
                                Error *err = nullptr) {
    if (auto cached = get<T>(ns, key))
      return cached;
    if (!validate_namespace(ns)) {
      fail(err, ErrorCode::InvalidNamespace, "invalid namespace: " + ns);
      return std::nullopt;
    }
    std::string fetch_err;
    std::optional<T> fresh = std::forward<Fetch>(fetch)(&fetch_err);
    if (!fresh.has_value()) {
      fail(err, ErrorCode::FetchError, std::move(fetch_err));
      return std::nullopt;
    }
    if (!set<T>(ns, key, *fresh, opts, err))
      return std::nullopt;
    return fresh;
  }

  template <typename T>
  std::map<std::string, T> get_many(const std::string &ns,
                                    const std::vector<std::string> &keys) {
    std::map<std::string, T> out;
    if (!namespaces_.contains(ns))
      return out;
    for (const auto &k : keys) {
      if (auto v = get<T>(ns, k))
        out.emplace(k, std::move(*v));
    }
    return out;
  }

  template <typename T>
  bool set_many(const std::string &ns,
                const std::vector<std::pair<std::string, T>> &entries,
                const SetOptions &opts = {}, Error *err = nullptr) {
    for (const auto &[k, v] : entries) {
      if (!set<T>(ns, k, v, opts, err))
        return false;
    }
    return true;
  }

  std::size_t delete_many(const std::string &ns,
                          const std::vector<std::string> &keys);

  // Expired but still present; no stats, recency or removal side effects.
  bool is_stale(const std::string &ns, const std::string &key) const;

  std::vector<std::string> namespaces() const;
  std::vector<CacheEvent> drain_events(const std::string &ns);

  // Affects namespaces created afterwards.
  bool reload_defaults(const std::string &path, std::string *err = nullptr);
  const NamespaceConfig &defaults() const { return defaults_; }

  // Drops every namespace and restores the construction-time defaults and
  // the built-in strategy registry.
  void reset();

  std::string info() const;
  std::string info(const std::string &ns) const;

  CacheStore *find(const std::string &ns);
  const CacheStore *find(const std::string &ns) const;

private:
  template <typename T>
  bool set_typed(const std::string &ns, const std::string &key, T value,
                 const SetOptions &opts, const NamespaceOptions *ns_opts,
                 Error *err) {
    if constexpr (std::is_convertible_v<const T &, std::string_view> &&
                  !std::is_same_v<T, std::string>) {
      std::string owned;
      if constexpr (std::is_pointer_v<T>) {
        if (value != nullptr)
          owned = std::string_view(value);
      } else {
        owned = std::string_view(value);
      }
      return set_typed(ns, key, std::move(owned), opts, ns_opts, err);
    } else {
      const auto size = estimate_size(value);
      return set_any(ns, key, std::any(std::move(value)), size, opts, ns_opts,
                     err);
    }
  }

  CacheStore *get_or_create(const std::string &ns,
                            const NamespaceOptions *ns_opts, Error *err);
  void register_builtin_strategies();

  NamespaceConfig initial_defaults_;
  NamespaceConfig defaults_;
  std::unordered_map<std::string, CacheStore> namespaces_;
  std::unordered_map<std::string, EvictionStrategy> strategies_;
};

} // namespace nscache
