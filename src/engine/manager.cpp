#include "nscache/manager.hpp"

#include <algorithm>
#include <sstream>

namespace nscache {

CacheManager::CacheManager(NamespaceConfig defaults)
    : initial_defaults_(defaults), defaults_(std::move(defaults)) {
  register_builtin_strategies();
}

void CacheManager::register_builtin_strategies() {
  strategies_.insert_or_assign(LruStrategy::kName,
                               EvictionStrategy(LruStrategy{}));
  strategies_.insert_or_assign(TtlStrategy::kName,
                               EvictionStrategy(TtlStrategy{}));
  strategies_.insert_or_assign(SwrStrategy::kName,
                               EvictionStrategy(SwrStrategy{}));
}

bool CacheManager::register_strategy(const std::string &name,
                                     EvictionStrategy prototype, Error *err) {
  if (name.empty()) {
    fail(err, ErrorCode::InvalidConfig, "strategy name must not be empty");
    return false;
  }
  const bool replaced = strategies_.contains(name);
  strategies_.insert_or_assign(name, prototype.fresh());
  NSCACHE_INFO("nscache: {} strategy '{}' ({})",
               replaced ? "replaced" : "registered", name, prototype.name());
  return true;
}

CacheStore *CacheManager::get_or_create(const std::string &ns,
                                        const NamespaceOptions *ns_opts,
                                        Error *err) {
  if (auto it = namespaces_.find(ns); it != namespaces_.end()) {
    if (ns_opts != nullptr)
      NSCACHE_DEBUG("nscache: namespace {} already exists, keeping its "
                    "original configuration",
                    ns);
    return &it->second;
  }
  if (!validate_namespace(ns)) {
    fail(err, ErrorCode::InvalidNamespace, "invalid namespace: " + ns);
    return nullptr;
  }

  NamespaceConfig cfg =
      ns_opts != nullptr ? merge_config(defaults_, *ns_opts) : defaults_;
  if (!validate_config(cfg, err))
    return nullptr;
  auto proto = strategies_.find(cfg.strategy);
  if (proto == strategies_.end()) {
    fail(err, ErrorCode::UnknownStrategy, "unknown strategy: " + cfg.strategy);
    return nullptr;
  }

  NSCACHE_INFO("nscache: created namespace {} (strategy={}, max_entries={})",
               ns, cfg.strategy, cfg.max_entries);
  auto [it, inserted] =
      namespaces_.try_emplace(ns, ns, std::move(cfg), proto->second.fresh());
  return &it->second;
}

std::optional<std::any> CacheManager::get_any(const std::string &ns,
                                              const std::string &key) {
  auto *store = find(ns);
  if (store == nullptr)
    return std::nullopt;
  return store->get(key);
}

bool CacheManager::set_any(const std::string &ns, const std::string &key,
                           std::any value, std::size_t approx_size,
                           const SetOptions &opts,
                           const NamespaceOptions *ns_opts, Error *err) {
  auto *store = get_or_create(ns, ns_opts, err);
  if (store == nullptr)
    return false;
  store->set(key, std::move(value), approx_size, opts);
  return true;
}

bool CacheManager::del(const std::string &ns, const std::string &key) {
  auto *store = find(ns);
  return store != nullptr && store->del(key);
}

bool CacheManager::has(const std::string &ns, const std::string &key) {
  auto *store = find(ns);
  return store != nullptr && store->has(key);
}

void CacheManager::clear(const std::string &ns) {
  if (auto *store = find(ns))
    store->clear();
}

void CacheManager::clear_all() {
  for (auto &[name, store] : namespaces_)
    store.clear();
  namespaces_.clear();
}

NamespaceStats CacheManager::stats(const std::string &ns) const {
  const auto *store = find(ns);
  return store != nullptr ? store->stats() : NamespaceStats{};
}

GlobalStats CacheManager::stats() const {
  GlobalStats g;
  g.total_namespaces = namespaces_.size();
  for (const auto &[name, store] : namespaces_) {
    auto s = store.stats();
    g.total_entries += s.size;
    g.total_memory_bytes += s.memory_bytes;
    g.namespaces.emplace(name, std::move(s));
  }
  return g;
}

std::size_t CacheManager::cleanup(const std::string &ns) {
  auto *store = find(ns);
  return store != nullptr ? store->cleanup() : 0;
}

std::size_t CacheManager::cleanup() {
  std::size_t removed = 0;
  for (auto &[name, store] : namespaces_)
    removed += store.cleanup();
  return removed;
}

std::size_t CacheManager::delete_many(const std::string &ns,
                                      const std::vector<std::string> &keys) {
  auto *store = find(ns);
  if (store == nullptr)
    return 0;
  std::size_t removed = 0;
  for (const auto &k : keys) {
    if (store->del(k))
      ++removed;
  }
  return removed;
}

bool CacheManager::is_stale(const std::string &ns,
                            const std::string &key) const {
  const auto *store = find(ns);
  return store != nullptr && store->is_stale(key);
}

std::vector<std::string> CacheManager::namespaces() const {
  std::vector<std::string> out;
  out.reserve(namespaces_.size());
  for (const auto &[name, store] : namespaces_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<CacheEvent> CacheManager::drain_events(const std::string &ns) {
  auto *store = find(ns);
  if (store == nullptr)
    return {};
  return store->drain_events();
}

bool CacheManager::reload_defaults(const std::string &path, std::string *err) {
  return load_namespace_defaults(path, defaults_, err);
}

void CacheManager::reset() {
  namespaces_.clear();
  strategies_.clear();
  register_builtin_strategies();
  defaults_ = initial_defaults_;
}

std::string CacheManager::info() const {
  const auto g = stats();
  std::ostringstream os;
  os << "namespaces:" << g.total_namespaces << "\n";
  os << "total_entries:" << g.total_entries << "\n";
  os << "total_memory_bytes:" << g.total_memory_bytes << "\n";
  for (const auto &[name, s] : g.namespaces) {
    os << "ns:" << name << ":keys=" << s.size << ",hits=" << s.hits
       << ",misses=" << s.misses << ",evictions=" << s.evictions
       << ",hit_rate=" << s.hit_rate << "\n";
  }
  return os.str();
}

std::string CacheManager::info(const std::string &ns) const {
  const auto *store = find(ns);
  return store != nullptr ? store->info() : std::string{};
}

CacheStore *CacheManager::find(const std::string &ns) {
  auto it = namespaces_.find(ns);
  return it == namespaces_.end() ? nullptr : &it->second;
}

const CacheStore *CacheManager::find(const std::string &ns) const {
  auto it = namespaces_.find(ns);
  return it == namespaces_.end() ? nullptr : &it->second;
}

} // namespace nscache
