#include "nscache/store.hpp"

#include "nscache/keys.hpp"
#include "nscache/logger.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace nscache {

CacheStore::CacheStore(std::string ns, NamespaceConfig cfg,
                       EvictionStrategy strategy)
    : name_(std::move(ns)), cfg_(std::move(cfg)),
      strategy_(std::move(strategy)), events_(cfg_.event_capacity) {}

std::optional<std::any> CacheStore::get(const std::string &key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    bump(counters_.misses);
    return std::nullopt;
  }

  const auto now = Clock::now();
  if (strategy_.should_evict(it->second, cfg_, now)) {
    NSCACHE_TRACE("nscache: {}/{} expired on read", name_, key);
    erase_internal(key, false, true);
    bump(counters_.misses);
    return std::nullopt;
  }

  auto &e = it->second;
  e.accessed_at = now;
  ++e.access_count;
  bump(counters_.hits);
  const bool stale = strategy_.on_access(e, now);
  std::any out = e.value;
  if (stale)
    notify(EventKind::RefreshNeeded, e, now);
  return out;
}

void CacheStore::set(const std::string &key, std::any value,
                     std::size_t approx_size, const SetOptions &opts) {
  const auto now = Clock::now();

  CacheEntry candidate;
  candidate.value = std::move(value);
  candidate.key = key;
  candidate.ns = name_;
  candidate.created_at = now;
  candidate.accessed_at = now;
  candidate.expires_at = calculate_expiry(opts.ttl_ms, cfg_.default_ttl_ms, now);
  candidate.access_count = 0;
  candidate.approx_size_bytes = approx_size;
  candidate.sequence = ++seq_;
  candidate.tags = opts.metadata;

  std::optional<CacheEntry> evicted;
  if (entries_.contains(key)) {
    erase_internal(key, false, false);
  } else if (entries_.size() >= cfg_.max_entries) {
    evicted = evict_one(now);
    if (!evicted.has_value())
      NSCACHE_WARN("nscache: namespace {} has no eviction candidate, growing "
                   "past max_entries={}",
                   name_, cfg_.max_entries);
  }

  auto [it, inserted] = entries_.emplace(key, std::move(candidate));
  memory_used_ += it->second.approx_size_bytes;
  strategy_.on_set(it->second);
  bump(counters_.sets);

  if (evicted.has_value())
    notify(EventKind::Evicted, *evicted, now);
}

bool CacheStore::del(const std::string &key) {
  if (!entries_.contains(key))
    return false;
  erase_internal(key, false, false);
  bump(counters_.deletes);
  return true;
}

void CacheStore::clear() {
  entries_.clear();
  strategy_.clear();
  events_.clear();
  counters_ = StoreCounters{};
  memory_used_ = 0;
}

std::size_t CacheStore::cleanup() {
  const auto now = Clock::now();
  std::vector<std::string> dead;
  for (const auto &[k, e] : entries_) {
    if (strategy_.should_evict(e, cfg_, now))
      dead.push_back(k);
  }
  for (const auto &k : dead)
    erase_internal(k, false, true);
  if (!dead.empty())
    NSCACHE_DEBUG("nscache: cleanup removed {} entries from {}", dead.size(),
                  name_);
  return dead.size();
}

NamespaceStats CacheStore::stats() const {
  NamespaceStats s;
  s.hits = counters_.hits;
  s.misses = counters_.misses;
  s.sets = counters_.sets;
  s.deletes = counters_.deletes;
  s.evictions = counters_.evictions;
  s.expirations = counters_.expirations;
  s.hook_failures = counters_.hook_failures;
  s.events_dropped = events_.dropped();
  s.size = entries_.size();
  s.memory_bytes = memory_used_;

  const auto lookups = s.hits + s.misses;
  s.hit_rate = lookups > 0 ? static_cast<double>(s.hits) /
                                 static_cast<double>(lookups)
                           : 0.0;

  std::uint64_t total_access = 0;
  for (const auto &[k, e] : entries_) {
    total_access += e.access_count;
    if (!s.oldest_entry || e.created_at < *s.oldest_entry)
      s.oldest_entry = e.created_at;
    if (!s.newest_entry || e.created_at > *s.newest_entry)
      s.newest_entry = e.created_at;
  }
  s.avg_access_count = entries_.empty()
                           ? 0.0
                           : static_cast<double>(total_access) /
                                 static_cast<double>(entries_.size());
  return s;
}

std::string CacheStore::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "namespace:" << name_ << "\n";
  os << "strategy:" << strategy_.name() << "\n";
  os << "max_entries:" << cfg_.max_entries << "\n";
  os << "keys:" << s.size << "\n";
  os << "memory_bytes:" << s.memory_bytes << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "sets:" << s.sets << "\n";
  os << "deletes:" << s.deletes << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "hook_failures:" << s.hook_failures << "\n";
  os << "events_dropped:" << s.events_dropped << "\n";
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "avg_access_count:" << s.avg_access_count << "\n";

  std::vector<std::pair<std::string, std::uint64_t>> counts;
  counts.reserve(entries_.size());
  for (const auto &[k, e] : entries_)
    counts.emplace_back(k, e.access_count);
  std::sort(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
    if (a.second == b.second)
      return a.first < b.first;
    return a.second > b.second;
  });
  os << "topk_hits:";
  for (std::size_t i = 0; i < std::min<std::size_t>(5, counts.size()); ++i) {
    if (i)
      os << ",";
    os << counts[i].first << ":" << counts[i].second;
  }
  os << "\n";
  return os.str();
}

const CacheEntry *CacheStore::peek(const std::string &key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

bool CacheStore::is_stale(const std::string &key) const {
  const auto *e = peek(key);
  return e != nullptr && is_expired(*e);
}

void CacheStore::erase_internal(const std::string &key, bool eviction,
                                bool expiration) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  memory_used_ -= it->second.approx_size_bytes;
  entries_.erase(it);
  strategy_.on_erase(key);
  if (eviction)
    bump(counters_.evictions);
  if (expiration)
    bump(counters_.expirations);
}

std::optional<CacheEntry> CacheStore::evict_one(TimePoint now) {
  auto victim = strategy_.select_eviction_candidate(entries_, cfg_, now);
  if (!victim.has_value())
    return std::nullopt;
  auto node = entries_.extract(*victim);
  if (node.empty()) {
    NSCACHE_WARN("nscache: eviction candidate {} is not in namespace {}",
                 *victim, name_);
    strategy_.on_erase(*victim);
    return std::nullopt;
  }
  memory_used_ -= node.mapped().approx_size_bytes;
  strategy_.on_erase(*victim);
  bump(counters_.evictions);
  NSCACHE_TRACE("nscache: evicted {}/{}", name_, *victim);
  return std::move(node.mapped());
}

void CacheStore::notify(EventKind kind, const CacheEntry &entry,
                        TimePoint now) {
  CacheEvent event;
  event.kind = kind;
  event.ns = name_;
  event.key = entry.key;
  event.at = now;
  if (kind == EventKind::Evicted)
    event.entry = entry;
  events_.push(std::move(event));

  const EntryHook &hook =
      kind == EventKind::Evicted ? cfg_.on_evict : cfg_.on_stale;
  if (!hook)
    return;
  // The hook sees a copy so it may call back into the store.
  const CacheEntry snapshot = entry;
  try {
    hook(snapshot);
  } catch (const std::exception &ex) {
    bump(counters_.hook_failures);
    NSCACHE_WARN("nscache: {} hook failed for {}/{}: {}",
                 kind == EventKind::Evicted ? "on_evict" : "on_stale", name_,
                 snapshot.key, ex.what());
  } catch (...) {
    bump(counters_.hook_failures);
    NSCACHE_WARN("nscache: {} hook failed for {}/{} with a non-standard "
                 "exception",
                 kind == EventKind::Evicted ? "on_evict" : "on_stale", name_,
                 snapshot.key);
  }
}

} // namespace nscache
