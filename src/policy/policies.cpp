#include "nscache/keys.hpp"
#include "nscache/policy.hpp"

#include <utility>

namespace nscache {
namespace {

// Entry with the smallest rank, skipping entries ranked nullopt. Ties go to
// the lowest sequence, i.e. the first inserted.
template <typename Rank>
std::optional<std::string> min_by(const EntryTable &entries, Rank rank) {
  const EntryTable::value_type *best = nullptr;
  decltype(rank(std::declval<const CacheEntry &>())) best_rank;
  for (const auto &item : entries) {
    auto r = rank(item.second);
    if (!r.has_value())
      continue;
    if (best == nullptr || *r < *best_rank ||
        (*r == *best_rank && item.second.sequence < best->second.sequence)) {
      best = &item;
      best_rank = r;
    }
  }
  if (best == nullptr)
    return std::nullopt;
  return best->first;
}

} // namespace

// LRU

bool LruStrategy::on_access(const CacheEntry &entry, TimePoint) {
  recency_.move_to_front(entry.key);
  return false;
}

void LruStrategy::on_set(const CacheEntry &entry) {
  recency_.insert_front(entry.key);
}

void LruStrategy::on_erase(const std::string &key) { recency_.erase(key); }

bool LruStrategy::should_evict(const CacheEntry &entry,
                               const NamespaceConfig &, TimePoint now) const {
  return is_expired(entry, now);
}

std::optional<std::string>
LruStrategy::select_eviction_candidate(const EntryTable &,
                                       const NamespaceConfig &,
                                       TimePoint) const {
  return recency_.least_recent();
}

void LruStrategy::clear() { recency_.clear(); }

// TTL

bool TtlStrategy::on_access(const CacheEntry &, TimePoint) { return false; }

void TtlStrategy::on_set(const CacheEntry &) {}

void TtlStrategy::on_erase(const std::string &) {}

bool TtlStrategy::should_evict(const CacheEntry &entry,
                               const NamespaceConfig &, TimePoint now) const {
  return is_expired(entry, now);
}

std::optional<std::string>
TtlStrategy::select_eviction_candidate(const EntryTable &entries,
                                       const NamespaceConfig &,
                                       TimePoint) const {
  auto by_expiry = min_by(entries, [](const CacheEntry &e) {
    return e.expires_at;
  });
  if (by_expiry.has_value())
    return by_expiry;
  return min_by(entries, [](const CacheEntry &e) {
    return std::optional<TimePoint>(e.created_at);
  });
}

void TtlStrategy::clear() {}

// SWR

bool SwrStrategy::on_access(const CacheEntry &entry, TimePoint now) {
  recency_.move_to_front(entry.key);
  return is_expired(entry, now);
}

void SwrStrategy::on_set(const CacheEntry &entry) {
  recency_.insert_front(entry.key);
}

void SwrStrategy::on_erase(const std::string &key) { recency_.erase(key); }

bool SwrStrategy::should_evict(const CacheEntry &, const NamespaceConfig &,
                               TimePoint) const {
  return false;
}

std::optional<std::string>
SwrStrategy::select_eviction_candidate(const EntryTable &entries,
                                       const NamespaceConfig &,
                                       TimePoint now) const {
  const TimePoint threshold = now - very_stale_after_;
  auto very_stale = min_by(entries, [threshold](const CacheEntry &e) {
    std::optional<std::uint64_t> rank;
    if (e.expires_at.has_value() && *e.expires_at < threshold)
      rank = 0;
    return rank;
  });
  if (very_stale.has_value())
    return very_stale;
  return recency_.least_recent();
}

void SwrStrategy::clear() { recency_.clear(); }

// Dispatch

std::string EvictionStrategy::name() const {
  return std::visit([](const auto &s) { return s.name(); }, impl_);
}

bool EvictionStrategy::on_access(const CacheEntry &entry, TimePoint now) {
  return std::visit([&](auto &s) { return s.on_access(entry, now); }, impl_);
}

void EvictionStrategy::on_set(const CacheEntry &entry) {
  std::visit([&](auto &s) { s.on_set(entry); }, impl_);
}

void EvictionStrategy::on_erase(const std::string &key) {
  std::visit([&](auto &s) { s.on_erase(key); }, impl_);
}

bool EvictionStrategy::should_evict(const CacheEntry &entry,
                                    const NamespaceConfig &cfg,
                                    TimePoint now) const {
  return std::visit(
      [&](const auto &s) { return s.should_evict(entry, cfg, now); }, impl_);
}

std::optional<std::string>
EvictionStrategy::select_eviction_candidate(const EntryTable &entries,
                                            const NamespaceConfig &cfg,
                                            TimePoint now) const {
  return std::visit(
      [&](const auto &s) {
        return s.select_eviction_candidate(entries, cfg, now);
      },
      impl_);
}

void EvictionStrategy::clear() {
  std::visit([](auto &s) { s.clear(); }, impl_);
}

EvictionStrategy EvictionStrategy::fresh() const {
  EvictionStrategy copy = *this;
  copy.clear();
  return copy;
}

std::optional<EvictionStrategy> make_strategy_by_name(const std::string &name) {
  if (name == LruStrategy::kName)
    return EvictionStrategy(LruStrategy{});
  if (name == TtlStrategy::kName)
    return EvictionStrategy(TtlStrategy{});
  if (name == SwrStrategy::kName)
    return EvictionStrategy(SwrStrategy{});
  return std::nullopt;
}

} // namespace nscache
