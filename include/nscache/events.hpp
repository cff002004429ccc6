#pragma once

#include "nscache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace nscache {

enum class EventKind {
  Evicted,
  RefreshNeeded,
};

struct CacheEvent {
  EventKind kind{EventKind::Evicted};
  std::string ns;
  std::string key;
  TimePoint at{};
  // Last known state of the entry; only set for Evicted.
  std::optional<CacheEntry> entry;
};

// Bounded FIFO drained by callers. When full the oldest event is dropped.
// A capacity of zero disables the channel.
class EventChannel {
public:
  explicit EventChannel(std::size_t capacity) : capacity_(capacity) {}

  // Returns false if an older event had to be dropped to make room.
  bool push(CacheEvent event);
  std::vector<CacheEvent> drain();
  void clear();

  std::size_t size() const { return queue_.size(); }
  std::size_t capacity() const { return capacity_; }
  std::uint64_t dropped() const { return dropped_; }

private:
  std::size_t capacity_;
  std::deque<CacheEvent> queue_;
  std::uint64_t dropped_{0};
};

} // namespace nscache
