#include "nscache/events.hpp"

#include <iterator>

namespace nscache {

bool EventChannel::push(CacheEvent event) {
  if (capacity_ == 0)
    return true;
  bool kept_all = true;
  while (queue_.size() >= capacity_) {
    queue_.pop_front();
    ++dropped_;
    kept_all = false;
  }
  queue_.push_back(std::move(event));
  return kept_all;
}

std::vector<CacheEvent> EventChannel::drain() {
  std::vector<CacheEvent> out(std::make_move_iterator(queue_.begin()),
                              std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

void EventChannel::clear() {
  queue_.clear();
  dropped_ = 0;
}

} // namespace nscache
