#include "nscache/recency_list.hpp"

#include <stdexcept>

namespace nscache {

void RecencyList::insert_front(const std::string &key) {
  if (move_to_front(key))
    return;
  const index_type idx = allocate(key);
  push_front(idx);
  index_.emplace(key, idx);
}

bool RecencyList::move_to_front(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return false;
  if (it->second != head_) {
    detach(it->second);
    push_front(it->second);
  }
  return true;
}

bool RecencyList::erase(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return false;
  const index_type idx = it->second;
  detach(idx);
  nodes_[idx].key.clear();
  free_.push_back(idx);
  index_.erase(it);
  return true;
}

void RecencyList::clear() {
  nodes_.clear();
  free_.clear();
  index_.clear();
  head_ = kNullIdx;
  tail_ = kNullIdx;
}

std::optional<std::string> RecencyList::least_recent() const {
  if (tail_ == kNullIdx)
    return std::nullopt;
  return nodes_[tail_].key;
}

std::optional<std::string> RecencyList::most_recent() const {
  if (head_ == kNullIdx)
    return std::nullopt;
  return nodes_[head_].key;
}

std::vector<std::string> RecencyList::keys() const {
  std::vector<std::string> out;
  out.reserve(index_.size());
  for (index_type idx = head_; idx != kNullIdx; idx = nodes_[idx].next)
    out.push_back(nodes_[idx].key);
  return out;
}

RecencyList::index_type RecencyList::allocate(const std::string &key) {
  if (!free_.empty()) {
    const index_type idx = free_.back();
    free_.pop_back();
    nodes_[idx] = Node{key, kNullIdx, kNullIdx};
    return idx;
  }
  if (nodes_.size() >= kNullIdx)
    throw std::length_error("recency list index space exhausted");
  nodes_.push_back(Node{key, kNullIdx, kNullIdx});
  return static_cast<index_type>(nodes_.size() - 1);
}

void RecencyList::detach(index_type idx) {
  auto &node = nodes_[idx];
  const index_type n = node.next;
  const index_type p = node.prev;

  if (n != kNullIdx)
    nodes_[n].prev = p;
  else
    tail_ = p;

  if (p != kNullIdx)
    nodes_[p].next = n;
  else
    head_ = n;

  node.next = kNullIdx;
  node.prev = kNullIdx;
}

void RecencyList::push_front(index_type idx) {
  auto &node = nodes_[idx];
  node.next = head_;
  node.prev = kNullIdx;
  if (head_ != kNullIdx)
    nodes_[head_].prev = idx;
  head_ = idx;
  if (tail_ == kNullIdx)
    tail_ = idx;
}

} // namespace nscache
