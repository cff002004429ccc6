#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nscache {

// Recency order over string keys. Nodes live in a dense slab linked by
// integer indices; freed slots are recycled. All operations are O(1)
// except keys() and clear().
class RecencyList {
public:
  using index_type = std::uint32_t;
  static constexpr index_type kNullIdx = std::numeric_limits<index_type>::max();

  // Inserts |key| as most recent, or moves it there if already tracked.
  void insert_front(const std::string &key);
  // Returns false if |key| is not tracked.
  bool move_to_front(const std::string &key);
  bool erase(const std::string &key);
  void clear();

  std::optional<std::string> least_recent() const;
  std::optional<std::string> most_recent() const;
  bool contains(const std::string &key) const { return index_.contains(key); }
  std::size_t size() const { return index_.size(); }
  bool empty() const { return index_.empty(); }

  // Most recent first.
  std::vector<std::string> keys() const;

private:
  struct Node {
    std::string key;
    index_type prev{kNullIdx};
    index_type next{kNullIdx};
  };

  index_type allocate(const std::string &key);
  void detach(index_type idx);
  void push_front(index_type idx);

  std::vector<Node> nodes_;
  std::vector<index_type> free_;
  std::unordered_map<std::string, index_type> index_;
  index_type head_{kNullIdx};
  index_type tail_{kNullIdx};
};

} // namespace nscache
