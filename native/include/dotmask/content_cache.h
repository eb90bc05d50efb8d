#ifndef DOTMASK_CONTENT_CACHE_H
#define DOTMASK_CONTENT_CACHE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dotmask {

// Fixed-capacity LRU map keyed by content fingerprint. O(1) average get/put/remove.
//
// Nodes live in a flat arena and link to each other by index. Slots 0 and 1 are the
// head and tail sentinels, so insert and unlink never branch on an empty list. Freed
// slots are reused before the arena grows.
template <typename V>
class ContentCache {
 public:
  explicit ContentCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
    nodes_.resize(2);
    nodes_[kHead].next = kTail;
    nodes_[kTail].prev = kHead;
    index_.reserve(capacity_);
  }

  std::optional<V> Get(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    unlink(it->second);
    link_front(it->second);
    return nodes_[it->second].value;
  }

  void Put(const std::string& key, V value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      nodes_[it->second].value = std::move(value);
      unlink(it->second);
      link_front(it->second);
      return;
    }
    uint32_t slot = allocate(key, std::move(value));
    link_front(slot);
    index_.emplace(key, slot);
    if (index_.size() > capacity_) evict(nodes_[kTail].prev);
  }

  bool Remove(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    uint32_t slot = it->second;
    index_.erase(it);
    unlink(slot);
    release(slot);
    return true;
  }

  bool Contains(const std::string& key) const { return index_.find(key) != index_.end(); }

  void Clear() {
    index_.clear();
    free_.clear();
    nodes_.resize(2);
    nodes_[kHead].next = kTail;
    nodes_[kTail].prev = kHead;
  }

  size_t size() const { return index_.size(); }
  size_t capacity() const { return capacity_; }

  // Most recently used first. Does not touch recency.
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (uint32_t i = nodes_[kHead].next; i != kTail; i = nodes_[i].next) fn(nodes_[i].key, nodes_[i].value);
  }

 private:
  static constexpr uint32_t kHead = 0;
  static constexpr uint32_t kTail = 1;

  struct Node {
    std::string key;
    V value{};
    uint32_t prev{kHead};
    uint32_t next{kTail};
  };

  uint32_t allocate(const std::string& key, V value) {
    uint32_t slot;
    if (!free_.empty()) {
      slot = free_.back();
      free_.pop_back();
    } else {
      slot = static_cast<uint32_t>(nodes_.size());
      nodes_.emplace_back();
    }
    nodes_[slot].key = key;
    nodes_[slot].value = std::move(value);
    return slot;
  }

  void release(uint32_t slot) {
    nodes_[slot].key.clear();
    nodes_[slot].value = V{};
    free_.push_back(slot);
  }

  void unlink(uint32_t slot) {
    Node& n = nodes_[slot];
    nodes_[n.prev].next = n.next;
    nodes_[n.next].prev = n.prev;
  }

  void link_front(uint32_t slot) {
    uint32_t first = nodes_[kHead].next;
    nodes_[slot].prev = kHead;
    nodes_[slot].next = first;
    nodes_[first].prev = slot;
    nodes_[kHead].next = slot;
  }

  void evict(uint32_t slot) {
    index_.erase(nodes_[slot].key);
    unlink(slot);
    release(slot);
  }

  size_t capacity_;
  std::vector<Node> nodes_;
  std::vector<uint32_t> free_;
  std::unordered_map<std::string, uint32_t> index_;
};

}  // namespace dotmask

#endif
