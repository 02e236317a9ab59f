#pragma once
#include "kl/ids/Id.hpp"

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace kl {

// Ordered set of callbacks with O(1) removal by id.
// Removing (including self-removal) from inside a callback is safe: the entry
// is marked dead and erased once the outermost notify() returns. Callbacks
// added during a notify() are first called by the next notify().
template <typename... Args>
class ListenerList {
public:
  using Callback = std::function<void(Args...)>;

  ListenerId add(Callback cb) {
    ListenerId id = nextId_++;
    entries_.push_back(Entry{id, std::move(cb), true});
    index_[id] = std::prev(entries_.end());
    return id;
  }

  bool remove(ListenerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    auto entry = it->second;
    index_.erase(it);
    if (depth_ > 0) {
      entry->alive = false;
      hasDead_ = true;
    } else {
      entries_.erase(entry);
    }
    return true;
  }

  void clear() {
    index_.clear();
    if (depth_ > 0) {
      for (auto& e : entries_) e.alive = false;
      hasDead_ = true;
    } else {
      entries_.clear();
    }
  }

  // A throwing callback propagates; the list stays consistent.
  void notify(Args... args) {
    struct DepthGuard {
      ListenerList& list;
      explicit DepthGuard(ListenerList& l) : list(l) { list.depth_++; }
      ~DepthGuard() {
        list.depth_--;
        if (list.depth_ == 0 && list.hasDead_) list.sweep();
      }
    };

    std::size_t count = entries_.size();
    DepthGuard guard(*this);
    auto it = entries_.begin();
    for (std::size_t i = 0; i < count && it != entries_.end(); i++, ++it) {
      if (it->alive) it->cb(args...);
    }
  }

  std::size_t size() const { return index_.size(); }
  // Stored entries, including removed ones awaiting the end of a notify().
  std::size_t storedEntries() const { return entries_.size(); }
  bool empty() const { return index_.empty(); }
  bool contains(ListenerId id) const { return index_.count(id) != 0; }

private:
  struct Entry {
    ListenerId id;
    Callback cb;
    bool alive;
  };

  void sweep() {
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (!it->alive) it = entries_.erase(it);
      else ++it;
    }
    hasDead_ = false;
  }

  std::list<Entry> entries_;
  std::unordered_map<ListenerId, typename std::list<Entry>::iterator> index_;
  ListenerId nextId_{1};
  int depth_{0};
  bool hasDead_{false};
};

} // namespace kl
