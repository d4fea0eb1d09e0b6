#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "idkit/core/ulid.hpp"

namespace idkit::core {

// Dictionary keyed by Ulid<Tag>. ULIDs arrive already generated, so
// there is no allocation counter. Iteration follows ULID order, which is
// creation-time order.
template <typename Tag, typename V>
class UlidDict {
 public:
  using key_type = Ulid<Tag>;
  using mapped_type = V;
  using Entry = std::pair<Ulid<Tag>, V>;
  using const_iterator = typename std::map<Ulid<Tag>, V>::const_iterator;

  UlidDict() = default;

  static UlidDict singleton(Ulid<Tag> id, V value) {
    UlidDict dict;
    dict.insert(std::move(id), std::move(value));
    return dict;
  }

  // Later entries overwrite earlier ones with the same key
  static UlidDict fromList(const std::vector<Entry>& entries) {
    UlidDict dict;
    for (const auto& [id, value] : entries) {
      dict.insert(id, value);
    }
    return dict;
  }

  void insert(Ulid<Tag> id, V value) {
    entries_.insert_or_assign(std::move(id), std::move(value));
  }

  template <typename F>
  void update(const Ulid<Tag>& id, F&& fn) {
    std::optional<V> updated = std::forward<F>(fn)(get(id));
    if (updated) {
      insert(id, std::move(*updated));
    } else {
      remove(id);
    }
  }

  void remove(const Ulid<Tag>& id) { entries_.erase(id); }

  std::optional<V> get(const Ulid<Tag>& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool member(const Ulid<Tag>& id) const { return entries_.contains(id); }

  std::size_t size() const noexcept { return entries_.size(); }
  bool isEmpty() const noexcept { return entries_.empty(); }

  template <typename Pred>
  UlidDict filter(Pred&& pred) const {
    UlidDict result;
    for (const auto& [id, value] : entries_) {
      if (pred(id, value)) {
        result.entries_.emplace(id, value);
      }
    }
    return result;
  }

  std::vector<Ulid<Tag>> keys() const {
    std::vector<Ulid<Tag>> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
      result.push_back(entry.first);
    }
    return result;
  }

  std::vector<V> values() const {
    std::vector<V> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
      result.push_back(entry.second);
    }
    return result;
  }

  std::vector<Entry> toList() const {
    return std::vector<Entry>(entries_.begin(), entries_.end());
  }

  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool operator==(const UlidDict& other) const { return entries_ == other.entries_; }
  bool operator!=(const UlidDict& other) const { return !(*this == other); }

  // On a shared key the value from `b` wins
  friend UlidDict unionOf(const UlidDict& a, const UlidDict& b) {
    UlidDict result = a;
    for (const auto& [id, value] : b.entries_) {
      result.entries_.insert_or_assign(id, value);
    }
    return result;
  }

 private:
  std::map<Ulid<Tag>, V> entries_;
};

}  // namespace idkit::core
