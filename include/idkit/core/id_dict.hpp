#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "idkit/core/id.hpp"

namespace idkit::core {

// Dictionary keyed by Id<Tag> that allocates fresh identifiers.
//
// Besides its entries the dictionary remembers the highest identifier it
// has ever held. Removing an entry never lowers that counter, so add()
// never hands out an identifier that was present at any earlier point.
// An empty dictionary starts the counter at -1 and allocates 0 first.
// Negative identifiers are never stored. Once the identifier with the
// largest representable value has been held, add() allocates nothing.
template <typename Tag, typename V>
class IdDict {
 public:
  using key_type = Id<Tag>;
  using mapped_type = V;
  using Entry = std::pair<Id<Tag>, V>;
  using const_iterator = typename std::map<Id<Tag>, V>::const_iterator;

  IdDict() = default;

  static IdDict singleton(Id<Tag> id, V value) {
    IdDict dict;
    dict.insert(id, std::move(value));
    return dict;
  }

  // Later entries overwrite earlier ones with the same key
  static IdDict fromList(const std::vector<Entry>& entries) {
    IdDict dict;
    for (const auto& [id, value] : entries) {
      dict.insert(id, value);
    }
    return dict;
  }

  // Insert or replace; raises the counter to `id` when larger.
  // Returns false, leaving the dictionary unchanged, for a negative `id`.
  bool insert(Id<Tag> id, V value) {
    if (id.value() < 0) {
      return false;
    }
    entries_.insert_or_assign(id, std::move(value));
    highest_ = std::max(highest_, id.value());
    return true;
  }

  // Apply `fn` to the current value (std::nullopt when absent). A returned
  // value is inserted, std::nullopt removes the entry.
  template <typename F>
  void update(Id<Tag> id, F&& fn) {
    std::optional<V> updated = std::forward<F>(fn)(get(id));
    if (updated) {
      insert(id, std::move(*updated));
    } else {
      remove(id);
    }
  }

  // Counter is left unchanged so `id` is never allocated again
  void remove(Id<Tag> id) { entries_.erase(id); }

  // Insert `value` under a never-used identifier and return that identifier;
  // std::nullopt once every identifier has been used
  std::optional<Id<Tag>> add(V value) {
    auto id = nextId();
    if (id) {
      insert(*id, std::move(value));
    }
    return id;
  }

  std::optional<V> get(Id<Tag> id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool member(Id<Tag> id) const { return entries_.contains(id); }

  std::size_t size() const noexcept { return entries_.size(); }
  bool isEmpty() const noexcept { return entries_.empty(); }

  // Entries for which `pred(id, value)` holds; the counter is kept
  template <typename Pred>
  IdDict filter(Pred&& pred) const {
    IdDict result;
    result.highest_ = highest_;
    for (const auto& [id, value] : entries_) {
      if (pred(id, value)) {
        result.entries_.emplace(id, value);
      }
    }
    return result;
  }

  // Transform every value with `fn(id, value)`; the counter is kept
  template <typename F>
  auto map(F&& fn) const -> IdDict<Tag, std::invoke_result_t<F&, Id<Tag>, const V&>> {
    IdDict<Tag, std::invoke_result_t<F&, Id<Tag>, const V&>> result;
    result.highest_ = highest_;
    for (const auto& [id, value] : entries_) {
      result.entries_.emplace(id, fn(id, value));
    }
    return result;
  }

  // Keys in ascending order
  std::vector<Id<Tag>> keys() const {
    std::vector<Id<Tag>> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
      result.push_back(entry.first);
    }
    return result;
  }

  // Values in ascending key order
  std::vector<V> values() const {
    std::vector<V> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
      result.push_back(entry.second);
    }
    return result;
  }

  // Entries in ascending key order
  std::vector<Entry> toList() const {
    return std::vector<Entry>(entries_.begin(), entries_.end());
  }

  // Entry with the largest key currently present
  std::optional<Entry> highestId() const {
    if (entries_.empty()) {
      return std::nullopt;
    }
    return *entries_.rbegin();
  }

  // Entry with the smallest key currently present
  std::optional<Entry> lowestId() const {
    if (entries_.empty()) {
      return std::nullopt;
    }
    return *entries_.begin();
  }

  // Largest identifier ever inserted, -1 if none
  typename Id<Tag>::value_type highestAllocated() const noexcept { return highest_; }

  // Identifier the next add() will return
  std::optional<Id<Tag>> nextId() const noexcept {
    if (highest_ == std::numeric_limits<typename Id<Tag>::value_type>::max()) {
      return std::nullopt;
    }
    return Id<Tag>(highest_ + 1);
  }

  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool operator==(const IdDict& other) const {
    return highest_ == other.highest_ && entries_ == other.entries_;
  }
  bool operator!=(const IdDict& other) const { return !(*this == other); }

  // Keys of both; on a shared key the value from `b` wins. The counter
  // is the larger of the two.
  friend IdDict unionOf(const IdDict& a, const IdDict& b) {
    IdDict result = a;
    for (const auto& [id, value] : b.entries_) {
      result.entries_.insert_or_assign(id, value);
    }
    result.highest_ = std::max(a.highest_, b.highest_);
    return result;
  }

 private:
  template <typename, typename>
  friend class IdDict;

  std::map<Id<Tag>, V> entries_;
  typename Id<Tag>::value_type highest_ = -1;
};

}  // namespace idkit::core
