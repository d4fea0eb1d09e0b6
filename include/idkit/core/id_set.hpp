#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <set>
#include <vector>

#include "idkit/core/id.hpp"

namespace idkit::core {

// Set of Id<Tag> that allocates fresh identifiers; same counter rules as IdDict
template <typename Tag>
class IdSet {
 public:
  using value_type = Id<Tag>;
  using const_iterator = typename std::set<Id<Tag>>::const_iterator;

  IdSet() = default;

  static IdSet singleton(Id<Tag> id) {
    IdSet set;
    set.insert(id);
    return set;
  }

  static IdSet fromList(const std::vector<Id<Tag>>& ids) {
    IdSet set;
    for (const auto& id : ids) {
      set.insert(id);
    }
    return set;
  }

  // False for a negative `id`, which is not stored
  bool insert(Id<Tag> id) {
    if (id.value() < 0) {
      return false;
    }
    ids_.insert(id);
    highest_ = std::max(highest_, id.value());
    return true;
  }

  // Counter is left unchanged so `id` is never allocated again
  void remove(Id<Tag> id) { ids_.erase(id); }

  // Insert and return a never-used identifier; std::nullopt when exhausted
  std::optional<Id<Tag>> add() {
    auto id = nextId();
    if (id) {
      insert(*id);
    }
    return id;
  }

  bool member(Id<Tag> id) const { return ids_.contains(id); }

  std::size_t size() const noexcept { return ids_.size(); }
  bool isEmpty() const noexcept { return ids_.empty(); }

  template <typename Pred>
  IdSet filter(Pred&& pred) const {
    IdSet result;
    result.highest_ = highest_;
    for (const auto& id : ids_) {
      if (pred(id)) {
        result.ids_.insert(id);
      }
    }
    return result;
  }

  // Members in ascending order
  std::vector<Id<Tag>> toList() const {
    return std::vector<Id<Tag>>(ids_.begin(), ids_.end());
  }

  std::optional<Id<Tag>> highestId() const {
    if (ids_.empty()) {
      return std::nullopt;
    }
    return *ids_.rbegin();
  }

  std::optional<Id<Tag>> lowestId() const {
    if (ids_.empty()) {
      return std::nullopt;
    }
    return *ids_.begin();
  }

  // Largest identifier ever inserted, -1 if none
  typename Id<Tag>::value_type highestAllocated() const noexcept { return highest_; }

  std::optional<Id<Tag>> nextId() const noexcept {
    if (highest_ == std::numeric_limits<typename Id<Tag>::value_type>::max()) {
      return std::nullopt;
    }
    return Id<Tag>(highest_ + 1);
  }

  const_iterator begin() const noexcept { return ids_.begin(); }
  const_iterator end() const noexcept { return ids_.end(); }

  bool operator==(const IdSet& other) const {
    return highest_ == other.highest_ && ids_ == other.ids_;
  }
  bool operator!=(const IdSet& other) const { return !(*this == other); }

  friend IdSet unionOf(const IdSet& a, const IdSet& b) {
    IdSet result = a;
    result.ids_.insert(b.ids_.begin(), b.ids_.end());
    result.highest_ = std::max(a.highest_, b.highest_);
    return result;
  }

 private:
  std::set<Id<Tag>> ids_;
  typename Id<Tag>::value_type highest_ = -1;
};

}  // namespace idkit::core
