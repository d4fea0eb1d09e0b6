#pragma once

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

#include "idkit/core/ulid.hpp"

namespace idkit::core {

// Set of Ulid<Tag>, ordered by creation time
template <typename Tag>
class UlidSet {
 public:
  using value_type = Ulid<Tag>;
  using const_iterator = typename std::set<Ulid<Tag>>::const_iterator;

  UlidSet() = default;

  static UlidSet singleton(Ulid<Tag> id) {
    UlidSet set;
    set.insert(std::move(id));
    return set;
  }

  static UlidSet fromList(const std::vector<Ulid<Tag>>& ids) {
    UlidSet set;
    set.ids_.insert(ids.begin(), ids.end());
    return set;
  }

  void insert(Ulid<Tag> id) { ids_.insert(std::move(id)); }
  void remove(const Ulid<Tag>& id) { ids_.erase(id); }
  bool member(const Ulid<Tag>& id) const { return ids_.contains(id); }

  std::size_t size() const noexcept { return ids_.size(); }
  bool isEmpty() const noexcept { return ids_.empty(); }

  template <typename Pred>
  UlidSet filter(Pred&& pred) const {
    UlidSet result;
    for (const auto& id : ids_) {
      if (pred(id)) {
        result.ids_.insert(id);
      }
    }
    return result;
  }

  std::vector<Ulid<Tag>> toList() const {
    return std::vector<Ulid<Tag>>(ids_.begin(), ids_.end());
  }

  const_iterator begin() const noexcept { return ids_.begin(); }
  const_iterator end() const noexcept { return ids_.end(); }

  bool operator==(const UlidSet& other) const { return ids_ == other.ids_; }
  bool operator!=(const UlidSet& other) const { return !(*this == other); }

  friend UlidSet unionOf(const UlidSet& a, const UlidSet& b) {
    UlidSet result = a;
    result.ids_.insert(b.ids_.begin(), b.ids_.end());
    return result;
  }

 private:
  std::set<Ulid<Tag>> ids_;
};

}  // namespace idkit::core
