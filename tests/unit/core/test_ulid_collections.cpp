#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "idkit/core/ulid_dict.hpp"
#include "idkit/core/ulid_set.hpp"
#include "test_helpers.hpp"

using namespace idkit::core;
using namespace idkit::test;

namespace {

struct EventTag {};
using EventId = Ulid<EventTag>;
using Events = UlidDict<EventTag, std::string>;
using EventSet = UlidSet<EventTag>;

}  // namespace

class UlidCollectionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SequenceRandomSource rng({5, 12, 27});
    first_ = EventId::generate(std::uint64_t{1000}, rng);
    second_ = EventId::generate(std::uint64_t{2000}, rng);
    third_ = EventId::generate(std::uint64_t{3000}, rng);
  }

  EventId first_;
  EventId second_;
  EventId third_;
};

TEST_F(UlidCollectionsTest, DictIteratesInCreationOrder) {
  auto events = Events::fromList({{third_, "c"}, {first_, "a"}, {second_, "b"}});

  EXPECT_EQ(events.keys(), (std::vector<EventId>{first_, second_, third_}));
  EXPECT_EQ(events.values(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(UlidCollectionsTest, DictInsertGetRemove) {
  Events events;
  EXPECT_TRUE(events.isEmpty());
  EXPECT_FALSE(events.get(first_).has_value());

  events.insert(first_, "a");
  events.insert(first_, "A");
  EXPECT_EQ(events.size(), 1u);
  EXPECT_EQ(events.get(first_), std::optional<std::string>("A"));

  events.remove(first_);
  EXPECT_FALSE(events.member(first_));
}

TEST_F(UlidCollectionsTest, DictUpdate) {
  auto events = Events::singleton(first_, "a");
  events.update(first_, [](std::optional<std::string> v) -> std::optional<std::string> {
    return *v + "!";
  });
  EXPECT_EQ(events.get(first_), std::optional<std::string>("a!"));

  events.update(second_, [](std::optional<std::string> v) -> std::optional<std::string> {
    return v ? v : std::optional<std::string>("fresh");
  });
  EXPECT_EQ(events.get(second_), std::optional<std::string>("fresh"));

  events.update(first_, [](std::optional<std::string>) -> std::optional<std::string> {
    return std::nullopt;
  });
  EXPECT_FALSE(events.member(first_));
}

TEST_F(UlidCollectionsTest, DictFilterAndList) {
  auto events = Events::fromList({{first_, "keep"}, {second_, "drop"}, {third_, "keep"}});
  auto kept = events.filter([](const EventId&, const std::string& v) { return v == "keep"; });

  auto entries = kept.toList();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, first_);
  EXPECT_EQ(entries[1].first, third_);
}

TEST_F(UlidCollectionsTest, DictUnionIsRightBiased) {
  auto a = Events::fromList({{first_, "left"}, {second_, "b"}});
  auto b = Events::fromList({{first_, "right"}, {third_, "c"}});

  auto merged = unionOf(a, b);
  EXPECT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged.get(first_), std::optional<std::string>("right"));
  EXPECT_EQ(unionOf(merged, b), merged);
}

TEST_F(UlidCollectionsTest, SetOperations) {
  auto set = EventSet::fromList({second_, first_, second_});
  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(set.toList(), (std::vector<EventId>{first_, second_}));

  set.insert(third_);
  set.remove(first_);
  EXPECT_FALSE(set.member(first_));
  EXPECT_TRUE(set.member(third_));

  auto late = set.filter([](const EventId& id) { return id.timestampMs() >= 3000; });
  EXPECT_EQ(late, EventSet::singleton(third_));
}

TEST_F(UlidCollectionsTest, SetUnion) {
  auto a = EventSet::singleton(first_);
  auto b = EventSet::fromList({first_, third_});

  auto merged = unionOf(a, b);
  EXPECT_EQ(merged.toList(), (std::vector<EventId>{first_, third_}));
  EXPECT_EQ(unionOf(merged, b), merged);
  EXPECT_TRUE(EventSet{}.isEmpty());
}
