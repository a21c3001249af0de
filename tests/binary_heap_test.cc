// tests/binary_heap_test.cc
#include "path_tools/binary_heap.hh"

#include <algorithm>
#include <cmath>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace path_tools {
namespace {

// Every element compares >= its parent
template <typename T, typename Compare>
::testing::AssertionResult HeapOrdered(const BinaryHeap<T, Compare> &heap,
                                       Compare comp = Compare()) {
  auto elements = heap.Snapshot();
  for (size_t i = 1; i < elements.size(); ++i) {
    size_t parent = (i - 1) / 2;
    if (comp(elements[i], elements[parent])) {
      return ::testing::AssertionFailure()
             << "slot " << i << " is less than its parent slot " << parent;
    }
  }
  return ::testing::AssertionSuccess();
}

// Element type with only a value constructor
struct Ticket {
  explicit Ticket(int number) : number(number) {}
  bool operator<(const Ticket &other) const { return number < other.number; }
  int number;
};

class BinaryHeapTest : public ::testing::Test {
protected:
  BinaryHeap<int> heap_;
};

TEST_F(BinaryHeapTest, EmptyQueue) {
  EXPECT_TRUE(heap_.empty());
  EXPECT_EQ(heap_.size(), 0u);
  EXPECT_FALSE(heap_.ExtractMin().has_value());
  EXPECT_FALSE(heap_.PeekMin().has_value());
}

TEST_F(BinaryHeapTest, SingleElement) {
  heap_.Insert(5);
  EXPECT_FALSE(heap_.empty());
  EXPECT_EQ(heap_.size(), 1u);
  EXPECT_EQ(heap_.PeekMin(), 5);
  EXPECT_EQ(heap_.ExtractMin(), 5);
  EXPECT_TRUE(heap_.empty());
  EXPECT_FALSE(heap_.ExtractMin().has_value());
}

TEST_F(BinaryHeapTest, MinHeapOrder) {
  for (int value : {5, 3, 7, 1, 9}) {
    heap_.Insert(value);
  }
  EXPECT_EQ(heap_.ExtractMin(), 1);
  EXPECT_EQ(heap_.ExtractMin(), 3);
  EXPECT_EQ(heap_.ExtractMin(), 5);
  EXPECT_EQ(heap_.ExtractMin(), 7);
  EXPECT_EQ(heap_.ExtractMin(), 9);
  EXPECT_TRUE(heap_.empty());
}

TEST_F(BinaryHeapTest, PeekDoesNotRemove) {
  heap_.Insert(10);
  EXPECT_EQ(heap_.PeekMin(), 10);
  EXPECT_EQ(heap_.size(), 1u);
  EXPECT_EQ(heap_.PeekMin(), 10);
  EXPECT_EQ(heap_.size(), 1u);
}

TEST_F(BinaryHeapTest, InsertAfterExtract) {
  heap_.Insert(5);
  heap_.Insert(3);
  heap_.ExtractMin();
  EXPECT_EQ(heap_.size(), 1u);
  heap_.Insert(1);
  EXPECT_EQ(heap_.ExtractMin(), 1);
  EXPECT_EQ(heap_.ExtractMin(), 5);
}

TEST_F(BinaryHeapTest, DuplicateElements) {
  for (int value : {5, 5, 3, 3}) {
    heap_.Insert(value);
  }
  EXPECT_EQ(heap_.ExtractMin(), 3);
  EXPECT_EQ(heap_.ExtractMin(), 3);
  EXPECT_EQ(heap_.ExtractMin(), 5);
  EXPECT_EQ(heap_.ExtractMin(), 5);
}

TEST_F(BinaryHeapTest, NegativeNumbers) {
  for (int value : {-5, -10, 0, 5}) {
    heap_.Insert(value);
  }
  EXPECT_EQ(heap_.ExtractMin(), -10);
  EXPECT_EQ(heap_.ExtractMin(), -5);
  EXPECT_EQ(heap_.ExtractMin(), 0);
  EXPECT_EQ(heap_.ExtractMin(), 5);
}

TEST_F(BinaryHeapTest, LargeQuantities) {
  for (int i = 1000; i > 0; i--) {
    heap_.Insert(i);
  }
  EXPECT_EQ(heap_.size(), 1000u);
  for (int i = 1; i <= 1000; i++) {
    ASSERT_EQ(heap_.ExtractMin(), i);
  }
  EXPECT_TRUE(heap_.empty());
}

TEST_F(BinaryHeapTest, ShuffledRoundTripIsSorted) {
  std::mt19937_64 rng(7);
  std::uniform_int_distribution<int> dist(-500, 500);
  std::vector<int> values(1000);
  for (auto &value : values) {
    value = dist(rng); // plenty of duplicates
  }
  for (int value : values) {
    heap_.Insert(value);
  }

  std::vector<int> extracted;
  while (auto value = heap_.ExtractMin()) {
    extracted.push_back(*value);
  }

  std::sort(values.begin(), values.end());
  EXPECT_EQ(extracted, values);
}

TEST_F(BinaryHeapTest, HeapOrderHoldsThroughMixedOperations) {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int> value_dist(0, 100);
  std::bernoulli_distribution extract(0.35);

  for (int step = 0; step < 2000; ++step) {
    if (extract(rng)) {
      heap_.ExtractMin();
    } else {
      heap_.Insert(value_dist(rng));
    }
    ASSERT_TRUE(HeapOrdered(heap_)) << "after step " << step;
  }
}

TEST_F(BinaryHeapTest, ExtractionsAreNonDecreasing) {
  std::mt19937_64 rng(3);
  std::uniform_int_distribution<int> dist(0, 50);
  for (int i = 0; i < 300; ++i) {
    heap_.Insert(dist(rng));
  }
  int previous = *heap_.ExtractMin();
  while (auto value = heap_.ExtractMin()) {
    EXPECT_LE(previous, *value);
    previous = *value;
  }
}

TEST_F(BinaryHeapTest, CapacityDoublesWhenFull) {
  BinaryHeap<int> heap(4);
  EXPECT_EQ(heap.capacity(), 4u);
  for (int i = 0; i < 4; ++i) {
    heap.Insert(i);
  }
  EXPECT_EQ(heap.capacity(), 4u);
  heap.Insert(4);
  EXPECT_EQ(heap.capacity(), 8u);
  for (int i = 5; i < 9; ++i) {
    heap.Insert(i);
  }
  EXPECT_EQ(heap.capacity(), 16u);
  EXPECT_EQ(heap.size(), 9u);
}

TEST_F(BinaryHeapTest, ResizePastDefaultCapacity) {
  for (int i = 0; i < 100; i++) {
    heap_.Insert(i);
  }
  EXPECT_EQ(heap_.size(), 100u);
  EXPECT_GE(heap_.capacity(), 100u);
  for (int i = 0; i < 100; i++) {
    ASSERT_EQ(heap_.ExtractMin(), i);
  }
}

TEST_F(BinaryHeapTest, RejectsZeroCapacity) {
  EXPECT_THROW(BinaryHeap<int>(0), std::invalid_argument);
}

TEST_F(BinaryHeapTest, Clear) {
  heap_.Insert(1);
  heap_.Insert(2);
  heap_.Insert(3);
  EXPECT_EQ(heap_.size(), 3u);

  heap_.Clear();
  EXPECT_EQ(heap_.size(), 0u);
  EXPECT_TRUE(heap_.empty());
  EXPECT_FALSE(heap_.PeekMin().has_value());

  heap_.Insert(8);
  EXPECT_EQ(heap_.ExtractMin(), 8);
}

TEST_F(BinaryHeapTest, ClearReleasesElements) {
  auto shared = std::make_shared<int>(1);
  BinaryHeap<std::shared_ptr<int>> heap;
  heap.Insert(shared);
  heap.Insert(shared);
  EXPECT_EQ(shared.use_count(), 3);
  heap.Clear();
  EXPECT_EQ(shared.use_count(), 1);
}

TEST_F(BinaryHeapTest, ExtractReleasesVacatedSlot) {
  auto shared = std::make_shared<int>(1);
  BinaryHeap<std::shared_ptr<int>> heap;
  heap.Insert(shared);
  heap.ExtractMin();
  EXPECT_EQ(shared.use_count(), 1);
}

TEST_F(BinaryHeapTest, RejectsNullPointers) {
  int value = 3;
  BinaryHeap<int *> heap;
  EXPECT_THROW(heap.Insert(nullptr), std::invalid_argument);
  EXPECT_TRUE(heap.empty());
  heap.Insert(&value);
  EXPECT_EQ(heap.size(), 1u);
}

TEST_F(BinaryHeapTest, RejectsNaN) {
  BinaryHeap<double> heap;
  EXPECT_THROW(heap.Insert(std::nan("")), std::invalid_argument);
  EXPECT_TRUE(heap.empty());
}

TEST_F(BinaryHeapTest, StringElements) {
  BinaryHeap<std::string> heap;
  heap.Insert("zebra");
  heap.Insert("apple");
  heap.Insert("banana");
  EXPECT_EQ(heap.ExtractMin(), "apple");
  EXPECT_EQ(heap.ExtractMin(), "banana");
  EXPECT_EQ(heap.ExtractMin(), "zebra");
}

TEST_F(BinaryHeapTest, DoubleValues) {
  BinaryHeap<double> heap;
  for (double value : {3.5, 1.1, 2.2, 1.1}) {
    heap.Insert(value);
  }
  EXPECT_DOUBLE_EQ(*heap.ExtractMin(), 1.1);
  EXPECT_DOUBLE_EQ(*heap.ExtractMin(), 1.1);
  EXPECT_DOUBLE_EQ(*heap.ExtractMin(), 2.2);
  EXPECT_DOUBLE_EQ(*heap.ExtractMin(), 3.5);
}

TEST_F(BinaryHeapTest, CustomComparatorMakesMaxHeap) {
  BinaryHeap<int, std::greater<int>> heap;
  for (int value : {5, 3, 7, 1, 9}) {
    heap.Insert(value);
  }
  EXPECT_TRUE(HeapOrdered(heap));
  EXPECT_EQ(heap.ExtractMin(), 9);
  EXPECT_EQ(heap.ExtractMin(), 7);
  EXPECT_EQ(heap.PeekMin(), 5);
}

TEST_F(BinaryHeapTest, StatefulComparator) {
  // Orders indices by a lookup table
  std::vector<int> priority{30, 10, 20};
  auto by_priority = [&priority](int a, int b) {
    return priority[static_cast<size_t>(a)] < priority[static_cast<size_t>(b)];
  };
  BinaryHeap<int, decltype(by_priority)> heap(2, by_priority);
  heap.Insert(0);
  heap.Insert(1);
  heap.Insert(2);
  EXPECT_EQ(heap.ExtractMin(), 1);
  EXPECT_EQ(heap.ExtractMin(), 2);
  EXPECT_EQ(heap.ExtractMin(), 0);
}

TEST_F(BinaryHeapTest, ElementsNeedNoDefaultConstructor) {
  static_assert(!std::is_default_constructible_v<Ticket>);
  BinaryHeap<Ticket> heap(2);
  for (int number : {4, 2, 8, 6, 1}) {
    heap.Insert(Ticket(number));
  }
  EXPECT_EQ(heap.capacity(), 8u);
  EXPECT_TRUE(HeapOrdered(heap));
  EXPECT_EQ(heap.PeekMin()->number, 1);
  EXPECT_EQ(heap.ExtractMin()->number, 1);
  EXPECT_EQ(heap.ExtractMin()->number, 2);

  heap.Clear();
  EXPECT_TRUE(heap.empty());
  heap.Insert(Ticket(3));
  EXPECT_EQ(heap.ExtractMin()->number, 3);
  EXPECT_FALSE(heap.ExtractMin().has_value());
}

TEST_F(BinaryHeapTest, Rendering) {
  std::stringstream empty;
  empty << heap_;
  EXPECT_EQ(empty.str(), "[]");

  heap_.Insert(2);
  heap_.Insert(1);
  std::stringstream ss;
  ss << heap_;
  EXPECT_EQ(ss.str(), "[1, 2]");
}

} // namespace
} // namespace path_tools

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
