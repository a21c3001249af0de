#ifndef __PATH_TOOLS_BINARY_HEAP_HH__
#define __PATH_TOOLS_BINARY_HEAP_HH__

#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace path_tools {

// Array-backed binary min-heap ordered by Compare.
//
// Slot i holds a child of slot (i - 1) / 2 and never compares less than it.
// The slot count (capacity) is tracked apart from the element count and
// doubles when an insertion finds it full. Unused slots are empty, so T needs
// no default constructor. Equal elements leave in no particular order.
template <typename T, typename Compare = std::less<T>> class BinaryHeap {
public:
  static constexpr size_t kDefaultCapacity = 16;

  explicit BinaryHeap(size_t initial_capacity = kDefaultCapacity,
                      const Compare &comp = Compare())
      : comp_(comp) {
    if (initial_capacity == 0) {
      throw std::invalid_argument("Heap capacity must be positive");
    }
    heap_.resize(initial_capacity);
  }

  // Amortized O(log n). Throws std::invalid_argument for null pointers and
  // NaNs, which have no place in a total order.
  void Insert(T element) {
    if (!IsOrderable(element)) {
      throw std::invalid_argument("Cannot insert an unordered element");
    }
    if (size_ == heap_.size()) {
      Grow();
    }
    heap_[size_].emplace(std::move(element));
    SiftUp(size_);
    size_++;
  }

  // Removes and returns the minimum, std::nullopt when empty.
  std::optional<T> ExtractMin() {
    if (size_ == 0) {
      return std::nullopt;
    }
    T min = std::move(*heap_[0]);

    // Move last element to root
    size_--;
    if (size_ > 0) {
      heap_[0] = std::move(heap_[size_]);
    }
    heap_[size_].reset();

    if (size_ > 0) {
      SiftDown(0);
    }
    return min;
  }

  std::optional<T> PeekMin() const {
    if (size_ == 0) {
      return std::nullopt;
    }
    return *heap_[0];
  }

  bool empty() const { return size_ == 0; }
  size_t size() const { return size_; }
  size_t capacity() const { return heap_.size(); }

  // Resets the occupied slots so no element outlives the call.
  void Clear() {
    for (size_t i = 0; i < size_; ++i) {
      heap_[i].reset();
    }
    size_ = 0;
  }

  // For testing/verification: elements in array (heap) order
  std::vector<T> Snapshot() const {
    std::vector<T> elements;
    elements.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
      elements.push_back(*heap_[i]);
    }
    return elements;
  }

  friend std::ostream &operator<<(std::ostream &os, const BinaryHeap &heap) {
    os << "[";
    for (size_t i = 0; i < heap.size_; ++i) {
      if (i > 0) {
        os << ", ";
      }
      os << *heap.heap_[i];
    }
    return os << "]";
  }

private:
  static bool IsOrderable(const T &element) {
    if constexpr (std::is_floating_point_v<T>) {
      return !std::isnan(element);
    } else if constexpr (std::is_pointer_v<T>) {
      return element != nullptr;
    } else {
      (void)element;
      return true;
    }
  }

  void Grow() { heap_.resize(heap_.size() * 2); }

  // Moves the element at index towards the root until its parent is not
  // greater. Used after insertion.
  void SiftUp(size_t index) {
    std::optional<T> element = std::move(heap_[index]);
    while (index > 0) {
      size_t parent = (index - 1) / 2;
      if (!comp_(*element, *heap_[parent])) {
        break;
      }
      heap_[index] = std::move(heap_[parent]);
      index = parent;
    }
    heap_[index] = std::move(element);
  }

  // Moves the element at index towards the leaves, swapping with the smaller
  // child while that child is less. Used after removing the root.
  void SiftDown(size_t index) {
    std::optional<T> element = std::move(heap_[index]);
    const size_t half = size_ / 2;
    while (index < half) {
      size_t child = 2 * index + 1;
      if (child + 1 < size_ && comp_(*heap_[child + 1], *heap_[child])) {
        child++;
      }
      if (!comp_(*heap_[child], *element)) {
        break;
      }
      heap_[index] = std::move(heap_[child]);
      index = child;
    }
    heap_[index] = std::move(element);
  }

  std::vector<std::optional<T>> heap_; // heap_.size() is the capacity
  size_t size_{0};
  Compare comp_;
};

} // namespace path_tools

#endif
