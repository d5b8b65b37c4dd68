#pragma once

#include "ReactScheduler/ReactExpirationTime.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reactdom {

/**
 * Node interface for SchedulerMinHeap
 * Ordered by sortIndex (an expiration time), ties broken by id
 */
struct HeapNode {
  std::uint64_t id{0};
  ExpirationTime sortIndex{NoWork};

  virtual ~HeapNode() = default;
};

/**
 * Binary min-heap of non-owning node pointers.
 *
 * - Primary comparison by sortIndex
 * - Secondary comparison by id (insertion order for FIFO within one expiration)
 * - Arbitrary removal, for superseded and discarded entries
 * - Filtered peek, for callers that may only take some of the entries
 */
template<typename T>
class SchedulerMinHeap {
private:
  std::vector<T*> heap_;

  static int compare(const T* a, const T* b) {
    if (a->sortIndex != b->sortIndex) {
      return a->sortIndex < b->sortIndex ? -1 : 1;
    }
    return a->id < b->id ? -1 : (a->id > b->id ? 1 : 0);
  }

  void siftUp(T* node, std::size_t index) {
    while (index > 0) {
      const std::size_t parentIndex = (index - 1) >> 1;
      T* parent = heap_[parentIndex];

      if (compare(parent, node) > 0) {
        heap_[parentIndex] = node;
        heap_[index] = parent;
        index = parentIndex;
      } else {
        return;
      }
    }
  }

  void siftDown(T* node, std::size_t index) {
    const std::size_t length = heap_.size();
    const std::size_t halfLength = length >> 1;

    while (index < halfLength) {
      const std::size_t leftIndex = (index + 1) * 2 - 1;
      T* left = heap_[leftIndex];
      const std::size_t rightIndex = leftIndex + 1;
      T* right = rightIndex < length ? heap_[rightIndex] : nullptr;

      if (compare(left, node) < 0) {
        if (right != nullptr && compare(right, left) < 0) {
          heap_[index] = right;
          heap_[rightIndex] = node;
          index = rightIndex;
        } else {
          heap_[index] = left;
          heap_[leftIndex] = node;
          index = leftIndex;
        }
      } else if (right != nullptr && compare(right, node) < 0) {
        heap_[index] = right;
        heap_[rightIndex] = node;
        index = rightIndex;
      } else {
        return;
      }
    }
  }

public:
  SchedulerMinHeap() = default;

  SchedulerMinHeap(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap& operator=(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap(SchedulerMinHeap&&) = default;
  SchedulerMinHeap& operator=(SchedulerMinHeap&&) = default;

  void push(T* node) {
    if (node == nullptr) {
      return;
    }

    const std::size_t index = heap_.size();
    heap_.push_back(node);
    siftUp(node, index);
  }

  T* peek() const {
    return heap_.empty() ? nullptr : heap_[0];
  }

  /**
   * Smallest node accepted by the predicate, or nullptr.
   * Linear in the heap size.
   */
  template<typename Predicate>
  T* peekIf(Predicate&& predicate) const {
    T* best = nullptr;
    for (T* node : heap_) {
      if (!predicate(*node)) {
        continue;
      }
      if (best == nullptr || compare(node, best) < 0) {
        best = node;
      }
    }
    return best;
  }

  T* pop() {
    if (heap_.empty()) {
      return nullptr;
    }

    T* first = heap_[0];
    T* last = heap_.back();
    heap_.pop_back();

    if (!heap_.empty() && last != first) {
      heap_[0] = last;
      siftDown(last, 0);
    }

    return first;
  }

  /**
   * Remove a node from anywhere in the heap.
   * Returns false if the node is not queued.
   */
  bool remove(const T* node) {
    std::size_t index = 0;
    while (index < heap_.size() && heap_[index] != node) {
      ++index;
    }
    if (index == heap_.size()) {
      return false;
    }

    T* last = heap_.back();
    heap_.pop_back();
    if (index == heap_.size()) {
      return true;
    }

    heap_[index] = last;
    if (index > 0 && compare(heap_[(index - 1) >> 1], last) > 0) {
      siftUp(last, index);
    } else {
      siftDown(last, index);
    }
    return true;
  }

  template<typename Predicate>
  bool any(Predicate&& predicate) const {
    for (const T* node : heap_) {
      if (predicate(*node)) {
        return true;
      }
    }
    return false;
  }

  bool empty() const {
    return heap_.empty();
  }

  std::size_t size() const {
    return heap_.size();
  }

  void clear() {
    heap_.clear();
  }

  const std::vector<T*>& data() const {
    return heap_;
  }
};

} // namespace reactdom
