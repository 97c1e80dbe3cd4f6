#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fibercore {

// Binary min-heap over non-owning node pointers. Nodes are ordered by
// sortIndex, then by id so equal deadlines stay FIFO.
template <typename T>
class SchedulerMinHeap {
public:
  SchedulerMinHeap() = default;

  SchedulerMinHeap(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap& operator=(const SchedulerMinHeap&) = delete;

  void push(T* node) {
    if (node == nullptr) {
      return;
    }
    heap_.push_back(node);
    siftUp(node, heap_.size() - 1);
  }

  T* peek() const {
    return heap_.empty() ? nullptr : heap_.front();
  }

  T* pop() {
    if (heap_.empty()) {
      return nullptr;
    }

    T* first = heap_.front();
    T* last = heap_.back();
    heap_.pop_back();

    if (!heap_.empty()) {
      heap_[0] = last;
      siftDown(last, 0);
    }
    return first;
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

private:
  static bool lessThan(const T* a, const T* b) {
    if (a->sortIndex != b->sortIndex) {
      return a->sortIndex < b->sortIndex;
    }
    return a->id < b->id;
  }

  void siftUp(T* node, std::size_t index) {
    while (index > 0) {
      const std::size_t parentIndex = (index - 1) >> 1;
      T* parent = heap_[parentIndex];
      if (!lessThan(node, parent)) {
        return;
      }
      heap_[parentIndex] = node;
      heap_[index] = parent;
      index = parentIndex;
    }
  }

  void siftDown(T* node, std::size_t index) {
    const std::size_t length = heap_.size();
    const std::size_t halfLength = length >> 1;

    while (index < halfLength) {
      const std::size_t leftIndex = (index + 1) * 2 - 1;
      const std::size_t rightIndex = leftIndex + 1;
      T* left = heap_[leftIndex];
      T* right = rightIndex < length ? heap_[rightIndex] : nullptr;

      if (lessThan(left, node)) {
        if (right != nullptr && lessThan(right, left)) {
          heap_[index] = right;
          heap_[rightIndex] = node;
          index = rightIndex;
        } else {
          heap_[index] = left;
          heap_[leftIndex] = node;
          index = leftIndex;
        }
      } else if (right != nullptr && lessThan(right, node)) {
        heap_[index] = right;
        heap_[rightIndex] = node;
        index = rightIndex;
      } else {
        return;
      }
    }
  }

  std::vector<T*> heap_{};
};

} // namespace fibercore
