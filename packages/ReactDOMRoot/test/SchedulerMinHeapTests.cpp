#include "ReactScheduler/SchedulerMinHeap.h"

#include <cassert>
#include <vector>

namespace reactdom::test {

namespace {

struct TestNode : public HeapNode {
  TestNode(std::uint64_t nodeId, ExpirationTime expiration, bool isBatched = false)
      : batched(isBatched) {
    id = nodeId;
    sortIndex = expiration;
  }

  bool batched{false};
};

} // namespace

bool runSchedulerMinHeapTests() {
  SchedulerMinHeap<TestNode> heap;
  assert(heap.empty());
  assert(heap.peek() == nullptr);
  assert(heap.pop() == nullptr);

  TestNode late(1, 300);
  TestNode early(2, 100);
  TestNode tieFirst(3, 200);
  TestNode tieSecond(4, 200, true);
  TestNode earliestBatched(5, 50, true);

  heap.push(&late);
  heap.push(&early);
  heap.push(&tieSecond);
  heap.push(&tieFirst);
  heap.push(&earliestBatched);
  heap.push(nullptr);
  assert(heap.size() == 5);

  assert(heap.peek() == &earliestBatched);
  assert(heap.peekIf([](const TestNode& node) { return !node.batched; }) == &early);
  assert(heap.any([](const TestNode& node) { return node.sortIndex == 300; }));
  assert(!heap.any([](const TestNode& node) { return node.sortIndex == 999; }));

  assert(heap.remove(&early));
  assert(!heap.remove(&early));
  assert(heap.size() == 4);
  assert(heap.peekIf([](const TestNode& node) { return !node.batched; }) == &tieFirst);

  // Equal expirations come out in id order.
  std::vector<TestNode*> order;
  while (TestNode* node = heap.pop()) {
    order.push_back(node);
  }
  assert(order.size() == 4);
  assert(order[0] == &earliestBatched);
  assert(order[1] == &tieFirst);
  assert(order[2] == &tieSecond);
  assert(order[3] == &late);
  assert(heap.empty());

  // Removing from the middle keeps the heap ordered.
  std::vector<TestNode> nodes;
  nodes.reserve(16);
  for (std::uint64_t index = 0; index < 16; ++index) {
    nodes.emplace_back(index + 1, (index * 7) % 16);
  }
  for (auto& node : nodes) {
    heap.push(&node);
  }
  assert(heap.remove(&nodes[3]));
  assert(heap.remove(&nodes[10]));
  ExpirationTime previous = 0;
  std::size_t popped = 0;
  while (TestNode* node = heap.pop()) {
    assert(node->sortIndex >= previous);
    previous = node->sortIndex;
    ++popped;
  }
  assert(popped == 14);

  heap.push(&late);
  heap.clear();
  assert(heap.empty());

  return true;
}

} // namespace reactdom::test
