#include "reconciler/FiberArena.h"
#include "reconciler/FiberRoot.h"
#include "shared/FiberFeatureFlags.h"
#include "TestRuntime.h"

#include "jsi/jsi.h"

#include <cassert>
#include <memory>
#include <stdexcept>

namespace jsi = facebook::jsi;

namespace fibercore::test {
namespace {

bool testWorkInProgressIsAllocatedOncePerSlot() {
  TestRuntime rt;
  FiberArena arena;

  const FiberHandle current = arena.createFiber(WorkTag::HostComponent, jsi::Value(1.0), "a");
  assert(current.buffer == 0);
  assert(arena.slotCount() == 1);
  assert(arena.allocatedNodeCount() == 1);
  assert(!arena.alternateOf(current));

  const FiberHandle first = arena.createWorkInProgress(rt, current, jsi::Value(2.0));
  assert(first.slot == current.slot);
  assert(first.buffer == 1);
  assert(arena.allocatedNodeCount() == 2);
  assert(arena.alternateOf(current) == first);
  assert(arena.alternateOf(first) == current);

  FiberNode& wip = arena.get(first);
  assert(wip.key == "a");
  assert(wip.tag == WorkTag::HostComponent);
  assert(wip.pendingProps.getNumber() == 2.0);

  wip.flags = Placement | Update;
  wip.subtreeFlags = ChildDeletion;

  // A second request reuses the buffer and clears its effects.
  const FiberHandle second = arena.createWorkInProgress(rt, current, jsi::Value(3.0));
  assert(second == first);
  assert(arena.allocatedNodeCount() == 2);
  assert(arena.get(second).flags == NoFlags);
  assert(arena.get(second).subtreeFlags == NoFlags);
  assert(arena.get(second).pendingProps.getNumber() == 3.0);

  // Asking from the other side flips back into buffer 0.
  const FiberHandle flipped = arena.createWorkInProgress(rt, second, jsi::Value(4.0));
  assert(flipped == current);
  assert(arena.allocatedNodeCount() == 2);
  return true;
}

bool testWorkInProgressCopiesLinksAndState() {
  TestRuntime rt;
  FiberArena arena;

  const FiberHandle parent = arena.createFiber(WorkTag::HostComponent, jsi::Value(0.0), "p");
  const FiberHandle child = arena.createFiber(WorkTag::HostComponent, jsi::Value(0.0), "c");
  const FiberHandle sibling = arena.createFiber(WorkTag::HostText, jsi::Value(0.0), "s");

  FiberNode& node = arena.get(child);
  node.returnFiber = parent;
  node.sibling = sibling;
  node.index = 2;
  node.lanes = DefaultLane;
  node.childLanes = SyncLane;
  node.memoizedProps = jsi::Value(7.0);
  node.memoizedState = jsi::Value(8.0);
  int host = 0;
  node.stateNode = &host;

  const FiberHandle wip = arena.createWorkInProgress(rt, child, jsi::Value(9.0));
  const FiberNode& copy = arena.get(wip);
  assert(copy.returnFiber == parent);
  assert(copy.sibling == sibling);
  assert(copy.index == 2);
  assert(copy.lanes == DefaultLane);
  assert(copy.childLanes == SyncLane);
  assert(copy.memoizedProps.getNumber() == 7.0);
  assert(copy.memoizedState.getNumber() == 8.0);
  assert(copy.stateNode == &host);
  return true;
}

bool testInvalidHandlesAreRejected() {
  FiberArena arena;
  assert(!NoFiber);
  assert(!arena.contains(NoFiber));
  assert(!arena.alternateOf(NoFiber));

  bool threw = false;
  try {
    (void)arena.get(FiberHandle{5, 0});
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  const FiberHandle fiber = arena.createFiber(WorkTag::Fragment, jsi::Value::undefined());
  assert(arena.contains(fiber));
  assert(!arena.contains(fiber.pairedBuffer()));

  arena.clear();
  assert(arena.slotCount() == 0);
  assert(arena.allocatedNodeCount() == 0);
  assert(!arena.contains(fiber));
  return true;
}

bool testRootLookupFollowsReturnLinks() {
  FiberArena arena;
  int container = 0;
  std::unique_ptr<FiberRoot> root = createFiberRoot(arena, &container);
  assert(root->containerInfo == &container);
  assert(arena.get(root->current).tag == WorkTag::HostRoot);
  assert(arena.get(root->current).stateNode == root.get());
  assert(root->pendingLanes == NoLanes);
  assert(!root->finishedWork);
  assert(!root->callbackNode);

  const FiberHandle child = arena.createFiber(WorkTag::HostComponent, jsi::Value(0.0), "child");
  const FiberHandle grandchild = arena.createFiber(WorkTag::HostText, jsi::Value(0.0), "text");
  arena.get(child).returnFiber = root->current;
  arena.get(grandchild).returnFiber = child;

  assert(getRootForUpdatedFiber(arena, root->current) == root.get());
  assert(getRootForUpdatedFiber(arena, grandchild) == root.get());

  const FiberHandle detached = arena.createFiber(WorkTag::HostComponent, jsi::Value(0.0), "detached");
  assert(getRootForUpdatedFiber(arena, detached) == nullptr);
  assert(getRootForUpdatedFiber(arena, NoFiber) == nullptr);

  markRootUpdated(*root, DefaultLane);
  markRootUpdated(*root, SyncLane);
  markRootUpdated(*root, SyncLane);
  assert(root->pendingLanes == (SyncLane | DefaultLane));
  markRootFinished(*root, DefaultLane);
  assert(root->pendingLanes == DefaultLane);
  return true;
}

bool testStarvedLanesExpire() {
  FiberArena arena;
  std::unique_ptr<FiberRoot> root = createFiberRoot(arena, nullptr);
  assert(root->expirationTimes[laneToIndex(DefaultLane)] == NoTimestamp);

  markRootUpdated(*root, DefaultLane);
  markRootUpdated(*root, SyncLane);
  markRootUpdated(*root, IdleLane);
  markStarvedLanesAsExpired(*root, 100.0);
  assert(root->expirationTimes[laneToIndex(SyncLane)] == 100.0 + syncLaneExpirationMs);
  assert(root->expirationTimes[laneToIndex(DefaultLane)] == 100.0 + transitionLaneExpirationMs);
  assert(root->expirationTimes[laneToIndex(IdleLane)] == NoTimestamp);
  assert(root->expiredLanes == NoLanes);

  // A later pass keeps the first deadline.
  markStarvedLanesAsExpired(*root, 200.0);
  assert(root->expirationTimes[laneToIndex(SyncLane)] == 100.0 + syncLaneExpirationMs);

  markStarvedLanesAsExpired(*root, 100.0 + syncLaneExpirationMs);
  assert(root->expiredLanes == SyncLane);
  assert(includesExpiredLane(*root, SyncLane | DefaultLane));
  assert(!includesExpiredLane(*root, DefaultLane));

  markStarvedLanesAsExpired(*root, 1.0e9);
  assert(root->expiredLanes == (SyncLane | DefaultLane));

  markRootFinished(*root, DefaultLane | IdleLane);
  assert(root->expiredLanes == DefaultLane);
  assert(root->expirationTimes[laneToIndex(SyncLane)] == NoTimestamp);
  assert(root->expirationTimes[laneToIndex(DefaultLane)] == 100.0 + transitionLaneExpirationMs);

  markRootFinished(*root, NoLanes);
  assert(root->expiredLanes == NoLanes);
  assert(root->expirationTimes[laneToIndex(DefaultLane)] == NoTimestamp);
  return true;
}

} // namespace

bool runFiberArenaTests() {
  return testWorkInProgressIsAllocatedOncePerSlot() && testWorkInProgressCopiesLinksAndState() &&
      testInvalidHandlesAreRejected() && testRootLookupFollowsReturnLinks() && testStarvedLanesExpire();
}

} // namespace fibercore::test
