#include "reconciler/FiberUpdateQueue.h"

#include "reconciler/FiberArena.h"

#include <memory>

namespace jsi = facebook::jsi;

namespace fibercore {

namespace {

void markUpdateLaneFromFiberToRoot(FiberArena& arena, FiberHandle sourceFiber, Lane lane) {
  FiberNode& source = arena.get(sourceFiber);
  source.lanes = mergeLanes(source.lanes, lane);
  const FiberHandle sourceAlternate = arena.alternateOf(sourceFiber);
  if (sourceAlternate) {
    FiberNode& alternate = arena.get(sourceAlternate);
    alternate.lanes = mergeLanes(alternate.lanes, lane);
  }

  FiberHandle parent = source.returnFiber;
  while (parent) {
    FiberNode& parentFiber = arena.get(parent);
    parentFiber.childLanes = mergeLanes(parentFiber.childLanes, lane);
    const FiberHandle parentAlternate = arena.alternateOf(parent);
    if (parentAlternate) {
      FiberNode& alternate = arena.get(parentAlternate);
      alternate.childLanes = mergeLanes(alternate.childLanes, lane);
    }
    parent = parentFiber.returnFiber;
  }
}

} // namespace

void enqueueUpdate(
  jsi::Runtime& rt,
  FiberArena& arena,
  FiberHandle fiber,
  const jsi::Value& payload,
  Lane lane) {
  FiberNode& node = arena.get(fiber);
  if (!node.updateQueue) {
    node.updateQueue = std::make_shared<UpdateQueue>();
    const FiberHandle alternate = arena.alternateOf(fiber);
    if (alternate) {
      arena.get(alternate).updateQueue = node.updateQueue;
    }
  }

  node.updateQueue->pending = jsi::Value(rt, payload);
  node.updateQueue->lanes = mergeLanes(node.updateQueue->lanes, lane);

  markUpdateLaneFromFiberToRoot(arena, fiber, lane);
}

bool hasPendingUpdate(const FiberArena& arena, FiberHandle fiber) {
  const FiberNode& node = arena.get(fiber);
  return node.updateQueue && node.updateQueue->lanes != NoLanes;
}

bool processUpdateQueue(
  jsi::Runtime& rt,
  FiberArena& arena,
  FiberHandle workInProgress,
  Lanes renderLanes) {
  FiberNode& node = arena.get(workInProgress);
  const std::shared_ptr<UpdateQueue> queue = node.updateQueue;
  if (!queue || !includesSomeLane(renderLanes, queue->lanes)) {
    return false;
  }

  node.memoizedState = jsi::Value(rt, queue->pending);
  queue->pending = jsi::Value::undefined();
  queue->lanes = NoLanes;
  node.lanes = removeLanes(node.lanes, renderLanes);
  return true;
}

} // namespace fibercore
