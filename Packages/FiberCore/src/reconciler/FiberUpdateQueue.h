#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberNode.h"

#include "jsi/jsi.h"

namespace fibercore {

class FiberArena;

// Latest payload requested for a fiber. Both buffers of a slot share the queue,
// so an update enqueued on either one is seen by the next render.
struct UpdateQueue {
  facebook::jsi::Value pending{facebook::jsi::Value::undefined()};
  Lanes lanes{NoLanes};
};

void enqueueUpdate(
  facebook::jsi::Runtime& rt,
  FiberArena& arena,
  FiberHandle fiber,
  const facebook::jsi::Value& payload,
  Lane lane);

[[nodiscard]] bool hasPendingUpdate(const FiberArena& arena, FiberHandle fiber);

// Moves a payload whose lanes are covered by renderLanes into memoizedState.
// Returns true when the state changed.
bool processUpdateQueue(
  facebook::jsi::Runtime& rt,
  FiberArena& arena,
  FiberHandle workInProgress,
  Lanes renderLanes);

} // namespace fibercore
