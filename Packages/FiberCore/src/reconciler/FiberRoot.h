#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberNode.h"
#include "scheduler/Scheduler.h"

#include <array>
#include <memory>

namespace fibercore {

class FiberArena;

struct FiberRoot {
  void* containerInfo{nullptr};

  FiberHandle current{};
  FiberHandle finishedWork{};

  Lanes pendingLanes{NoLanes};
  Lanes finishedLanes{NoLanes};
  // Lanes scheduled while this root was rendering or committing. They survive
  // the lane retirement at commit.
  Lanes interleavedUpdatedLanes{NoLanes};

  // Per-lane deadline after which a deferred render stops yielding.
  std::array<double, TotalLanes> expirationTimes{createLaneMap<double>(NoTimestamp)};
  Lanes expiredLanes{NoLanes};

  // Deferred (non-sync) render task currently posted to the Scheduler.
  TaskHandle callbackNode{};
  Lane callbackPriority{NoLane};
};

std::unique_ptr<FiberRoot> createFiberRoot(FiberArena& arena, void* containerInfo);

void markRootUpdated(FiberRoot& root, Lane updateLane);
void markRootFinished(FiberRoot& root, Lanes remainingLanes);

// Stamps a deadline on each pending lane that has none and moves lanes past
// their deadline into expiredLanes.
void markStarvedLanesAsExpired(FiberRoot& root, double currentTime);
[[nodiscard]] bool includesExpiredLane(const FiberRoot& root, Lanes lanes);

// Walks return links up from `fiber`. Returns nullptr unless the walk ends at a
// HostRoot fiber.
FiberRoot* getRootForUpdatedFiber(FiberArena& arena, FiberHandle fiber);

} // namespace fibercore
