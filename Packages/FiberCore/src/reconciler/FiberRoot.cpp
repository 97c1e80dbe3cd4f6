#include "reconciler/FiberRoot.h"

#include "reconciler/FiberArena.h"
#include "shared/FiberFeatureFlags.h"

#include "jsi/jsi.h"

namespace jsi = facebook::jsi;

namespace fibercore {

namespace {

double computeExpirationTime(Lane lane, double currentTime) {
  switch (lanePriorityForLane(lane)) {
    case LanePriority::SyncLanePriority:
    case LanePriority::InputContinuousLanePriority:
      return currentTime + syncLaneExpirationMs;
    case LanePriority::DefaultLanePriority:
    case LanePriority::TransitionLanePriority:
      return currentTime + transitionLaneExpirationMs;
    case LanePriority::RetryLanePriority:
    case LanePriority::IdleLanePriority:
    case LanePriority::OffscreenLanePriority:
    case LanePriority::NoLanePriority:
    default:
      return NoTimestamp;
  }
}

} // namespace

std::unique_ptr<FiberRoot> createFiberRoot(FiberArena& arena, void* containerInfo) {
  auto root = std::make_unique<FiberRoot>();
  root->containerInfo = containerInfo;

  const FiberHandle hostRoot = arena.createFiber(WorkTag::HostRoot, jsi::Value::null());
  arena.get(hostRoot).stateNode = root.get();
  root->current = hostRoot;

  return root;
}

void markRootUpdated(FiberRoot& root, Lane updateLane) {
  root.pendingLanes = mergeLanes(root.pendingLanes, updateLane);
}

void markRootFinished(FiberRoot& root, Lanes remainingLanes) {
  Lanes noLongerPendingLanes = removeLanes(root.pendingLanes, remainingLanes);
  root.pendingLanes = remainingLanes;
  root.expiredLanes = intersectLanes(root.expiredLanes, remainingLanes);

  while (noLongerPendingLanes != NoLanes) {
    const Lane lane = getHighestPriorityLane(noLongerPendingLanes);
    root.expirationTimes[laneToIndex(lane)] = NoTimestamp;
    noLongerPendingLanes = removeLanes(noLongerPendingLanes, lane);
  }
}

void markStarvedLanesAsExpired(FiberRoot& root, double currentTime) {
  Lanes lanes = root.pendingLanes;
  while (lanes != NoLanes) {
    const Lane lane = getHighestPriorityLane(lanes);
    double& expirationTime = root.expirationTimes[laneToIndex(lane)];
    if (expirationTime == NoTimestamp) {
      expirationTime = computeExpirationTime(lane, currentTime);
    } else if (expirationTime <= currentTime) {
      root.expiredLanes = mergeLanes(root.expiredLanes, lane);
    }
    lanes = removeLanes(lanes, lane);
  }
}

bool includesExpiredLane(const FiberRoot& root, Lanes lanes) {
  return includesSomeLane(root.expiredLanes, lanes);
}

FiberRoot* getRootForUpdatedFiber(FiberArena& arena, FiberHandle fiber) {
  if (!arena.contains(fiber)) {
    return nullptr;
  }

  FiberHandle node = fiber;
  FiberHandle parent = arena.get(node).returnFiber;
  while (parent) {
    node = parent;
    parent = arena.get(node).returnFiber;
  }

  const FiberNode& top = arena.get(node);
  if (top.tag == WorkTag::HostRoot) {
    return static_cast<FiberRoot*>(top.stateNode);
  }
  return nullptr;
}

} // namespace fibercore
