#include "reconciler/FiberRootScheduler.h"

#include "host/MicrotaskHost.h"
#include "reconciler/FiberArena.h"
#include "reconciler/FiberCommitWork.h"
#include "reconciler/FiberRoot.h"
#include "reconciler/FiberWorkLoop.h"
#include "runtime/ReconcilerRuntime.h"
#include "scheduler/SyncTaskQueue.h"
#include "shared/FiberFeatureFlags.h"
#include "shared/GlobalError.h"

#include <memory>
#include <string>
#include <utility>

namespace fibercore {

namespace {

// Wraps work posted to a host that may outlive `runtime`.
template <typename Work>
Task whileRuntimeAlive(ReconcilerRuntime& runtime, Work&& work) {
  return [alive = runtime.lifetimeToken(), work = std::forward<Work>(work)]() {
    if (alive.expired()) {
      return;
    }
    work();
  };
}

void scheduleSyncRender(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane) {
  logSchedulingTrace("scheduling sync render in microtask, lane " + std::to_string(lane));

  FiberRoot* const target = &root;
  runtime.syncTaskQueue().scheduleSyncCallback([&runtime, target, lane]() {
    performSyncWorkOnRoot(runtime, *target, lane);
  });
  runtime.microtaskHost().scheduleMicroTask(whileRuntimeAlive(runtime, [&runtime]() {
    runtime.syncTaskQueue().flushSyncCallbacks();
  }));
}

void scheduleDeferredRender(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane) {
  if (!enableDeferredLaneScheduling) {
    return;
  }

  Scheduler& scheduler = runtime.scheduler();
  markStarvedLanesAsExpired(root, scheduler.now());
  if (root.callbackNode && root.callbackPriority == lane) {
    return;
  }
  if (root.callbackNode) {
    scheduler.cancelTask(root.callbackNode);
  }

  const SchedulerPriority priority = lanesToSchedulerPriority(lane);
  logSchedulingTrace(
      std::string("scheduling deferred render at ") + priorityName(priority) + ", lane " +
      std::to_string(lane));

  FiberRoot* const target = &root;
  root.callbackPriority = lane;
  root.callbackNode = scheduler.scheduleTask(priority, whileRuntimeAlive(runtime, [&runtime, target, lane]() {
    performConcurrentWorkOnRoot(runtime, *target, lane);
  }));
}

void finishRenderAndCommit(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane) {
  root.finishedWork = runtime.arena().alternateOf(root.current);
  root.finishedLanes = lane;

  runtime.pushExecutionContext(CommitContext);
  runtime.setWorkInProgressRoot(&root);
  try {
    commitRoot(runtime, root);
  } catch (...) {
    runtime.setWorkInProgressRoot(nullptr);
    runtime.popExecutionContext(CommitContext);
    throw;
  }
  runtime.setWorkInProgressRoot(nullptr);
  runtime.popExecutionContext(CommitContext);
}

} // namespace

SchedulerPriority lanesToSchedulerPriority(Lanes lanes) {
  switch (lanePriorityForLane(lanes)) {
    case LanePriority::SyncLanePriority:
      return SchedulerPriority::ImmediatePriority;
    case LanePriority::InputContinuousLanePriority:
      return SchedulerPriority::UserBlockingPriority;
    case LanePriority::DefaultLanePriority:
    case LanePriority::TransitionLanePriority:
    case LanePriority::RetryLanePriority:
      return SchedulerPriority::NormalPriority;
    case LanePriority::IdleLanePriority:
      return SchedulerPriority::IdlePriority;
    case LanePriority::OffscreenLanePriority:
      return SchedulerPriority::LowPriority;
    case LanePriority::NoLanePriority:
    default:
      return SchedulerPriority::NormalPriority;
  }
}

void scheduleUpdateOnFiber(ReconcilerRuntime& runtime, FiberHandle fiber, Lane lane) {
  FiberRoot* const root = getRootForUpdatedFiber(runtime.arena(), fiber);
  if (root == nullptr) {
    return;
  }

  markRootUpdated(*root, lane);
  if (runtime.isWorkingOnRoot(*root)) {
    root->interleavedUpdatedLanes = mergeLanes(root->interleavedUpdatedLanes, lane);
  } else {
    // A parked concurrent walk has not seen this update; restart it.
    runtime.discardConcurrentAttempt(*root);
  }

  ensureRootIsScheduled(runtime, *root);
}

void ensureRootIsScheduled(ReconcilerRuntime& runtime, FiberRoot& root) {
  const Lane updateLane = getHighestPriorityLane(root.pendingLanes);
  if (updateLane == NoLane) {
    return;
  }

  if (updateLane == SyncLane) {
    scheduleSyncRender(runtime, root, updateLane);
  } else {
    scheduleDeferredRender(runtime, root, updateLane);
  }
}

void performSyncWorkOnRoot(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane) {
  // Several triggers in one turn queue several callbacks; only the first one
  // still finds its lane pending.
  const Lane nextLane = getHighestPriorityLane(root.pendingLanes);
  if (nextLane != lane) {
    ensureRootIsScheduled(runtime, root);
    return;
  }

  runtime.discardConcurrentAttempt(root);

  RenderAttempt attempt{};
  runtime.pushExecutionContext(RenderContext);
  runtime.setWorkInProgressRoot(&root);
  RenderExitStatus exitStatus = RenderExitStatus::InProgress;
  try {
    exitStatus = renderRootSync(runtime, attempt, root, lane);
  } catch (...) {
    runtime.setWorkInProgressRoot(nullptr);
    runtime.popExecutionContext(RenderContext);
    throw;
  }
  runtime.setWorkInProgressRoot(nullptr);
  runtime.popExecutionContext(RenderContext);

  if (exitStatus != RenderExitStatus::Completed) {
    return;
  }

  finishRenderAndCommit(runtime, root, lane);
}

void performConcurrentWorkOnRoot(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane) {
  root.callbackNode = {};
  root.callbackPriority = NoLane;

  const Lane nextLane = getHighestPriorityLane(root.pendingLanes);
  if (nextLane != lane) {
    ensureRootIsScheduled(runtime, root);
    return;
  }

  Scheduler& scheduler = runtime.scheduler();
  // A lane that waited past its deadline finishes in this task.
  markStarvedLanesAsExpired(root, scheduler.now());
  const bool shouldTimeSlice = !includesExpiredLane(root, lane);
  RenderAttempt& attempt = runtime.concurrentAttempt(root);

  runtime.pushExecutionContext(RenderContext);
  runtime.setWorkInProgressRoot(&root);
  RenderExitStatus exitStatus = RenderExitStatus::InProgress;
  try {
    exitStatus = renderRootConcurrent(runtime, attempt, root, lane, scheduler, shouldTimeSlice);
  } catch (...) {
    runtime.setWorkInProgressRoot(nullptr);
    runtime.popExecutionContext(RenderContext);
    throw;
  }
  runtime.setWorkInProgressRoot(nullptr);
  runtime.popExecutionContext(RenderContext);

  switch (exitStatus) {
    case RenderExitStatus::Yielded: {
      FiberRoot* const target = &root;
      root.callbackPriority = lane;
      root.callbackNode = scheduler.scheduleTask(
        lanesToSchedulerPriority(lane),
        whileRuntimeAlive(runtime, [&runtime, target, lane]() { performConcurrentWorkOnRoot(runtime, *target, lane); }));
      return;
    }
    case RenderExitStatus::Completed:
      runtime.discardConcurrentAttempt(root);
      finishRenderAndCommit(runtime, root, lane);
      return;
    case RenderExitStatus::WalkAborted:
    case RenderExitStatus::InProgress:
    default:
      runtime.discardConcurrentAttempt(root);
      return;
  }
}

} // namespace fibercore
