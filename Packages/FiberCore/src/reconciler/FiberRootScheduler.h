#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberNode.h"
#include "scheduler/Scheduler.h"

namespace fibercore {

class ReconcilerRuntime;
struct FiberRoot;

// Records an update of `lane` at `fiber` on its root and makes sure a render is
// scheduled. Requests from fibers not attached to a HostRoot are dropped.
void scheduleUpdateOnFiber(ReconcilerRuntime& runtime, FiberHandle fiber, Lane lane);

void ensureRootIsScheduled(ReconcilerRuntime& runtime, FiberRoot& root);

void performSyncWorkOnRoot(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane);
void performConcurrentWorkOnRoot(ReconcilerRuntime& runtime, FiberRoot& root, Lane lane);

SchedulerPriority lanesToSchedulerPriority(Lanes lanes);

} // namespace fibercore
