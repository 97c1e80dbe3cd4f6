#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberWorkLoopState.h"

namespace fibercore {

class ReconcilerRuntime;
class Scheduler;
struct FiberRoot;

// Points the attempt at a fresh work-in-progress copy of root.current.
void prepareFreshStack(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberRoot& root, Lanes lanes);

void performUnitOfWork(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberHandle unitOfWork);
void completeUnitOfWork(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberHandle unitOfWork);

void workLoopSync(ReconcilerRuntime& runtime, RenderAttempt& attempt);
void workLoopConcurrent(ReconcilerRuntime& runtime, RenderAttempt& attempt, const Scheduler& scheduler);

// Both return Completed when the tree was exhausted and WalkAborted when a
// handler failed. An aborted walk is not retried. renderRootConcurrent resumes
// a yielded attempt for the same root and lanes; without time slicing it runs
// the rest of the walk without yielding.
RenderExitStatus renderRootSync(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberRoot& root, Lanes lanes);
RenderExitStatus renderRootConcurrent(
  ReconcilerRuntime& runtime,
  RenderAttempt& attempt,
  FiberRoot& root,
  Lanes lanes,
  const Scheduler& scheduler,
  bool shouldTimeSlice = true);

} // namespace fibercore
