#include "reconciler/FiberWorkLoop.h"

#include "reconciler/FiberArena.h"
#include "reconciler/FiberErrorLogger.h"
#include "reconciler/FiberRoot.h"
#include "reconciler/FiberWorkHandlers.h"
#include "runtime/ReconcilerRuntime.h"
#include "scheduler/Scheduler.h"

#include "jsi/jsi.h"

#include <exception>
#include <utility>

namespace jsi = facebook::jsi;

namespace fibercore {

namespace {

void abandonWalk(RenderAttempt& attempt, WorkError error) {
  attempt.workInProgress = NoFiber;
  attempt.exitStatus = RenderExitStatus::WalkAborted;
  attempt.error = std::move(error);
}

void handleThrow(RenderAttempt& attempt, const std::exception& ex) {
  abandonWalk(attempt, WorkError{attempt.workInProgress, ex.what()});
}

template <typename WorkLoop>
RenderExitStatus runRenderShell(RenderAttempt& attempt, WorkLoop&& workLoop) {
  // A failed walk only clears the cursor, so the next pass through the shell
  // finds nothing to do and exits. There is no automatic retry.
  do {
    try {
      workLoop();
      break;
    } catch (const std::exception& ex) {
      handleThrow(attempt, ex);
    } catch (...) {
      abandonWalk(attempt, WorkError{attempt.workInProgress, "Unknown error"});
    }
  } while (true);

  if (attempt.exitStatus == RenderExitStatus::WalkAborted) {
    if (attempt.root != nullptr && attempt.error) {
      logRenderError(*attempt.root, *attempt.error);
    }
    return attempt.exitStatus;
  }

  attempt.exitStatus = attempt.workInProgress ? RenderExitStatus::Yielded : RenderExitStatus::Completed;
  return attempt.exitStatus;
}

} // namespace

void prepareFreshStack(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberRoot& root, Lanes lanes) {
  jsi::Runtime& rt = runtime.jsiRuntime();
  attempt = RenderAttempt{};
  attempt.root = &root;
  attempt.renderLanes = lanes;
  root.interleavedUpdatedLanes = NoLanes;
  attempt.workInProgress = runtime.arena().createWorkInProgress(rt, root.current, jsi::Object(rt));
}

void performUnitOfWork(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberHandle unitOfWork) {
  FiberArena& arena = runtime.arena();
  jsi::Runtime& rt = runtime.jsiRuntime();

  BeginWorkResult result =
      runtime.workHandlers().beginWork(arena, rt, unitOfWork, attempt.renderLanes);
  ++attempt.unitsOfWork;
  if (result.error) {
    abandonWalk(attempt, std::move(*result.error));
    return;
  }

  FiberNode& fiber = arena.get(unitOfWork);
  fiber.memoizedProps = jsi::Value(rt, fiber.pendingProps);

  if (!result.next) {
    completeUnitOfWork(runtime, attempt, unitOfWork);
  } else {
    attempt.workInProgress = result.next;
  }
}

void completeUnitOfWork(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberHandle unitOfWork) {
  FiberArena& arena = runtime.arena();
  jsi::Runtime& rt = runtime.jsiRuntime();

  FiberHandle completedWork = unitOfWork;
  do {
    std::optional<WorkError> error = runtime.workHandlers().completeWork(arena, rt, completedWork);
    if (error) {
      abandonWalk(attempt, std::move(*error));
      return;
    }

    const FiberNode& node = arena.get(completedWork);
    if (node.sibling) {
      attempt.workInProgress = node.sibling;
      return;
    }

    completedWork = node.returnFiber;
    attempt.workInProgress = completedWork;
  } while (completedWork);
}

void workLoopSync(ReconcilerRuntime& runtime, RenderAttempt& attempt) {
  while (attempt.workInProgress) {
    performUnitOfWork(runtime, attempt, attempt.workInProgress);
  }
}

void workLoopConcurrent(ReconcilerRuntime& runtime, RenderAttempt& attempt, const Scheduler& scheduler) {
  while (attempt.workInProgress && !scheduler.shouldYield()) {
    performUnitOfWork(runtime, attempt, attempt.workInProgress);
  }
}

RenderExitStatus renderRootSync(ReconcilerRuntime& runtime, RenderAttempt& attempt, FiberRoot& root, Lanes lanes) {
  prepareFreshStack(runtime, attempt, root, lanes);
  return runRenderShell(attempt, [&]() { workLoopSync(runtime, attempt); });
}

RenderExitStatus renderRootConcurrent(
  ReconcilerRuntime& runtime,
  RenderAttempt& attempt,
  FiberRoot& root,
  Lanes lanes,
  const Scheduler& scheduler,
  bool shouldTimeSlice) {
  const bool canResume = attempt.root == &root && attempt.renderLanes == lanes &&
      attempt.exitStatus == RenderExitStatus::Yielded && attempt.workInProgress;
  if (!canResume) {
    prepareFreshStack(runtime, attempt, root, lanes);
  }
  return runRenderShell(attempt, [&]() {
    if (shouldTimeSlice) {
      workLoopConcurrent(runtime, attempt, scheduler);
    } else {
      workLoopSync(runtime, attempt);
    }
  });
}

} // namespace fibercore
