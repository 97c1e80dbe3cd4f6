#include "reconciler/FiberCommitWork.h"

#include "host/MutationHost.h"
#include "reconciler/FiberArena.h"
#include "reconciler/FiberFlags.h"
#include "reconciler/FiberRoot.h"
#include "reconciler/FiberRootScheduler.h"
#include "runtime/ReconcilerRuntime.h"
#include "shared/GlobalError.h"

#include <string>

namespace fibercore {

void commitRoot(ReconcilerRuntime& runtime, FiberRoot& root) {
  const FiberHandle finishedWork = root.finishedWork;
  if (!finishedWork) {
    return;
  }

  logSchedulingTrace("commit start at slot " + std::to_string(finishedWork.slot));

  root.finishedWork = NoFiber;
  const Lanes finishedLanes = root.finishedLanes;
  root.finishedLanes = NoLanes;

  const FiberNode& finished = runtime.arena().get(finishedWork);
  const bool subtreeHasEffect = hasMutationEffects(finished.subtreeFlags);
  const bool rootHasEffect = hasMutationEffects(finished.flags);

  if (subtreeHasEffect || rootHasEffect) {
    runtime.mutationHost().commitMutationEffects(runtime.arena(), runtime.jsiRuntime(), finishedWork);
  }

  // The finished buffer becomes current; the old one is its alternate and is
  // reused by the next render.
  root.current = finishedWork;

  const Lanes remainingLanes =
      mergeLanes(removeLanes(root.pendingLanes, finishedLanes), root.interleavedUpdatedLanes);
  root.interleavedUpdatedLanes = NoLanes;
  markRootFinished(root, remainingLanes);

  // Lanes merged during the walk, or lower-priority lanes, still need a render.
  ensureRootIsScheduled(runtime, root);
}

} // namespace fibercore
