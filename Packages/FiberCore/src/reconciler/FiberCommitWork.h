#pragma once

namespace fibercore {

class ReconcilerRuntime;
struct FiberRoot;

// Applies root.finishedWork, swaps it in as root.current and retires the
// committed lanes. Does nothing when no finished tree is waiting.
void commitRoot(ReconcilerRuntime& runtime, FiberRoot& root);

} // namespace fibercore
