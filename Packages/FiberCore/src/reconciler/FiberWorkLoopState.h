#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberNode.h"
#include "reconciler/FiberWorkHandlers.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace fibercore {

struct FiberRoot;

enum class RenderExitStatus : std::uint8_t {
  InProgress = 0,
  Completed = 1,
  Yielded = 2,
  WalkAborted = 3,
};

// State of one render attempt. A sync attempt lives on the stack of
// performSyncWorkOnRoot; a concurrent attempt is parked in the runtime between
// scheduler slices.
struct RenderAttempt {
  FiberRoot* root{nullptr};
  FiberHandle workInProgress{};
  Lanes renderLanes{NoLanes};
  RenderExitStatus exitStatus{RenderExitStatus::InProgress};
  std::optional<WorkError> error{};
  std::size_t unitsOfWork{0};
};

} // namespace fibercore
