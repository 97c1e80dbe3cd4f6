#pragma once

#include "reconciler/FiberLane.h"
#include "reconciler/FiberNode.h"

#include <optional>
#include <string>
#include <utility>

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace fibercore {

class FiberArena;

struct WorkError {
  FiberHandle fiber{};
  std::string message;
};

struct BeginWorkResult {
  FiberHandle next{};
  std::optional<WorkError> error{};

  static BeginWorkResult descend(FiberHandle child) {
    return BeginWorkResult{child, std::nullopt};
  }

  static BeginWorkResult leaf() {
    return BeginWorkResult{};
  }

  static BeginWorkResult failed(FiberHandle fiber, std::string message) {
    return BeginWorkResult{NoFiber, WorkError{fiber, std::move(message)}};
  }
};

// Per-node reconciliation supplied by the renderer. beginWork decides the
// children of a work-in-progress fiber and returns the first one to descend
// into; completeWork finalizes a fiber once all of its children completed,
// usually bubbling child flags into subtreeFlags.
class FiberWorkHandlers {
public:
  virtual ~FiberWorkHandlers() = default;

  virtual BeginWorkResult beginWork(
    FiberArena& arena,
    facebook::jsi::Runtime& rt,
    FiberHandle workInProgress,
    Lanes renderLanes) = 0;

  virtual std::optional<WorkError> completeWork(
    FiberArena& arena,
    facebook::jsi::Runtime& rt,
    FiberHandle workInProgress) = 0;
};

} // namespace fibercore
