#pragma once

#include "reconciler/FiberNode.h"

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace fibercore {

class FiberArena;

// MutationHost applies the host-level inserts, updates and removals recorded in
// the flags of a finished tree (e.g. DOM, custom UI).
class MutationHost {
public:
  virtual ~MutationHost() = default;

  virtual void commitMutationEffects(
    FiberArena& arena,
    facebook::jsi::Runtime& rt,
    FiberHandle finishedWork) = 0;
};

} // namespace fibercore
