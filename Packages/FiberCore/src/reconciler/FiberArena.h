#pragma once

#include "reconciler/FiberNode.h"

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace fibercore {

// Owns every fiber. Each tree position is a slot of two buffers: the committed
// node and its work-in-progress counterpart. Links between fibers are handles,
// never owning pointers.
class FiberArena {
public:
  FiberArena() = default;
  FiberArena(const FiberArena&) = delete;
  FiberArena& operator=(const FiberArena&) = delete;

  FiberHandle createFiber(WorkTag tag, facebook::jsi::Value pendingProps, std::string key = {});

  // Returns the paired buffer of `current`, allocating it on the slot's first
  // use and resetting its effect state otherwise.
  FiberHandle createWorkInProgress(
    facebook::jsi::Runtime& rt,
    FiberHandle current,
    facebook::jsi::Value pendingProps);

  [[nodiscard]] FiberHandle alternateOf(FiberHandle handle) const;
  [[nodiscard]] bool contains(FiberHandle handle) const;

  FiberNode& get(FiberHandle handle);
  const FiberNode& get(FiberHandle handle) const;

  [[nodiscard]] std::size_t slotCount() const;
  [[nodiscard]] std::size_t allocatedNodeCount() const;

  void clear();

private:
  using Slot = std::array<std::unique_ptr<FiberNode>, 2>;

  std::vector<Slot> slots_{};
  std::size_t allocatedNodes_{0};
};

} // namespace fibercore
