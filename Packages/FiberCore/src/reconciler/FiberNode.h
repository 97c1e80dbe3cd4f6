#pragma once

#include "jsi/jsi.h"
#include "reconciler/FiberFlags.h"
#include "reconciler/FiberLane.h"
#include "reconciler/FiberWorkTags.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace fibercore {

struct UpdateQueue;

// Addresses one buffer of one tree position in a FiberArena. The other buffer
// of the same slot is the alternate.
struct FiberHandle {
  static constexpr std::uint32_t kInvalidSlot = std::numeric_limits<std::uint32_t>::max();

  std::uint32_t slot{kInvalidSlot};
  std::uint8_t buffer{0};

  explicit operator bool() const {
    return slot != kInvalidSlot;
  }

  bool operator==(const FiberHandle& other) const {
    return slot == other.slot && buffer == other.buffer;
  }

  bool operator!=(const FiberHandle& other) const {
    return !(*this == other);
  }

  FiberHandle pairedBuffer() const {
    return FiberHandle{slot, static_cast<std::uint8_t>(buffer ^ 1u)};
  }
};

inline constexpr FiberHandle NoFiber{};

struct FiberNode {
  FiberNode(WorkTag tagValue, facebook::jsi::Value pendingPropsValue, std::string keyValue)
    : tag(tagValue),
      key(std::move(keyValue)),
      pendingProps(std::move(pendingPropsValue)) {}

  WorkTag tag;
  std::string key;
  void* stateNode{nullptr};

  FiberHandle returnFiber{};
  FiberHandle child{};
  FiberHandle sibling{};
  std::uint32_t index{0};

  facebook::jsi::Value pendingProps;
  facebook::jsi::Value memoizedProps{facebook::jsi::Value::undefined()};
  facebook::jsi::Value memoizedState{facebook::jsi::Value::undefined()};
  std::shared_ptr<UpdateQueue> updateQueue;

  Lanes lanes{NoLanes};
  Lanes childLanes{NoLanes};

  FiberFlags flags{NoFlags};
  FiberFlags subtreeFlags{NoFlags};
};

} // namespace fibercore
