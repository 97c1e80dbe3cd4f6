#include "reconciler/FiberArena.h"

#include "jsi/jsi.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace jsi = facebook::jsi;

namespace fibercore {

FiberHandle FiberArena::createFiber(WorkTag tag, jsi::Value pendingProps, std::string key) {
  Slot slot{};
  slot[0] = std::make_unique<FiberNode>(tag, std::move(pendingProps), std::move(key));
  slots_.push_back(std::move(slot));
  ++allocatedNodes_;
  return FiberHandle{static_cast<std::uint32_t>(slots_.size() - 1), 0};
}

FiberHandle FiberArena::createWorkInProgress(
  jsi::Runtime& rt,
  FiberHandle current,
  jsi::Value pendingProps) {
  FiberNode& currentFiber = get(current);
  const FiberHandle handle = current.pairedBuffer();
  auto& storage = slots_[handle.slot][handle.buffer];

  if (!storage) {
    storage = std::make_unique<FiberNode>(currentFiber.tag, std::move(pendingProps), currentFiber.key);
    storage->stateNode = currentFiber.stateNode;
    ++allocatedNodes_;
  } else {
    storage->pendingProps = std::move(pendingProps);
    storage->flags = NoFlags;
    storage->subtreeFlags = NoFlags;
  }

  FiberNode& workInProgress = *storage;
  workInProgress.child = currentFiber.child;
  workInProgress.sibling = currentFiber.sibling;
  workInProgress.returnFiber = currentFiber.returnFiber;
  workInProgress.index = currentFiber.index;
  workInProgress.memoizedProps = jsi::Value(rt, currentFiber.memoizedProps);
  workInProgress.memoizedState = jsi::Value(rt, currentFiber.memoizedState);
  workInProgress.updateQueue = currentFiber.updateQueue;
  workInProgress.lanes = currentFiber.lanes;
  workInProgress.childLanes = currentFiber.childLanes;

  return handle;
}

FiberHandle FiberArena::alternateOf(FiberHandle handle) const {
  if (!contains(handle)) {
    return NoFiber;
  }
  const FiberHandle paired = handle.pairedBuffer();
  return contains(paired) ? paired : NoFiber;
}

bool FiberArena::contains(FiberHandle handle) const {
  return handle && handle.buffer < 2 && handle.slot < slots_.size() &&
      slots_[handle.slot][handle.buffer] != nullptr;
}

FiberNode& FiberArena::get(FiberHandle handle) {
  if (!contains(handle)) {
    throw std::out_of_range("FiberArena: no fiber at slot " + std::to_string(handle.slot));
  }
  return *slots_[handle.slot][handle.buffer];
}

const FiberNode& FiberArena::get(FiberHandle handle) const {
  if (!contains(handle)) {
    throw std::out_of_range("FiberArena: no fiber at slot " + std::to_string(handle.slot));
  }
  return *slots_[handle.slot][handle.buffer];
}

std::size_t FiberArena::slotCount() const {
  return slots_.size();
}

std::size_t FiberArena::allocatedNodeCount() const {
  return allocatedNodes_;
}

void FiberArena::clear() {
  slots_.clear();
  allocatedNodes_ = 0;
}

} // namespace fibercore
