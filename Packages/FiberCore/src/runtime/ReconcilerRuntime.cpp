#include "runtime/ReconcilerRuntime.h"

#include "host/MicrotaskHost.h"
#include "host/MutationHost.h"
#include "reconciler/FiberRootScheduler.h"
#include "reconciler/FiberUpdateQueue.h"
#include "reconciler/FiberWorkHandlers.h"
#include "runtime/JsiMicrotaskHost.h"
#include "scheduler/TaskScheduler.h"

#include "jsi/jsi.h"

#include <stdexcept>
#include <utility>

namespace jsi = facebook::jsi;

namespace fibercore {

ReconcilerRuntime::ReconcilerRuntime(jsi::Runtime& rt)
  : rt_(rt) {}

ReconcilerRuntime::~ReconcilerRuntime() = default;

void ReconcilerRuntime::setWorkHandlers(std::shared_ptr<FiberWorkHandlers> handlers) {
  workHandlers_ = std::move(handlers);
}

void ReconcilerRuntime::setMutationHost(std::shared_ptr<MutationHost> mutationHost) {
  mutationHost_ = std::move(mutationHost);
}

void ReconcilerRuntime::setMicrotaskHost(std::shared_ptr<MicrotaskHost> microtaskHost) {
  microtaskHost_ = std::move(microtaskHost);
}

void ReconcilerRuntime::setScheduler(std::shared_ptr<Scheduler> scheduler) {
  scheduler_ = std::move(scheduler);
}

jsi::Runtime& ReconcilerRuntime::jsiRuntime() {
  return rt_;
}

FiberArena& ReconcilerRuntime::arena() {
  return arena_;
}

const FiberArena& ReconcilerRuntime::arena() const {
  return arena_;
}

SyncTaskQueue& ReconcilerRuntime::syncTaskQueue() {
  return syncTaskQueue_;
}

FiberWorkHandlers& ReconcilerRuntime::workHandlers() {
  if (!workHandlers_) {
    throw std::logic_error("ReconcilerRuntime: no work handlers installed");
  }
  return *workHandlers_;
}

MutationHost& ReconcilerRuntime::mutationHost() {
  if (!mutationHost_) {
    throw std::logic_error("ReconcilerRuntime: no mutation host installed");
  }
  return *mutationHost_;
}

MicrotaskHost& ReconcilerRuntime::microtaskHost() {
  if (!microtaskHost_) {
    microtaskHost_ = std::make_shared<JsiMicrotaskHost>(rt_);
  }
  return *microtaskHost_;
}

Scheduler& ReconcilerRuntime::scheduler() {
  if (!scheduler_) {
    scheduler_ = std::make_shared<TaskScheduler>();
  }
  return *scheduler_;
}

FiberRoot& ReconcilerRuntime::createRoot(void* containerInfo) {
  roots_.push_back(createFiberRoot(arena_, containerInfo));
  return *roots_.back();
}

std::size_t ReconcilerRuntime::getRootCount() const {
  return roots_.size();
}

void ReconcilerRuntime::updateContainer(FiberRoot& root, const jsi::Value& element, Lane lane) {
  enqueueUpdate(rt_, arena_, root.current, element, lane);
  scheduleUpdateOnFiber(*this, root.current, lane);
}

void ReconcilerRuntime::scheduleUpdate(FiberHandle fiber, Lane lane) {
  scheduleUpdateOnFiber(*this, fiber, lane);
}

void ReconcilerRuntime::flushSyncCallbacks() {
  syncTaskQueue_.flushSyncCallbacks();
}

ExecutionContext ReconcilerRuntime::getExecutionContext() const {
  return executionContext_;
}

void ReconcilerRuntime::pushExecutionContext(ExecutionContext context) {
  executionContext_ = static_cast<ExecutionContext>(executionContext_ | context);
}

void ReconcilerRuntime::popExecutionContext(ExecutionContext context) {
  executionContext_ = static_cast<ExecutionContext>(executionContext_ & ~context);
}

void ReconcilerRuntime::setWorkInProgressRoot(FiberRoot* root) {
  workInProgressRoot_ = root;
}

FiberRoot* ReconcilerRuntime::getWorkInProgressRoot() const {
  return workInProgressRoot_;
}

bool ReconcilerRuntime::isWorkingOnRoot(const FiberRoot& root) const {
  return workInProgressRoot_ == &root &&
      (executionContext_ & (RenderContext | CommitContext)) != NoContext;
}

RenderAttempt& ReconcilerRuntime::concurrentAttempt(const FiberRoot& root) {
  return concurrentAttempts_[&root];
}

bool ReconcilerRuntime::hasConcurrentAttempt(const FiberRoot& root) const {
  return concurrentAttempts_.find(&root) != concurrentAttempts_.end();
}

void ReconcilerRuntime::discardConcurrentAttempt(const FiberRoot& root) {
  concurrentAttempts_.erase(&root);
}

std::weak_ptr<void> ReconcilerRuntime::lifetimeToken() const {
  return lifetimeToken_;
}

} // namespace fibercore
