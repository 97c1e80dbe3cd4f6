#pragma once

#include "reconciler/FiberArena.h"
#include "reconciler/FiberLane.h"
#include "reconciler/FiberRoot.h"
#include "reconciler/FiberWorkLoopState.h"
#include "scheduler/Scheduler.h"
#include "scheduler/SyncTaskQueue.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace facebook {
namespace jsi {
class Runtime;
class Value;
} // namespace jsi
} // namespace facebook

namespace fibercore {

class FiberWorkHandlers;
class MicrotaskHost;
class MutationHost;

using ExecutionContext = std::uint8_t;

inline constexpr ExecutionContext NoContext = 0b000;
inline constexpr ExecutionContext RenderContext = 0b010;
inline constexpr ExecutionContext CommitContext = 0b100;

// Owns the fiber arena, the roots and the scheduling state of one reconciler
// instance. Collaborators are injected; the microtask host defaults to the
// JSI runtime's microtask queue and the scheduler to a TaskScheduler.
//
// Microtasks and scheduler tasks posted by this runtime may outlive it when
// the hosts are shared. They hold lifetimeToken() and do nothing once the
// runtime is destroyed.
class ReconcilerRuntime {
public:
  explicit ReconcilerRuntime(facebook::jsi::Runtime& rt);
  ~ReconcilerRuntime();

  ReconcilerRuntime(const ReconcilerRuntime&) = delete;
  ReconcilerRuntime& operator=(const ReconcilerRuntime&) = delete;

  void setWorkHandlers(std::shared_ptr<FiberWorkHandlers> handlers);
  void setMutationHost(std::shared_ptr<MutationHost> mutationHost);
  void setMicrotaskHost(std::shared_ptr<MicrotaskHost> microtaskHost);
  void setScheduler(std::shared_ptr<Scheduler> scheduler);

  facebook::jsi::Runtime& jsiRuntime();
  FiberArena& arena();
  const FiberArena& arena() const;
  SyncTaskQueue& syncTaskQueue();

  FiberWorkHandlers& workHandlers();
  MutationHost& mutationHost();
  MicrotaskHost& microtaskHost();
  Scheduler& scheduler();

  FiberRoot& createRoot(void* containerInfo = nullptr);
  [[nodiscard]] std::size_t getRootCount() const;

  // Enqueues `element` on the root's HostRoot fiber and schedules it.
  void updateContainer(FiberRoot& root, const facebook::jsi::Value& element, Lane lane);
  void scheduleUpdate(FiberHandle fiber, Lane lane);
  void flushSyncCallbacks();

  ExecutionContext getExecutionContext() const;
  void pushExecutionContext(ExecutionContext context);
  void popExecutionContext(ExecutionContext context);
  void setWorkInProgressRoot(FiberRoot* root);
  [[nodiscard]] FiberRoot* getWorkInProgressRoot() const;
  [[nodiscard]] bool isWorkingOnRoot(const FiberRoot& root) const;

  // Yielded concurrent attempt parked for `root` between scheduler slices.
  RenderAttempt& concurrentAttempt(const FiberRoot& root);
  [[nodiscard]] bool hasConcurrentAttempt(const FiberRoot& root) const;
  void discardConcurrentAttempt(const FiberRoot& root);

  [[nodiscard]] std::weak_ptr<void> lifetimeToken() const;

private:
  facebook::jsi::Runtime& rt_;
  FiberArena arena_{};
  SyncTaskQueue syncTaskQueue_{};
  std::vector<std::unique_ptr<FiberRoot>> roots_{};

  std::shared_ptr<FiberWorkHandlers> workHandlers_{};
  std::shared_ptr<MutationHost> mutationHost_{};
  std::shared_ptr<MicrotaskHost> microtaskHost_{};
  std::shared_ptr<Scheduler> scheduler_{};

  ExecutionContext executionContext_{NoContext};
  FiberRoot* workInProgressRoot_{nullptr};
  std::unordered_map<const FiberRoot*, RenderAttempt> concurrentAttempts_{};
  std::shared_ptr<void> lifetimeToken_{std::make_shared<int>(0)};
};

} // namespace fibercore
