#pragma once

#include "scheduler/Scheduler.h"
#include "scheduler/SchedulerMinHeap.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace fibercore {

struct SchedulerTask {
  std::uint64_t id{0};
  double sortIndex{0.0};
  Task callback;
  SchedulerPriority priorityLevel{SchedulerPriority::NormalPriority};
  double startTime{0.0};
  double expirationTime{0.0};
};

// Cooperative priority scheduler. The host calls flushWork() from its
// macrotask loop; tasks run in expiration order until the frame budget is
// spent. A clock can be injected for deterministic tests.
class TaskScheduler : public Scheduler {
public:
  using Clock = std::function<double()>;

  TaskScheduler();
  explicit TaskScheduler(Clock clock);
  ~TaskScheduler() override = default;

  TaskHandle scheduleTask(
    SchedulerPriority priority,
    Task task,
    const TaskOptions& options = {}) override;

  void cancelTask(TaskHandle handle) override;

  SchedulerPriority getCurrentPriorityLevel() const override;

  bool shouldYield() const override;

  double now() const override;

  // Runs queued tasks until the queue is empty or the slice is used up.
  // Returns true when work remains.
  bool flushWork();

  void forceFrameRate(double fps);

  [[nodiscard]] bool hasPendingWork() const;

private:
  double priorityTimeout(SchedulerPriority priority) const;

  SchedulerMinHeap<SchedulerTask> taskQueue_{};
  std::unordered_map<std::uint64_t, std::unique_ptr<SchedulerTask>> tasks_{};
  std::uint64_t nextTaskId_{1};
  SchedulerPriority currentPriorityLevel_{SchedulerPriority::NormalPriority};
  bool isPerformingWork_{false};
  double frameInterval_;
  double sliceStartTime_{-1.0};
  Clock clock_;
  std::chrono::steady_clock::time_point baseTime_;
};

} // namespace fibercore
