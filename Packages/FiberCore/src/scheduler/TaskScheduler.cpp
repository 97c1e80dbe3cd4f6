#include "scheduler/TaskScheduler.h"

#include "shared/FiberFeatureFlags.h"
#include "shared/GlobalError.h"

#include <exception>
#include <utility>

namespace fibercore {

TaskScheduler::TaskScheduler()
  : frameInterval_(frameYieldMs),
    baseTime_(std::chrono::steady_clock::now()) {}

TaskScheduler::TaskScheduler(Clock clock)
  : frameInterval_(frameYieldMs),
    clock_(std::move(clock)),
    baseTime_(std::chrono::steady_clock::now()) {}

TaskHandle TaskScheduler::scheduleTask(
  SchedulerPriority priority,
  Task task,
  const TaskOptions& options) {
  const double currentTime = now();
  const double timeout = options.timeoutMs > 0.0 ? options.timeoutMs : priorityTimeout(priority);

  auto entry = std::make_unique<SchedulerTask>();
  entry->id = nextTaskId_++;
  entry->callback = std::move(task);
  entry->priorityLevel = priority;
  entry->startTime = currentTime;
  entry->expirationTime = currentTime + timeout;
  entry->sortIndex = entry->expirationTime;

  SchedulerTask* raw = entry.get();
  tasks_.emplace(raw->id, std::move(entry));
  taskQueue_.push(raw);

  return TaskHandle{raw->id};
}

void TaskScheduler::cancelTask(TaskHandle handle) {
  if (!handle) {
    return;
  }
  // The heap entry stays queued; a null callback marks it cancelled.
  auto it = tasks_.find(handle.id);
  if (it != tasks_.end()) {
    it->second->callback = nullptr;
  }
}

SchedulerPriority TaskScheduler::getCurrentPriorityLevel() const {
  return currentPriorityLevel_;
}

bool TaskScheduler::shouldYield() const {
  if (!isPerformingWork_ || sliceStartTime_ < 0.0) {
    return false;
  }
  return now() - sliceStartTime_ >= frameInterval_;
}

double TaskScheduler::now() const {
  if (clock_) {
    return clock_();
  }
  const auto elapsed = std::chrono::steady_clock::now() - baseTime_;
  return std::chrono::duration<double, std::milli>(elapsed).count();
}

bool TaskScheduler::flushWork() {
  if (isPerformingWork_) {
    return hasPendingWork();
  }

  isPerformingWork_ = true;
  sliceStartTime_ = now();
  const SchedulerPriority previousPriority = currentPriorityLevel_;

  SchedulerTask* currentTask = taskQueue_.peek();
  while (currentTask != nullptr) {
    const double currentTime = now();
    if (currentTask->expirationTime > currentTime && shouldYield()) {
      break;
    }

    taskQueue_.pop();
    Task callback = std::move(currentTask->callback);
    currentTask->callback = nullptr;
    const SchedulerPriority taskPriority = currentTask->priorityLevel;
    tasks_.erase(currentTask->id);

    if (callback) {
      currentPriorityLevel_ = taskPriority;
      try {
        callback();
      } catch (const std::exception& ex) {
        reportGlobalError(ex);
      } catch (...) {
        reportGlobalError();
      }
    }

    currentTask = taskQueue_.peek();
  }

  currentPriorityLevel_ = previousPriority;
  isPerformingWork_ = false;
  sliceStartTime_ = -1.0;

  return hasPendingWork();
}

void TaskScheduler::forceFrameRate(double fps) {
  if (fps < 0.0 || fps > 125.0) {
    return;
  }
  frameInterval_ = fps > 0.0 ? 1000.0 / fps : frameYieldMs;
}

bool TaskScheduler::hasPendingWork() const {
  return !taskQueue_.empty();
}

double TaskScheduler::priorityTimeout(SchedulerPriority priority) const {
  switch (priority) {
    case SchedulerPriority::ImmediatePriority:
      return -1.0;
    case SchedulerPriority::UserBlockingPriority:
      return userBlockingPriorityTimeout;
    case SchedulerPriority::LowPriority:
      return lowPriorityTimeout;
    case SchedulerPriority::IdlePriority:
      return maxSigned31BitInt;
    case SchedulerPriority::NormalPriority:
    case SchedulerPriority::NoPriority:
    default:
      return normalPriorityTimeout;
  }
}

} // namespace fibercore
