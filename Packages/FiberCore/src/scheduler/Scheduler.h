#pragma once

#include <cstdint>
#include <functional>

namespace fibercore {

using Task = std::function<void()>;

enum class SchedulerPriority : std::uint8_t {
  NoPriority = 0,
  ImmediatePriority = 1,
  UserBlockingPriority = 2,
  NormalPriority = 3,
  LowPriority = 4,
  IdlePriority = 5,
};

struct TaskOptions {
  double timeoutMs{0.0};
};

struct TaskHandle {
  std::uint64_t id{0};

  explicit operator bool() const {
    return id != 0;
  }

  bool operator==(const TaskHandle& other) const {
    return id == other.id;
  }

  bool operator!=(const TaskHandle& other) const {
    return id != other.id;
  }
};

// Yieldable task primitive used for every lane below SyncLane.
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual TaskHandle scheduleTask(
    SchedulerPriority priority,
    Task task,
    const TaskOptions& options = {}) = 0;

  virtual void cancelTask(TaskHandle handle) = 0;

  virtual SchedulerPriority getCurrentPriorityLevel() const = 0;

  virtual bool shouldYield() const = 0;

  virtual double now() const = 0;
};

constexpr const char* priorityName(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::NoPriority:
      return "NoPriority";
    case SchedulerPriority::ImmediatePriority:
      return "ImmediatePriority";
    case SchedulerPriority::UserBlockingPriority:
      return "UserBlockingPriority";
    case SchedulerPriority::NormalPriority:
      return "NormalPriority";
    case SchedulerPriority::LowPriority:
      return "LowPriority";
    case SchedulerPriority::IdlePriority:
      return "IdlePriority";
    default:
      return "Unknown";
  }
}

} // namespace fibercore
