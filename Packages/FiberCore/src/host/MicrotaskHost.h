#pragma once

#include "scheduler/Scheduler.h"

namespace fibercore {

// Runs a task at the next microtask-equivalent turn of the host. Used only to
// flush the synchronous render queue.
class MicrotaskHost {
public:
  virtual ~MicrotaskHost() = default;

  virtual void scheduleMicroTask(Task task) = 0;
};

} // namespace fibercore
