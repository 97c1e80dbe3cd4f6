#pragma once

#include "scheduler/Scheduler.h"

#include <cstddef>
#include <vector>

namespace fibercore {

// Pending synchronous render callbacks, drained at the microtask boundary.
class SyncTaskQueue {
public:
  void scheduleSyncCallback(Task callback);

  // Runs every queued callback in FIFO order, including ones queued while
  // flushing. A nested call during a flush, or a call on an empty queue, does
  // nothing.
  void flushSyncCallbacks();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool isFlushing() const;

private:
  std::vector<Task> queue_{};
  bool isFlushing_{false};
};

} // namespace fibercore
