#include "scheduler/SyncTaskQueue.h"

#include "shared/GlobalError.h"

#include <exception>
#include <utility>

namespace fibercore {

void SyncTaskQueue::scheduleSyncCallback(Task callback) {
  if (!callback) {
    return;
  }
  queue_.push_back(std::move(callback));
}

void SyncTaskQueue::flushSyncCallbacks() {
  if (isFlushing_ || queue_.empty()) {
    return;
  }

  // Leaves the queue empty and idle however the drain ends.
  struct FlushScope {
    SyncTaskQueue& queue;
    ~FlushScope() {
      queue.queue_.clear();
      queue.isFlushing_ = false;
    }
  };

  isFlushing_ = true;
  FlushScope scope{*this};
  std::size_t index = 0;
  // Index loop: callbacks may append to queue_ while it is being drained.
  while (index < queue_.size()) {
    Task callback = std::move(queue_[index]);
    ++index;
    try {
      callback();
    } catch (const std::exception& ex) {
      reportGlobalError(ex);
    } catch (...) {
      reportGlobalError();
    }
  }
}

std::size_t SyncTaskQueue::size() const {
  return queue_.size();
}

bool SyncTaskQueue::isFlushing() const {
  return isFlushing_;
}

} // namespace fibercore
