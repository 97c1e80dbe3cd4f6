#pragma once

#include "TestRuntime.h"

#include "host/MicrotaskHost.h"
#include "host/MutationHost.h"
#include "reconciler/FiberArena.h"
#include "reconciler/FiberFlags.h"
#include "reconciler/FiberRoot.h"
#include "reconciler/FiberUpdateQueue.h"
#include "reconciler/FiberWorkHandlers.h"
#include "runtime/ReconcilerRuntime.h"
#include "scheduler/TaskScheduler.h"

#include "jsi/jsi.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fibercore::test {

// Reconciles a keyed tree described by childrenOf/propsOf. The HostRoot is
// named "root"; every other fiber is named by its key. Each visit is appended
// to `log` as "begin:<name>" or "complete:<name>".
class RecordingWorkHandlers : public FiberWorkHandlers {
public:
  std::unordered_map<std::string, std::vector<std::string>> childrenOf;
  std::unordered_map<std::string, double> propsOf;

  std::vector<std::string> log;
  std::size_t beginCount{0};

  // 1-based beginWork visit that fails; 0 never fails.
  std::size_t failBeginAt{0};
  bool throwOnFailure{false};
  // With throwOnFailure, throw an int instead of a std::exception.
  bool throwNonStandard{false};
  std::string failCompleteOn;

  std::function<void(FiberHandle)> onBegin;

  void resetLog() {
    log.clear();
    beginCount = 0;
  }

  BeginWorkResult beginWork(
    FiberArena& arena,
    facebook::jsi::Runtime& rt,
    FiberHandle workInProgress,
    Lanes renderLanes) override {
    ++beginCount;
    const std::string name = nameOf(arena.get(workInProgress));
    log.push_back("begin:" + name);

    if (onBegin) {
      onBegin(workInProgress);
    }

    if (failBeginAt != 0 && beginCount == failBeginAt) {
      if (throwOnFailure && throwNonStandard) {
        throw 42;
      }
      if (throwOnFailure) {
        throw std::runtime_error("beginWork threw at " + name);
      }
      return BeginWorkResult::failed(workInProgress, "beginWork failed at " + name);
    }

    if (arena.get(workInProgress).tag == WorkTag::HostRoot) {
      processUpdateQueue(rt, arena, workInProgress, renderLanes);
    }

    const FiberHandle first = reconcileChildren(arena, rt, workInProgress, childrenOf[name]);
    return first ? BeginWorkResult::descend(first) : BeginWorkResult::leaf();
  }

  std::optional<WorkError> completeWork(
    FiberArena& arena,
    facebook::jsi::Runtime&,
    FiberHandle workInProgress) override {
    FiberNode& node = arena.get(workInProgress);
    const std::string name = nameOf(node);
    log.push_back("complete:" + name);

    if (!failCompleteOn.empty() && failCompleteOn == name) {
      return WorkError{workInProgress, "completeWork failed at " + name};
    }

    FiberFlags subtreeFlags = NoFlags;
    for (FiberHandle child = node.child; child; child = arena.get(child).sibling) {
      const FiberNode& childNode = arena.get(child);
      subtreeFlags |= childNode.flags | childNode.subtreeFlags;
    }
    node.subtreeFlags = subtreeFlags;
    return std::nullopt;
  }

  static std::string nameOf(const FiberNode& node) {
    return node.tag == WorkTag::HostRoot ? std::string("root") : node.key;
  }

private:
  FiberHandle reconcileChildren(
    FiberArena& arena,
    facebook::jsi::Runtime& rt,
    FiberHandle workInProgress,
    const std::vector<std::string>& keys) {
    std::unordered_map<std::string, FiberHandle> existing;
    const FiberHandle current = arena.alternateOf(workInProgress);
    if (current) {
      for (FiberHandle child = arena.get(current).child; child; child = arena.get(child).sibling) {
        existing[arena.get(child).key] = child;
      }
    }

    FiberHandle first = NoFiber;
    FiberHandle previous = NoFiber;
    std::uint32_t index = 0;
    for (const std::string& key : keys) {
      const auto propsIt = propsOf.find(key);
      const double props = propsIt != propsOf.end() ? propsIt->second : 0.0;

      FiberHandle child = NoFiber;
      const auto existingIt = existing.find(key);
      if (existingIt != existing.end()) {
        child = arena.createWorkInProgress(rt, existingIt->second, facebook::jsi::Value(props));
        FiberNode& reused = arena.get(child);
        if (!reused.memoizedProps.isNumber() || reused.memoizedProps.getNumber() != props) {
          reused.flags |= Update;
        }
        existing.erase(existingIt);
      } else {
        child = arena.createFiber(WorkTag::HostComponent, facebook::jsi::Value(props), key);
        arena.get(child).flags |= Placement;
      }

      FiberNode& childNode = arena.get(child);
      childNode.returnFiber = workInProgress;
      childNode.sibling = NoFiber;
      childNode.index = index++;
      if (previous) {
        arena.get(previous).sibling = child;
      } else {
        first = child;
      }
      previous = child;
    }

    FiberNode& parent = arena.get(workInProgress);
    if (!existing.empty()) {
      parent.flags |= ChildDeletion;
    }
    parent.child = first;
    return first;
  }
};

class RecordingMutationHost : public MutationHost {
public:
  std::vector<FiberHandle> commits;

  void commitMutationEffects(
    FiberArena&,
    facebook::jsi::Runtime&,
    FiberHandle finishedWork) override {
    commits.push_back(finishedWork);
  }
};

// Holds microtasks until the test ends the "macrotask" with runAll().
class ManualMicrotaskHost : public MicrotaskHost {
public:
  std::vector<Task> tasks;
  std::size_t scheduledCount{0};

  void scheduleMicroTask(Task task) override {
    ++scheduledCount;
    tasks.push_back(std::move(task));
  }

  void runAll() {
    for (std::size_t index = 0; index < tasks.size(); ++index) {
      Task task = std::move(tasks[index]);
      task();
    }
    tasks.clear();
  }
};

struct ManualClock {
  double time{0.0};

  TaskScheduler::Clock clock() {
    return [this]() { return time; };
  }
};

// A runtime wired to the recording collaborators above, with one root whose
// committed tree starts empty.
struct ReconcilerFixture {
  TestRuntime rt;
  ReconcilerRuntime runtime{rt};
  ManualClock clock;
  std::shared_ptr<RecordingWorkHandlers> handlers{std::make_shared<RecordingWorkHandlers>()};
  std::shared_ptr<RecordingMutationHost> mutations{std::make_shared<RecordingMutationHost>()};
  std::shared_ptr<ManualMicrotaskHost> microtasks{std::make_shared<ManualMicrotaskHost>()};
  std::shared_ptr<TaskScheduler> scheduler{std::make_shared<TaskScheduler>(clock.clock())};
  FiberRoot* root{nullptr};

  ReconcilerFixture() {
    runtime.setWorkHandlers(handlers);
    runtime.setMutationHost(mutations);
    runtime.setMicrotaskHost(microtasks);
    runtime.setScheduler(scheduler);
    root = &runtime.createRoot();
  }

  ReconcilerFixture(const ReconcilerFixture&) = delete;
  ReconcilerFixture& operator=(const ReconcilerFixture&) = delete;

  FiberArena& arena() {
    return runtime.arena();
  }

  FiberNode& current() {
    return runtime.arena().get(root->current);
  }

  // Committed child of the current HostRoot with the given key.
  FiberHandle committedChild(const std::string& key) {
    for (FiberHandle child = current().child; child; child = arena().get(child).sibling) {
      if (arena().get(child).key == key) {
        return child;
      }
    }
    return NoFiber;
  }

  std::size_t beginVisits(const std::string& name) const {
    std::size_t count = 0;
    for (const std::string& entry : handlers->log) {
      if (entry == "begin:" + name) {
        ++count;
      }
    }
    return count;
  }
};

} // namespace fibercore::test
