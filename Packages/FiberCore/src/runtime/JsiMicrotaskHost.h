#pragma once

#include "host/MicrotaskHost.h"

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace fibercore {

// Posts tasks to the JSI runtime's microtask queue. The embedder drains them
// with Runtime::drainMicrotasks() at the end of each macrotask.
class JsiMicrotaskHost : public MicrotaskHost {
public:
  explicit JsiMicrotaskHost(facebook::jsi::Runtime& rt);

  void scheduleMicroTask(Task task) override;

private:
  facebook::jsi::Runtime& rt_;
};

} // namespace fibercore
