#include "runtime/JsiMicrotaskHost.h"

#include "jsi/jsi.h"

#include <utility>

namespace jsi = facebook::jsi;

namespace fibercore {

JsiMicrotaskHost::JsiMicrotaskHost(jsi::Runtime& rt)
  : rt_(rt) {}

void JsiMicrotaskHost::scheduleMicroTask(Task task) {
  if (!task) {
    return;
  }

  jsi::Function callback = jsi::Function::createFromHostFunction(
    rt_,
    jsi::PropNameID::forAscii(rt_, "fibercoreMicrotask"),
    0,
    [task = std::move(task)](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      task();
      return jsi::Value::undefined();
    });
  rt_.queueMicrotask(callback);
}

} // namespace fibercore
