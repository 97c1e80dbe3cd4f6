#include "reconciler/FiberErrorLogger.h"

#include "reconciler/FiberRoot.h"

#include <iostream>

namespace fibercore {

void logRenderError(const FiberRoot& root, const WorkError& error) {
  std::cerr << "FiberCore render abandoned on root " << &root;
  if (error.fiber) {
    std::cerr << " at fiber slot " << error.fiber.slot;
  }
  std::cerr << ": " << error.message << std::endl;
}

} // namespace fibercore
