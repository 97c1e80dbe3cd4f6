#pragma once

#include "reconciler/FiberWorkHandlers.h"

namespace fibercore {

struct FiberRoot;

void logRenderError(const FiberRoot& root, const WorkError& error);

} // namespace fibercore
