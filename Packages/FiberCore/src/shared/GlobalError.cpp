#include "shared/GlobalError.h"

#include "shared/FiberFeatureFlags.h"

#include <exception>
#include <iostream>
#include <string>

namespace fibercore {

namespace {

void writeErrorMessage(const std::string& message) {
  std::cerr << "FiberCore global error: " << message << std::endl;
}

} // namespace

void reportGlobalError(const std::exception& ex) {
  writeErrorMessage(ex.what());
}

void reportGlobalError(const std::string& message) {
  writeErrorMessage(message);
}

void reportGlobalError() {
  writeErrorMessage("Unknown error");
}

void logSchedulingTrace(const std::string& message) {
  if (!enableSchedulingTrace) {
    return;
  }
  std::cerr << "[FiberCore] " << message << std::endl;
}

} // namespace fibercore
