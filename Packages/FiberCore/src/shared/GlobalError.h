#pragma once

#include <exception>
#include <string>

namespace fibercore {

void reportGlobalError(const std::exception& ex);
void reportGlobalError(const std::string& message);
void reportGlobalError();

// No-op unless enableSchedulingTrace is set.
void logSchedulingTrace(const std::string& message);

} // namespace fibercore
