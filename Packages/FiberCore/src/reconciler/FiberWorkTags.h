#pragma once

#include <cstdint>

namespace fibercore {

enum class WorkTag : std::uint8_t {
  FunctionComponent = 0,
  HostRoot = 3,
  HostComponent = 5,
  HostText = 6,
  Fragment = 7,
};

} // namespace fibercore
