#pragma once

#include <cstdint>

namespace fibercore {

using FiberFlags = std::uint32_t;

inline constexpr FiberFlags NoFlags = 0b0000000000000000000000000000;
inline constexpr FiberFlags PerformedWork = 0b0000000000000000000000000001;
inline constexpr FiberFlags Placement = 0b0000000000000000000000000010;
inline constexpr FiberFlags Update = 0b0000000000000000000000000100;
inline constexpr FiberFlags ChildDeletion = 0b0000000000000000000000010000;
inline constexpr FiberFlags ContentReset = 0b0000000000000000000000100000;
inline constexpr FiberFlags Ref = 0b0000000000000000001000000000;
inline constexpr FiberFlags Passive = 0b0000000000000000100000000000;

inline constexpr FiberFlags MutationMask = Placement | Update | ChildDeletion | ContentReset;

constexpr bool hasMutationEffects(FiberFlags flags) {
  return (flags & MutationMask) != NoFlags;
}

} // namespace fibercore
