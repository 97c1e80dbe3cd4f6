#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace fibercore {

using Lane = std::uint32_t;
using Lanes = std::uint32_t;

inline constexpr std::uint32_t TotalLanes = 31;

inline constexpr double NoTimestamp = -1.0;

inline constexpr Lanes NoLanes = 0b0000000000000000000000000000000;
inline constexpr Lane NoLane = 0b0000000000000000000000000000000;

// Bit 0 and the even bits below DefaultLane are reserved for hydration lanes,
// which this engine does not define. SyncLane is therefore the most urgent lane.
inline constexpr Lane SyncLane = 1u << 1;
inline constexpr std::uint32_t SyncLaneIndex = 1;
inline constexpr Lane InputContinuousLane = 1u << 3;
inline constexpr Lane DefaultLane = 1u << 5;

inline constexpr Lanes TransitionLanes = 0b0000000001111111111111100000000;
inline constexpr Lane TransitionLane1 = 1u << 8;
inline constexpr Lane TransitionLane2 = 1u << 9;
inline constexpr Lane TransitionLane3 = 1u << 10;
inline constexpr Lane TransitionLane4 = 1u << 11;
inline constexpr Lane TransitionLane5 = 1u << 12;
inline constexpr Lane TransitionLane6 = 1u << 13;
inline constexpr Lane TransitionLane7 = 1u << 14;
inline constexpr Lane TransitionLane8 = 1u << 15;
inline constexpr Lane TransitionLane9 = 1u << 16;
inline constexpr Lane TransitionLane10 = 1u << 17;
inline constexpr Lane TransitionLane11 = 1u << 18;
inline constexpr Lane TransitionLane12 = 1u << 19;
inline constexpr Lane TransitionLane13 = 1u << 20;
inline constexpr Lane TransitionLane14 = 1u << 21;

inline constexpr Lanes RetryLanes = 0b0000011110000000000000000000000;
inline constexpr Lane RetryLane1 = 1u << 22;
inline constexpr Lane RetryLane2 = 1u << 23;
inline constexpr Lane RetryLane3 = 1u << 24;
inline constexpr Lane RetryLane4 = 1u << 25;

inline constexpr Lane IdleLane = 1u << 28;
inline constexpr Lane OffscreenLane = 1u << 29;

inline constexpr Lanes NonIdleLanes = 0b0000111111111111111111111111111;

enum class LanePriority : std::uint8_t {
  NoLanePriority = 0,
  SyncLanePriority = 1,
  InputContinuousLanePriority = 2,
  DefaultLanePriority = 3,
  TransitionLanePriority = 4,
  RetryLanePriority = 5,
  IdleLanePriority = 6,
  OffscreenLanePriority = 7,
};

constexpr Lanes mergeLanes(Lanes a, Lanes b) {
  return a | b;
}

constexpr Lanes removeLanes(Lanes set, Lanes subset) {
  return set & ~subset;
}

constexpr Lanes intersectLanes(Lanes a, Lanes b) {
  return a & b;
}

constexpr bool includesSomeLane(Lanes a, Lanes b) {
  return (a & b) != NoLanes;
}

constexpr bool isSubsetOfLanes(Lanes set, Lanes subset) {
  return (set & subset) == subset;
}

// Lower bits are more urgent, so the lowest set bit wins.
constexpr Lane getHighestPriorityLane(Lanes lanes) {
  return lanes & (~lanes + 1u);
}

constexpr Lane higherPriorityLane(Lane a, Lane b) {
  return (a != NoLane && a < b) ? a : b;
}

constexpr int laneToIndex(Lane lane) {
  if (lane == NoLane) {
    return -1;
  }
  int index = 0;
  while ((lane & 1u) == 0u) {
    lane >>= 1;
    ++index;
  }
  return index;
}

constexpr bool includesSyncLane(Lanes lanes) {
  return (lanes & SyncLane) != NoLanes;
}

constexpr bool includesNonIdleWork(Lanes lanes) {
  return (lanes & NonIdleLanes) != NoLanes;
}

constexpr bool isTransitionLane(Lane lane) {
  return (lane & TransitionLanes) != NoLanes;
}

template <typename T>
constexpr std::array<T, TotalLanes> createLaneMap(T initial) {
  std::array<T, TotalLanes> laneMap{};
  for (std::size_t index = 0; index < laneMap.size(); ++index) {
    laneMap[index] = initial;
  }
  return laneMap;
}

constexpr LanePriority lanePriorityForLane(Lane lane) {
  const Lane highest = getHighestPriorityLane(lane);
  if (highest == NoLane) {
    return LanePriority::NoLanePriority;
  }
  if (highest == SyncLane) {
    return LanePriority::SyncLanePriority;
  }
  if (highest == InputContinuousLane) {
    return LanePriority::InputContinuousLanePriority;
  }
  if (highest == DefaultLane) {
    return LanePriority::DefaultLanePriority;
  }
  if ((highest & TransitionLanes) != NoLanes) {
    return LanePriority::TransitionLanePriority;
  }
  if ((highest & RetryLanes) != NoLanes) {
    return LanePriority::RetryLanePriority;
  }
  if (highest == IdleLane) {
    return LanePriority::IdleLanePriority;
  }
  if (highest == OffscreenLane) {
    return LanePriority::OffscreenLanePriority;
  }
  return LanePriority::NoLanePriority;
}

} // namespace fibercore
