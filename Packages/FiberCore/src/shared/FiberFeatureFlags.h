#pragma once

namespace fibercore {

// Emit scheduling and commit trace lines on stderr.
inline constexpr bool enableSchedulingTrace = false;

// Route lanes other than SyncLane through the yieldable Scheduler. When off,
// those lanes are only recorded in pendingLanes and never rendered.
inline constexpr bool enableDeferredLaneScheduling = true;

// Time slice of the cooperative TaskScheduler.
inline constexpr double frameYieldMs = 5.0;

// A pending lane older than this renders without yielding (ms). Retry, idle
// and offscreen lanes never expire.
inline constexpr double syncLaneExpirationMs = 250.0;
inline constexpr double transitionLaneExpirationMs = 5000.0;

// Timeouts per scheduler priority (ms).
inline constexpr double userBlockingPriorityTimeout = 250.0;
inline constexpr double normalPriorityTimeout = 5000.0;
inline constexpr double lowPriorityTimeout = 10000.0;
inline constexpr double maxSigned31BitInt = 1073741823.0;

} // namespace fibercore
