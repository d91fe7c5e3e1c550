#pragma once

#include <chrono>
#include <cstddef>

namespace cronhive {

namespace io {
constexpr std::size_t kReadBufferSize = 4096;
constexpr std::size_t kMaxOutputBytes = 10 * 1024 * 1024;
} // namespace io

namespace timing {
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
constexpr auto kShutdownDeadline = std::chrono::seconds(5);
constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
constexpr auto kDeferredRetryInterval = std::chrono::milliseconds(100);
constexpr auto kHeartbeatInterval = std::chrono::milliseconds(50);
constexpr auto kWatchdogInterval = std::chrono::milliseconds(100);
/// A shard whose heartbeat is older than this is reported as blocked.
constexpr auto kStallThreshold = std::chrono::milliseconds(500);
constexpr auto kKillGracePeriod = std::chrono::seconds(2);
} // namespace timing

namespace limits {
/// Upper bound when counting missed fires of a misfired job.
constexpr std::size_t kMissedFireCountCap = 10000;
/// How far ahead next_fire searches before giving up.
constexpr int kTriggerSearchYears = 8;
} // namespace limits

} // namespace cronhive
