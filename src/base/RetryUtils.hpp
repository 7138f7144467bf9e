#ifndef __OT_RETRY_UTILS__
#define __OT_RETRY_UTILS__

#include "Headers.hpp"

namespace ot {
/**
 * @brief Bounded retry helper for non-blocking calls that can report
 * "would block".
 *
 * `attempt` returns true once the call completed (successfully or with an
 * error it already handled) and false when it would block. Returns false if
 * the call is still blocking after `maxAttempts` tries.
 */
inline bool retryWhileBlocked(const std::function<bool()>& attempt,
                              int maxAttempts,
                              std::chrono::milliseconds pause) {
  for (int a = 0; a < maxAttempts; a++) {
    if (attempt()) {
      return true;
    }
    VLOG(4) << "Would block, retrying (" << a + 1 << "/" << maxAttempts << ")";
    std::this_thread::sleep_for(pause);
  }
  return false;
}

/**
 * @brief Same as retryWhileBlocked but bounded by wall time instead of
 * attempts.
 */
inline bool retryWhileBlockedFor(const std::function<bool()>& attempt,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds pause) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (attempt()) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(pause);
  }
}

/** @brief Backoff for a peer that is still draining: min(1s, 50ms * 2^n). */
inline std::chrono::milliseconds drainBackoff(int retryCount) {
  if (retryCount >= 5) {
    return std::chrono::milliseconds(1000);
  }
  return std::chrono::milliseconds(
      std::min<int64_t>(1000, int64_t(50) << retryCount));
}
}  // namespace ot

#endif  // __OT_RETRY_UTILS__
