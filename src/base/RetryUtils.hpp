#ifndef __SG_RETRY_UTILS__
#define __SG_RETRY_UTILS__

#include "Errors.hpp"
#include "Headers.hpp"

namespace sg {
typedef std::function<void(chrono::milliseconds)> Sleeper;

inline void sleepFor(chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

/**
 * @brief Runs `attempt` until it returns without a TimeoutError.
 *
 * After the n-th timed out attempt the caller sleeps for `delays[n]` and
 * tries again, so at most `delays.size() + 1` attempts are made.  The last
 * TimeoutError is rethrown once the schedule is exhausted.  Any other
 * exception escapes on the first occurrence.
 */
template <typename Func>
auto withRetries(Func attempt, const vector<chrono::milliseconds>& delays,
                 const Sleeper& sleeper = sleepFor) -> decltype(attempt()) {
  for (size_t retry = 0;; retry++) {
    try {
      return attempt();
    } catch (const TimeoutError& te) {
      if (retry >= delays.size()) {
        VLOG(1) << "Giving up after " << (retry + 1) << " attempts";
        throw;
      }
      VLOG(1) << "Attempt " << (retry + 1) << " timed out, retrying in "
              << delays[retry].count() << "ms";
      sleeper(delays[retry]);
    }
  }
}
}  // namespace sg

#endif  // __SG_RETRY_UTILS__
