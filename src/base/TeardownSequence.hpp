#ifndef __SG_TEARDOWN_SEQUENCE__
#define __SG_TEARDOWN_SEQUENCE__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Ordered list of independent release steps.
 *
 * Every step runs even if an earlier one threw.  Failures are logged and
 * counted, never rethrown.
 */
class TeardownSequence {
 public:
  void add(const string& name, std::function<void()> step) {
    steps.push_back(make_pair(name, step));
  }

  /** @return The number of steps that failed. */
  int run() {
    int failures = 0;
    for (auto& it : steps) {
      try {
        VLOG(1) << "Releasing " << it.first;
        it.second();
      } catch (const std::exception& ex) {
        LOG(WARNING) << "Error while releasing " << it.first << ": "
                     << ex.what();
        failures++;
      }
    }
    steps.clear();
    return failures;
  }

 protected:
  vector<pair<string, std::function<void()>>> steps;
};
}  // namespace sg

#endif  // __SG_TEARDOWN_SEQUENCE__
