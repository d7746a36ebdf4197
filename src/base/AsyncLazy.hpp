#ifndef __SG_ASYNC_LAZY__
#define __SG_ASYNC_LAZY__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Builds a shared instance at most once, on first use.
 *
 * The first caller of get() runs the factory on its own thread.  Callers that
 * arrive while the build is in flight block on the same shared future and
 * observe the same instance, or the same exception.  An atomic flag picks the
 * builder, no lock is held while the factory runs.
 */
template <typename T>
class AsyncLazy {
 public:
  typedef std::function<shared_ptr<T>()> Factory;

  explicit AsyncLazy(Factory _factory)
      : factory(_factory), started(false), disposed(false) {
    future = promise.get_future().share();
  }

  /**
   * @brief Returns the instance, building it if nobody has yet.
   * @throws whatever the factory threw, to every caller.
   */
  shared_ptr<T> get() {
    bool expected = false;
    if (started.compare_exchange_strong(expected, true)) {
      try {
        promise.set_value(factory());
      } catch (...) {
        promise.set_exception(std::current_exception());
      }
    }
    return future.get();
  }

  bool isStarted() const { return started; }

  bool isDisposed() const { return disposed; }

  /**
   * @brief Stops future builds and hands back the instance for release.
   *
   * If a build is in flight this waits for it to finish.  Returns null when
   * nothing was ever built or the build failed.
   */
  shared_ptr<T> dispose() {
    disposed = true;
    bool expected = false;
    if (started.compare_exchange_strong(expected, true)) {
      promise.set_exception(std::make_exception_ptr(
          std::runtime_error("Lazy instance was disposed before use")));
      return shared_ptr<T>();
    }
    try {
      return future.get();
    } catch (const std::exception& ex) {
      VLOG(1) << "Lazy instance failed to build, nothing to release: "
              << ex.what();
      return shared_ptr<T>();
    }
  }

 private:
  Factory factory;
  std::atomic<bool> started;
  std::atomic<bool> disposed;
  std::promise<shared_ptr<T>> promise;
  std::shared_future<shared_ptr<T>> future;
};
}  // namespace sg

#endif  // __SG_ASYNC_LAZY__
