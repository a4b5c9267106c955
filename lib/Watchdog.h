#ifndef WS_SYNC_WATCHDOG_H
#define WS_SYNC_WATCHDOG_H

#include "Logger.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ws {

/**
 * Watchdog - Warns once when a guarded action runs too long.
 *
 * A dedicated thread waits for either finish() or the timeout. On timeout it
 * logs a single warning tagged with the action name and goes inert; the
 * guarded action is never interrupted. The destructor finishes the watch.
 *
 *   {
 *     Watchdog watchdog(log(), std::chrono::milliseconds(500), "apply");
 *     doWork();
 *   }
 */
class Watchdog {
public:
  Watchdog(logging::Logger &logger, std::chrono::milliseconds timeout,
           const std::string &tag);
  ~Watchdog();

  Watchdog(const Watchdog &) = delete;
  Watchdog &operator=(const Watchdog &) = delete;

  /** Stop watching. Safe to call more than once. */
  void finish();

  bool hasFired() const { return isFired_; }
  std::chrono::milliseconds getTimeout() const { return timeout_; }

private:
  void run();

  logging::Logger logger_;
  std::chrono::milliseconds timeout_;
  std::string tag_;
  std::chrono::steady_clock::time_point startedAt_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool isDone_{ false };
  std::atomic<bool> isFired_{ false };

  std::thread thread_;
};

} // namespace ws

#endif // WS_SYNC_WATCHDOG_H
