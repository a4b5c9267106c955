#include "Watchdog.h"

namespace ws {

Watchdog::Watchdog(logging::Logger &logger, std::chrono::milliseconds timeout,
                   const std::string &tag)
    : logger_(logger), timeout_(timeout), tag_(tag),
      startedAt_(std::chrono::steady_clock::now()) {
  thread_ = std::thread(&Watchdog::run, this);
}

Watchdog::~Watchdog() { finish(); }

void Watchdog::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    isDone_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Watchdog::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_for(lock, timeout_, [this] { return isDone_; })) {
    return;
  }
  isFired_ = true;
  lock.unlock();

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - startedAt_);
  logger_.warning << tag_ << " is taking longer than expected ("
                  << elapsed.count() << " ms, limit " << timeout_.count()
                  << " ms)";
}

} // namespace ws
