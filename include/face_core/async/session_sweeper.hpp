#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace face_core {
class SessionRegistry;
}

namespace face_core {
namespace async {

/**
 * @class SessionSweeper
 * @brief Background thread that periodically erases expired search sessions.
 *
 * Lazy expiry on lookup stays in place; the sweeper only bounds memory held by
 * sessions nobody comes back to. Non-copyable and non-movable so the thread
 * has a single owner. The destructor stops and joins.
 */
class SessionSweeper {
 public:
  SessionSweeper(SessionRegistry &registry, std::chrono::seconds interval);
  ~SessionSweeper();

  // Throws if already running.
  void start();

  // Wakes the thread and joins it.
  void stop();

  bool is_running() const {
    return thread_.joinable();
  }

  SessionSweeper(const SessionSweeper &) = delete;
  SessionSweeper &operator=(const SessionSweeper &) = delete;
  SessionSweeper(SessionSweeper &&) = delete;
  SessionSweeper &operator=(SessionSweeper &&) = delete;

 private:
  void run_loop();

  SessionRegistry &registry_;
  std::chrono::seconds interval_;
  std::atomic<bool> should_stop_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace async
}  // namespace face_core
