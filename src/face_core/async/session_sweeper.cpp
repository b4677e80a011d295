#include "face_core/async/session_sweeper.hpp"

#include <iostream>
#include <stdexcept>

#include "face_core/sessions/session_registry.hpp"

namespace face_core {
namespace async {

SessionSweeper::SessionSweeper(SessionRegistry &registry, std::chrono::seconds interval)
    : registry_(registry), interval_(interval) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("Session sweep interval must be positive");
  }
}

SessionSweeper::~SessionSweeper() {
  stop();
}

void SessionSweeper::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("SessionSweeper is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&SessionSweeper::run_loop, this);
}

void SessionSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    should_stop_.store(true);
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[SessionSweeper] Stopped." << std::endl;
  }
}

void SessionSweeper::run_loop() {
  std::cout << "[SessionSweeper] Sweeping every " << interval_.count() << "s." << std::endl;
  while (!should_stop_.load()) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, interval_, [this] { return should_stop_.load(); });
    }
    if (should_stop_.load()) {
      break;
    }

    try {
      size_t removed = registry_.sweep_expired();
      if (removed > 0) {
        std::cout << "[SessionSweeper] Removed " << removed << " expired session(s)." << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "[SessionSweeper] Sweep failed: " << e.what() << std::endl;
    }
  }
}

}  // namespace async
}  // namespace face_core
