#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace face_core {

struct QueryLogEntry {
  std::string query_text;
  std::string response_summary;
  std::chrono::system_clock::time_point at;
};

struct SearchSession {
  std::string session_id;
  std::string library;
  std::vector<float> reference_embedding;
  std::chrono::system_clock::time_point created_at;
  std::vector<QueryLogEntry> query_log;
};

/**
 * @brief Owns the short-lived search sessions of the process.
 *
 * Expiry is lazy: a session older than the timeout is erased the next time
 * it is looked up. sweep_expired() erases every expired session at once.
 * The mutex covers map operations only.
 */
class SessionRegistry {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit SessionRegistry(std::chrono::seconds idle_timeout,
                           Clock clock = [] { return std::chrono::system_clock::now(); });

  // The embedding must already be normalized.
  std::string create(const std::string &library, const std::vector<float> &reference_embedding);

  // nullopt for unknown or expired ids. Expired sessions are erased.
  std::optional<SearchSession> get(const std::string &session_id);

  // Throws SessionExpired where get() would return nullopt.
  SearchSession require(const std::string &session_id);

  // false when the session no longer exists.
  bool append_query(const std::string &session_id,
                    const std::string &query_text,
                    const std::string &response_summary);

  size_t sweep_expired();
  size_t size() const;

  std::chrono::seconds idle_timeout() const {
    return idle_timeout_;
  }

 private:
  bool is_expired(const SearchSession &session, std::chrono::system_clock::time_point now) const;

  std::chrono::seconds idle_timeout_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SearchSession> sessions_;
};

}  // namespace face_core
