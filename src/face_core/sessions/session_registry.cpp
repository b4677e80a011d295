#include "face_core/sessions/session_registry.hpp"

#include <iostream>
#include <stdexcept>

#include "face_core/errors.hpp"
#include "face_core/util/random_token.hpp"

namespace face_core {

namespace {
constexpr size_t SESSION_TOKEN_BYTES = 16;
}

SessionRegistry::SessionRegistry(std::chrono::seconds idle_timeout, Clock clock)
    : idle_timeout_(idle_timeout), clock_(std::move(clock)) {
  if (idle_timeout_.count() <= 0) {
    throw std::invalid_argument("Session timeout must be positive");
  }
  if (!clock_) {
    throw std::invalid_argument("Session clock must be callable");
  }
}

bool SessionRegistry::is_expired(const SearchSession &session,
                                 std::chrono::system_clock::time_point now) const {
  return now - session.created_at > idle_timeout_;
}

std::string SessionRegistry::create(const std::string &library,
                                    const std::vector<float> &reference_embedding) {
  SearchSession session;
  session.library = library;
  session.reference_embedding = reference_embedding;
  session.created_at = clock_();

  std::lock_guard<std::mutex> lock(mutex_);
  do {
    session.session_id = util::random_hex(SESSION_TOKEN_BYTES);
  } while (sessions_.count(session.session_id));
  std::string id = session.session_id;
  sessions_.emplace(id, std::move(session));
  std::cout << "[SessionRegistry] Created session " << id << " for library '" << library << "'"
            << std::endl;
  return id;
}

std::optional<SearchSession> SessionRegistry::get(const std::string &session_id) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  if (is_expired(it->second, now)) {
    std::cout << "[SessionRegistry] Session " << session_id << " expired" << std::endl;
    sessions_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

SearchSession SessionRegistry::require(const std::string &session_id) {
  std::optional<SearchSession> session = get(session_id);
  if (!session) {
    throw SessionExpired(session_id);
  }
  return *session;
}

bool SessionRegistry::append_query(const std::string &session_id,
                                   const std::string &query_text,
                                   const std::string &response_summary) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return false;
  }
  if (is_expired(it->second, now)) {
    sessions_.erase(it);
    return false;
  }
  it->second.query_log.push_back(QueryLogEntry{query_text, response_summary, now});
  return true;
}

size_t SessionRegistry::sweep_expired() {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (is_expired(it->second, now)) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace face_core
