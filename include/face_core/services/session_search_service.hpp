#pragma once

#include <string>
#include <vector>

#include "face_core/search/match_filter.hpp"
#include "face_core/services/library_registry.hpp"
#include "face_core/sessions/session_registry.hpp"

namespace face_core {

struct SessionSearchSettings {
  float threshold = 0.50f;
  int max_results = 100;
  // Cap on groups returned per query.
  int result_limit = 50;
};

struct SessionQueryResult {
  std::vector<MatchGroup> groups;
  // Matching groups before the cap
  size_t total = 0;
  std::string summary;
};

// Criteria-filtered searches against a session's reference face.
class SessionSearchService {
 public:
  SessionSearchService(LibraryRegistry &libraries,
                       SessionRegistry &sessions,
                       const SessionSearchSettings &settings);

  // Throws LibraryNotFound for an unknown library, DimensionMismatch or
  // InvalidEmbedding for a bad reference face.
  std::string create_session(const std::string &library, const std::vector<float> &embedding);

  // Throws SessionExpired.
  SessionQueryResult query(const std::string &session_id,
                           const std::string &query_text,
                           const MatchCriteria &criteria);

  // Throws SessionExpired.
  std::vector<QueryLogEntry> history(const std::string &session_id);

 private:
  LibraryRegistry &libraries_;
  SessionRegistry &sessions_;
  SessionSearchSettings settings_;
};

}  // namespace face_core
