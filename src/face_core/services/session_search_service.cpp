#include "face_core/services/session_search_service.hpp"

#include <iostream>
#include <stdexcept>

namespace face_core {

SessionSearchService::SessionSearchService(LibraryRegistry &libraries,
                                           SessionRegistry &sessions,
                                           const SessionSearchSettings &settings)
    : libraries_(libraries), sessions_(sessions), settings_(settings) {
  if (settings_.max_results <= 0 || settings_.result_limit <= 0) {
    throw std::invalid_argument("Session max_results and result_limit must be positive");
  }
}

std::string SessionSearchService::create_session(const std::string &library,
                                                 const std::vector<float> &embedding) {
  std::vector<float> reference = libraries_.require(library)->prepare_query(embedding);
  return sessions_.create(library, reference);
}

SessionQueryResult SessionSearchService::query(const std::string &session_id,
                                               const std::string &query_text,
                                               const MatchCriteria &criteria) {
  SearchSession session = sessions_.require(session_id);
  std::shared_ptr<FaceLibrary> library = libraries_.require(session.library);

  SearchRequest request;
  request.top_k = settings_.max_results;
  request.threshold = settings_.threshold;
  SearchResponse response = library->search(session.reference_embedding, request);

  SessionQueryResult result;
  result.groups = apply_criteria(response.groups, criteria);
  result.total = result.groups.size();
  if (result.groups.size() > static_cast<size_t>(settings_.result_limit)) {
    result.groups.resize(static_cast<size_t>(settings_.result_limit));
  }

  result.summary = "Found " + std::to_string(result.total) + " photo(s)";
  if (criteria.location_name) {
    result.summary += " from " + *criteria.location_name;
  }

  if (!sessions_.append_query(session_id, query_text, result.summary)) {
    // Expired between require() and now; the result is still valid.
    std::cout << "[SessionSearchService] Session " << session_id
              << " expired before its query could be logged" << std::endl;
  }
  return result;
}

std::vector<QueryLogEntry> SessionSearchService::history(const std::string &session_id) {
  return sessions_.require(session_id).query_log;
}

}  // namespace face_core
