#pragma once
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "server.hpp"

namespace face_core {
class LibraryRegistry;
class SessionSearchService;
struct MatchCriteria;
struct MatchGroup;
struct NewFace;
}  // namespace face_core

namespace face_api {

class Routes {
 public:
  Routes(face_core::LibraryRegistry &libraries, face_core::SessionSearchService &sessions);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Request/response mapping, public for tests
  static std::vector<float> parse_embedding(const nlohmann::json &json);
  static face_core::NewFace parse_new_face(const nlohmann::json &json);
  static face_core::MatchCriteria parse_criteria(const nlohmann::json &json);
  static nlohmann::json match_group_to_json(const face_core::MatchGroup &group);

  // Runs a handler and maps exceptions to status codes.
  static crow::response guarded(const std::string &handler,
                                const std::function<crow::response()> &body);

 private:
  face_core::LibraryRegistry &libraries_;
  face_core::SessionSearchService &sessions_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_insert_faces(const crow::request &req, const std::string &library);
  crow::response handle_search(const crow::request &req, const std::string &library);
  crow::response handle_delete_photo(const crow::request &req,
                                     const std::string &library,
                                     const std::string &photo);
  crow::response handle_reset(const crow::request &req, const std::string &library);
  crow::response handle_stats(const crow::request &req, const std::string &library);
  crow::response handle_rebuild(const crow::request &req, const std::string &library);
  crow::response handle_locations(const crow::request &req, const std::string &library);
  crow::response handle_create_session(const crow::request &req);
  crow::response handle_session_query(const crow::request &req, const std::string &session_id);
  crow::response handle_session_history(const crow::request &req, const std::string &session_id);

  // Helper methods
  static nlohmann::json parse_json_body(const std::string &body);
  static nlohmann::json create_success_response(const std::string &message,
                                                const nlohmann::json &data = nlohmann::json{});
  static nlohmann::json create_error_response(const std::string &error);
  static crow::response create_json_response(const nlohmann::json &json_data,
                                             int status_code = 200);
};

}  // namespace face_api
