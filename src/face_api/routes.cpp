#include "face_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "face_core/db/embedding_store.hpp"
#include "face_core/errors.hpp"
#include "face_core/search/match_filter.hpp"
#include "face_core/services/library_registry.hpp"
#include "face_core/services/session_search_service.hpp"

namespace face_api {

namespace {

nlohmann::json stages_to_json(const std::vector<face_core::SearchStage> &stages) {
  nlohmann::json result = nlohmann::json::array();
  for (auto stage : stages) {
    result.push_back(face_core::to_string(stage));
  }
  return result;
}

}  // namespace

Routes::Routes(face_core::LibraryRegistry &libraries, face_core::SessionSearchService &sessions)
    : libraries_(libraries), sessions_(sessions) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Library endpoints
  CROW_ROUTE(app, "/libraries/<string>/faces")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &key) {
        return handle_insert_faces(req, key);
      });

  CROW_ROUTE(app, "/libraries/<string>/search")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &key) {
        return handle_search(req, key);
      });

  // Photo ids may contain slashes
  CROW_ROUTE(app, "/libraries/<string>/photos/<path>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &key, const std::string &photo) {
            return handle_delete_photo(req, key, photo);
          });

  CROW_ROUTE(app, "/libraries/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &key) {
        return handle_reset(req, key);
      });

  CROW_ROUTE(app, "/libraries/<string>/stats")
  ([this](const crow::request &req, const std::string &key) { return handle_stats(req, key); });

  CROW_ROUTE(app, "/libraries/<string>/rebuild")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &key) {
        return handle_rebuild(req, key);
      });

  CROW_ROUTE(app, "/libraries/<string>/locations")
  ([this](const crow::request &req, const std::string &key) { return handle_locations(req, key); });

  // Session endpoints
  CROW_ROUTE(app, "/sessions").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_create_session(req);
  });

  CROW_ROUTE(app, "/sessions/<string>/query")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &id) {
        return handle_session_query(req, id);
      });

  CROW_ROUTE(app, "/sessions/<string>")
  ([this](const crow::request &req, const std::string &id) {
    return handle_session_history(req, id);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::guarded(const std::string &handler,
                               const std::function<crow::response()> &body) {
  try {
    return body();
  } catch (const face_core::SessionExpired &e) {
    return create_json_response(create_error_response(e.what()), 410);
  } catch (const face_core::LibraryNotFound &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const face_core::DimensionMismatch &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const face_core::InvalidEmbedding &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const face_core::InvalidFaceRecord &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const face_core::CorruptStore &e) {
    std::cerr << "Store unavailable in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response("Service unavailable"), 503);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Face finder API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_insert_faces(const crow::request &req, const std::string &library) {
  return guarded("handle_insert_faces", [&] {
    nlohmann::json body = parse_json_body(req.body);
    const nlohmann::json &faces_json = body.at("faces");
    if (!faces_json.is_array() || faces_json.empty()) {
      throw std::invalid_argument("'faces' must be a non-empty array");
    }

    std::vector<face_core::NewFace> faces;
    faces.reserve(faces_json.size());
    for (const auto &face_json : faces_json) {
      faces.push_back(parse_new_face(face_json));
    }

    std::vector<int64_t> ids = libraries_.get(library)->insert_batch(faces);
    std::cout << "Inserted " << ids.size() << " face(s) into " << library << std::endl;
    return create_json_response(create_success_response("Faces inserted", {{"ids", ids}}));
  });
}

crow::response Routes::handle_search(const crow::request &req, const std::string &library) {
  return guarded("handle_search", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::vector<float> query = parse_embedding(body.at("embedding"));

    face_core::SearchRequest request;
    if (body.contains("top_k")) {
      request.top_k = body.at("top_k").get<int>();
    }
    if (body.contains("threshold")) {
      request.threshold = body.at("threshold").get<float>();
    }
    face_core::MatchCriteria criteria =
        body.contains("criteria") ? parse_criteria(body.at("criteria")) : face_core::MatchCriteria{};

    face_core::SearchResponse response = libraries_.require(library)->search(query, request);
    std::vector<face_core::MatchGroup> groups = face_core::apply_criteria(response.groups, criteria);

    nlohmann::json results = nlohmann::json::array();
    for (const auto &group : groups) {
      results.push_back(match_group_to_json(group));
    }
    nlohmann::json data;
    data["groups"] = results;
    data["stages"] = stages_to_json(response.stages);
    data["face_hits"] = response.face_hits;
    return create_json_response(data);
  });
}

crow::response Routes::handle_delete_photo(const crow::request &req,
                                           const std::string &library,
                                           const std::string &photo) {
  return guarded("handle_delete_photo", [&] {
    int deleted = libraries_.require(library)->delete_by_photo(photo);
    return create_json_response(create_success_response("Photo deleted", {{"deleted", deleted}}));
  });
}

crow::response Routes::handle_reset(const crow::request &req, const std::string &library) {
  return guarded("handle_reset", [&] {
    libraries_.require(library)->reset();
    return create_json_response(create_success_response("Library reset"));
  });
}

crow::response Routes::handle_stats(const crow::request &req, const std::string &library) {
  return guarded("handle_stats", [&] {
    face_core::LibraryStats stats = libraries_.require(library)->stats();
    nlohmann::json data;
    data["total_active"] = stats.total_active;
    data["tombstoned"] = stats.tombstoned;
    data["pending_deletions"] = stats.pending_deletions;
    data["index_kind"] = face_core::to_string(stats.index_kind);
    data["dimension"] = stats.dimension;
    data["cluster_count"] = stats.cluster_count;
    data["probe_count"] = stats.probe_count;
    data["trained"] = stats.trained;
    data["trained_on"] = stats.trained_on;
    return create_json_response(data);
  });
}

crow::response Routes::handle_rebuild(const crow::request &req, const std::string &library) {
  return guarded("handle_rebuild", [&] {
    libraries_.require(library)->rebuild();
    return create_json_response(create_success_response("Index rebuilt"));
  });
}

crow::response Routes::handle_locations(const crow::request &req, const std::string &library) {
  return guarded("handle_locations", [&] {
    nlohmann::json locations = nlohmann::json::array();
    for (const auto &location : libraries_.require(library)->list_locations()) {
      nlohmann::json entry;
      entry["name"] = location.name;
      entry["photo_count"] = location.photo_count;
      if (location.latitude && location.longitude) {
        entry["latitude"] = *location.latitude;
        entry["longitude"] = *location.longitude;
      }
      locations.push_back(entry);
    }
    return create_json_response({{"locations", locations}});
  });
}

crow::response Routes::handle_create_session(const crow::request &req) {
  return guarded("handle_create_session", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string library = body.at("library").get<std::string>();
    std::vector<float> embedding = parse_embedding(body.at("embedding"));
    std::string session_id = sessions_.create_session(library, embedding);
    return create_json_response({{"session_id", session_id}}, 201);
  });
}

crow::response Routes::handle_session_query(const crow::request &req,
                                            const std::string &session_id) {
  return guarded("handle_session_query", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string text = body.value("text", std::string());
    face_core::MatchCriteria criteria =
        body.contains("criteria") ? parse_criteria(body.at("criteria")) : face_core::MatchCriteria{};

    face_core::SessionQueryResult result = sessions_.query(session_id, text, criteria);
    nlohmann::json groups = nlohmann::json::array();
    for (const auto &group : result.groups) {
      groups.push_back(match_group_to_json(group));
    }
    return create_json_response(
        {{"groups", groups}, {"total", result.total}, {"summary", result.summary}});
  });
}

crow::response Routes::handle_session_history(const crow::request &req,
                                              const std::string &session_id) {
  return guarded("handle_session_history", [&] {
    nlohmann::json log = nlohmann::json::array();
    for (const auto &entry : sessions_.history(session_id)) {
      log.push_back({{"query", entry.query_text},
                     {"response", entry.response_summary},
                     {"at", face_core::EmbeddingStore::time_point_to_string(entry.at)}});
    }
    return create_json_response({{"session_id", session_id}, {"history", log}});
  });
}

std::vector<float> Routes::parse_embedding(const nlohmann::json &json) {
  if (!json.is_array() || json.empty()) {
    throw std::invalid_argument("'embedding' must be a non-empty array of numbers");
  }
  std::vector<float> embedding;
  embedding.reserve(json.size());
  for (const auto &value : json) {
    if (!value.is_number()) {
      throw std::invalid_argument("'embedding' must contain only numbers");
    }
    embedding.push_back(value.get<float>());
  }
  return embedding;
}

face_core::NewFace Routes::parse_new_face(const nlohmann::json &json) {
  face_core::NewFace face;
  face.embedding = parse_embedding(json.at("embedding"));
  face.photo = json.at("photo").get<std::string>();

  const nlohmann::json &bbox = json.at("bbox");
  if (!bbox.is_array() || bbox.size() != 4) {
    throw std::invalid_argument("'bbox' must be [x, y, width, height]");
  }
  face.bbox = face_core::BoundingBox{bbox[0].get<int>(), bbox[1].get<int>(), bbox[2].get<int>(),
                                     bbox[3].get<int>()};
  face.confidence = json.value("confidence", 1.0f);
  if (json.contains("metadata")) {
    face.metadata = face_core::metadata_from_json(json.at("metadata"));
  }
  return face;
}

face_core::MatchCriteria Routes::parse_criteria(const nlohmann::json &json) {
  face_core::MatchCriteria criteria;
  if (json.is_null()) {
    return criteria;
  }
  if (!json.is_object()) {
    throw std::invalid_argument("'criteria' must be an object");
  }
  if (json.contains("location_name")) {
    criteria.location_name = json.at("location_name").get<std::string>();
  }
  if (json.contains("date_start")) {
    criteria.date_start = json.at("date_start").get<std::string>();
  }
  if (json.contains("date_end")) {
    criteria.date_end = json.at("date_end").get<std::string>();
  }
  if (json.contains("near")) {
    const nlohmann::json &near = json.at("near");
    criteria.near = face_core::GeoRadius{near.at("latitude").get<double>(),
                                         near.at("longitude").get<double>(),
                                         near.at("radius_km").get<double>()};
  }
  return criteria;
}

nlohmann::json Routes::match_group_to_json(const face_core::MatchGroup &group) {
  nlohmann::json hits = nlohmann::json::array();
  for (const auto &hit : group.per_face_hits) {
    hits.push_back({{"face_id", hit.face_id},
                    {"bbox", {hit.bbox.x, hit.bbox.y, hit.bbox.width, hit.bbox.height}},
                    {"similarity", hit.similarity},
                    {"expanded", hit.expanded}});
  }
  nlohmann::json result;
  result["photo"] = group.photo;
  result["photo_name"] = group.photo_name;
  result["faces"] = hits;
  result["max_similarity"] = group.max_similarity;
  result["avg_similarity"] = group.avg_similarity;
  result["face_count"] = group.face_count;
  result["expanded"] = group.expanded;
  result["metadata"] = face_core::metadata_to_json(group.metadata);
  return result;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace face_api
