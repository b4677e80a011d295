#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "face_core/services/face_library.hpp"
#include "face_core/services/session_search_service.hpp"

namespace face_api {

class Config {
 public:
  std::string api_base_url;
  std::string data_dir;
  std::string db_key_file;
  int db_pool_size;

  // Embeddings
  size_t embedding_dimension;
  float normalization_epsilon;

  // Index
  int64_t approximate_threshold;
  int cluster_count;
  int probe_count;
  double retrain_growth_factor;
  double compaction_ratio;

  // Search policy
  float primary_threshold;
  int max_results;
  int sufficiency_count;
  float expand_delta;
  float floor_threshold;
  float fallback_threshold;

  // Sessions
  int session_timeout_minutes;
  int session_sweep_interval_seconds;
  float session_threshold;
  int session_max_results;
  int session_result_limit;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.data_dir = json_config.value("data_dir", std::string("./data/libraries"));
      config.db_key_file = json_config.value("db_key_file", std::string("./data/db.key"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.embedding_dimension = json_config.value("embedding_dimension", size_t{1024});
      config.normalization_epsilon = json_config.value("normalization_epsilon", 1e-3f);

      config.approximate_threshold = json_config.value("approximate_threshold", int64_t{1000});
      config.cluster_count = json_config.value("cluster_count", 0);
      config.probe_count = json_config.value("probe_count", 10);
      config.retrain_growth_factor = json_config.value("retrain_growth_factor", 4.0);
      config.compaction_ratio = json_config.value("compaction_ratio", 0.2);

      config.primary_threshold = json_config.value("primary_threshold", 0.55f);
      config.max_results = json_config.value("max_results", 100);
      config.sufficiency_count = json_config.value("sufficiency_count", 8);
      config.expand_delta = json_config.value("expand_delta", 0.10f);
      config.floor_threshold = json_config.value("floor_threshold", 0.42f);
      config.fallback_threshold = json_config.value("fallback_threshold", 0.30f);

      config.session_timeout_minutes = json_config.value("session_timeout_minutes", 30);
      config.session_sweep_interval_seconds = json_config.value("session_sweep_interval_seconds", 0);
      config.session_threshold = json_config.value("session_threshold", 0.50f);
      config.session_max_results = json_config.value("session_max_results", 100);
      config.session_result_limit = json_config.value("session_result_limit", 50);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::pair<std::string, int> host_and_port() const {
    auto colon = api_base_url.rfind(':');
    return {api_base_url.substr(0, colon), std::stoi(api_base_url.substr(colon + 1))};
  }

  face_core::LibrarySettings library_settings() const {
    face_core::LibrarySettings settings;
    settings.index.dimension = embedding_dimension;
    settings.index.normalization_epsilon = normalization_epsilon;
    settings.index.approximate_threshold = approximate_threshold;
    settings.index.cluster_count = cluster_count;
    settings.index.probe_count = probe_count;
    settings.retrain_growth_factor = retrain_growth_factor;
    settings.compaction_ratio = compaction_ratio;
    settings.db_pool_size = db_pool_size;

    settings.policy.primary_threshold = primary_threshold;
    settings.policy.max_results = max_results;
    settings.policy.sufficiency_count = sufficiency_count;
    settings.policy.expand_delta = expand_delta;
    settings.policy.floor_threshold = floor_threshold;
    settings.policy.fallback_threshold = fallback_threshold;
    return settings;
  }

  face_core::SessionSearchSettings session_settings() const {
    face_core::SessionSearchSettings settings;
    settings.threshold = session_threshold;
    settings.max_results = session_max_results;
    settings.result_limit = session_result_limit;
    return settings;
  }

  std::chrono::seconds session_timeout() const {
    return std::chrono::minutes(session_timeout_minutes);
  }

 private:
  static bool is_similarity(float value) {
    return value >= -1.0f && value <= 1.0f;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port");
    }
    try {
      int port = host_and_port().second;
      if (port <= 0 || port > 65535) {
        throw std::runtime_error("out of range");
      }
    } catch (const std::exception &) {
      throw std::runtime_error("api_base_url has an invalid port: " + api_base_url);
    }
    if (data_dir.empty()) {
      throw std::runtime_error("data_dir cannot be empty");
    }
    if (db_key_file.empty()) {
      throw std::runtime_error("db_key_file cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (embedding_dimension == 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (!(normalization_epsilon > 0.0f && normalization_epsilon < 1.0f)) {
      throw std::runtime_error("normalization_epsilon must be in (0, 1)");
    }
    if (approximate_threshold < 1) {
      throw std::runtime_error("approximate_threshold must be at least 1");
    }
    if (cluster_count < 0) {
      throw std::runtime_error("cluster_count cannot be negative (0 selects automatically)");
    }
    if (probe_count < 1) {
      throw std::runtime_error("probe_count must be at least 1");
    }
    if (retrain_growth_factor <= 1.0) {
      throw std::runtime_error("retrain_growth_factor must be greater than 1");
    }
    if (!(compaction_ratio > 0.0 && compaction_ratio < 1.0)) {
      throw std::runtime_error("compaction_ratio must be in (0, 1)");
    }
    if (!is_similarity(primary_threshold) || !is_similarity(floor_threshold) ||
        !is_similarity(fallback_threshold) || !is_similarity(session_threshold)) {
      throw std::runtime_error("similarity thresholds must be in [-1, 1]");
    }
    if (expand_delta < 0.0f) {
      throw std::runtime_error("expand_delta cannot be negative");
    }
    if (max_results <= 0 || session_max_results <= 0 || session_result_limit <= 0) {
      throw std::runtime_error("result limits must be greater than 0");
    }
    if (sufficiency_count < 1) {
      throw std::runtime_error("sufficiency_count must be at least 1");
    }
    if (session_timeout_minutes < 1) {
      throw std::runtime_error("session_timeout_minutes must be at least 1 minute");
    }
    if (session_sweep_interval_seconds < 0) {
      throw std::runtime_error("session_sweep_interval_seconds cannot be negative");
    }
  }
};

}  // namespace face_api
