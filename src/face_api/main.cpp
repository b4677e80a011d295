#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "face_api/config.hpp"
#include "face_api/routes.hpp"
#include "face_api/server.hpp"
#include "face_core/async/session_sweeper.hpp"
#include "face_core/services/database_key_service.hpp"
#include "face_core/services/library_registry.hpp"
#include "face_core/services/session_search_service.hpp"
#include "face_core/sessions/session_registry.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "facefinderrc.json";
    face_api::Config config = face_api::Config::from_file(config_path);

    face_core::DatabaseKeyService key_service(config.db_key_file);
    std::string db_key = key_service.get_database_key();

    std::cout << "Starting Face Finder API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Data Directory: " << config.data_dir << std::endl;
    std::cout << "Embedding Dimension: " << config.embedding_dimension << std::endl;
    std::cout << "Approximate Index Threshold: " << config.approximate_threshold << std::endl;
    std::cout << "Session Timeout: " << config.session_timeout_minutes << " min" << std::endl;

    // Built once, passed by reference
    face_core::LibraryRegistry libraries(config.data_dir, db_key, config.library_settings());
    face_core::SessionRegistry session_registry(config.session_timeout());
    face_core::SessionSearchService session_service(libraries, session_registry,
                                                    config.session_settings());

    std::unique_ptr<face_core::async::SessionSweeper> sweeper;
    if (config.session_sweep_interval_seconds > 0) {
      sweeper = std::make_unique<face_core::async::SessionSweeper>(
          session_registry, std::chrono::seconds(config.session_sweep_interval_seconds));
    }

    auto [host, port] = config.host_and_port();
    face_api::Server server(host, port);
    face_api::Routes routes(libraries, session_service);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    if (sweeper) {
      sweeper->start();
    }
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping session sweeper..." << std::endl;
    if (sweeper) {
      sweeper->stop();
    }

    std::cout << "[3/3] Closing face libraries..." << std::endl;
    libraries.close_all();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
