/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay.hpp"

#include <csignal>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<mrelay::Server*> g_server{nullptr};

void handle_signal(int) {
  mrelay::Server* server = g_server.load();
  if (server != nullptr) {
    server->stop();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  mrelay::ServerConfig config;
  if (!mrelay::parse_command_line(argc, argv, config)) {
    std::cerr << "Usage: " << argv[0] << " [-v] [port_file] [db_file]" << std::endl;
    return 1;
  }
  mrelay::Logger::set_debug(config.verbose);

  std::signal(SIGPIPE, SIG_IGN);

  try {
    config.port = mrelay::load_port(config.port_file);

    mrelay::SqliteStore store(config.db_path);
    mrelay::ClientIdGenerator ids;
    mrelay::Server server(config, mrelay::HandlerContext{store, ids});

    g_server.store(&server);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    MRELAY_LOG_INFO("Using database " + store.path() + ". Type 'q' to stop the server.");

    // Blocks on stdin; detached so an idle console never delays exit.
    // Holds only the stop flag, which outlives the server.
    mrelay::Server::StopFlag stop = server.stop_flag();
    std::thread console([stop]() {
      mrelay::run_shutdown_listener(std::cin, [&stop]() { stop->store(true); });
    });
    console.detach();

    server.run();
    g_server.store(nullptr);

    const auto& stats = server.stats();
    MRELAY_LOG_INFO("Handled " + std::to_string(stats.requests_handled.load()) + " request(s) over " +
                    std::to_string(stats.total_connections.load()) + " connection(s), max poll latency " +
                    std::to_string(stats.max_poll_latency_us.load()) + " us");
  } catch (const std::exception& e) {
    g_server.store(nullptr);
    MRELAY_LOG_ERROR(std::string("Fatal: ") + e.what());
    return 1;
  }

  return 0;
}
