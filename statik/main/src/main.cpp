#include <spdlog/cfg/env.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

#include "statik/file-server.hpp"
#include "statik/log.hpp"
#include "statik/server-config.hpp"
#include "statik/signal-handler.hpp"
#include "statik/static-file-config.hpp"

// Usage: statik [port] [root]
int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();

  statik::ServerConfig cfg;
  if (argc > 1) {
    const std::string_view portStr(argv[1]);
    uint16_t port{};
    const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
    if (errc != std::errc{} || ptr != portStr.data() + portStr.size()) {
      statik::log::critical("Invalid port '{}'", portStr);
      return EXIT_FAILURE;
    }
    cfg.withPort(port);
  }
  if (argc > 2) {
    cfg.staticFiles.withRootDirectory(argv[2]);
  }

  statik::SignalHandler::Enable();

  try {
    statik::FileServer server(std::move(cfg));
    statik::log::info("Serving '{}' on port :{}", server.config().staticFiles.rootDirectory, server.port());
    server.run();
  } catch (const std::exception& ex) {
    statik::log::critical("Error: {}", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
