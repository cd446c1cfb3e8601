#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

#include "statik/file-server.hpp"
#include "statik/server-config.hpp"
#include "statik/test-http-client.hpp"

namespace statik::test {

// RAII test server harness:
//  * Constructs the FileServer (binds and listens immediately, on an ephemeral port by default)
//  * Runs its event loop in a background jthread using runUntil(stopFlag)
//  * Waits for readiness with a loopback connect instead of an arbitrary sleep
//  * Stops and joins on destruction
struct TestServer {
  explicit TestServer(ServerConfig cfg, std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod))),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {
    ClientConnection cnx(port(), std::chrono::milliseconds{500});
  }

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Cooperative stop, safe to call multiple times.
  void stop() {
    if (!stopFlag.exchange(true)) {
      server.stop();
    }
  }

  std::atomic_bool stopFlag{false};
  FileServer server;

 private:
  std::jthread loopThread;  // auto-join on destruction
};

}  // namespace statik::test
