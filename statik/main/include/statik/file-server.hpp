#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string_view>
#include <unordered_map>

#include "statik/connection-state.hpp"
#include "statik/event-loop.hpp"
#include "statik/http-request.hpp"
#include "statik/http-status-code.hpp"
#include "statik/raw-chars.hpp"
#include "statik/response-intent.hpp"
#include "statik/server-config.hpp"
#include "statik/socket.hpp"
#include "statik/static-file-handler.hpp"

namespace statik {

// Single threaded HTTP/1.1 static file server.
// One epoll event loop (edge triggered) drives the listener and all client connections.
//
// Construction binds and listens immediately (port 0 selects an ephemeral port, see port()).
// run() / runUntil() block the calling thread. stop() may be called from any thread, the loop
// notices it within one poll interval. SIGINT / SIGTERM (see SignalHandler) also stop the loop.
class FileServer {
 public:
  // Throws std::invalid_argument for invalid configuration, std::system_error if binding fails.
  explicit FileServer(ServerConfig config);

  FileServer(const FileServer&) = delete;
  FileServer(FileServer&&) = delete;
  FileServer& operator=(const FileServer&) = delete;
  FileServer& operator=(FileServer&&) = delete;

  ~FileServer() = default;

  // Runs the event loop until stop() is called or a stop signal is received.
  void run();

  // Same as run(), but also returns as soon as predicate returns true (checked after each poll).
  void runUntil(const std::function<bool()>& predicate);

  // Requests the running loop to return. All connections are closed when it does.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

 private:
  using ConnectionMap = std::unordered_map<int, ConnectionState>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void eventLoop();

  void acceptNewConnections();

  void handleReadableClient(ConnectionMapIt cnxIt);

  // Reads from the socket until it would block, or until inBuffer holds more than maxHeaderBytes.
  // Returns false if the connection has been closed.
  bool readAvailable(ConnectionMapIt cnxIt);

  void handleWritableClient(ConnectionMapIt cnxIt);

  // Parses and serves buffered requests one after another, as long as the previous response is complete.
  // Returns false if the connection has been closed.
  bool processRequests(ConnectionMapIt cnxIt);

  // Commits the head of intent to the output buffer, together with the first body chunk.
  void startResponse(ConnectionState& state, ResponseIntent&& intent, bool closeAfterResponse);

  // Produces and flushes the current response body, honoring the outbound high water mark.
  // Returns false if the connection has been closed.
  bool driveResponse(ConnectionMapIt cnxIt);

  // Writes as much buffered output as possible. Returns false on a fatal write error.
  bool flushOutbound(ConnectionState& state);

  bool enableWritableInterest(ConnectionMapIt cnxIt);
  bool disableWritableInterest(ConnectionMapIt cnxIt);

  // Closes the connection if a close has been requested and its output is flushed.
  // Returns false if the connection is gone (or lingering before close).
  bool closeIfRequested(ConnectionMapIt cnxIt);

  // Closes the connection once the peer has half-closed and every request it sent has been answered.
  void closeIfPeerDone(ConnectionMapIt cnxIt);

  void closeConnection(ConnectionMapIt cnxIt);

  void closeAllConnections();

  void sweepLingeringConnections();

  ServerConfig _config;
  StaticFileHandler _handler;
  Socket _listenSocket;
  EventLoop _eventLoop;
  ConnectionMap _connections;
  HttpRequest _request;
  RawChars _firstChunk;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace statik
