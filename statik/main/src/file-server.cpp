#include "statik/file-server.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <utility>

#include "statik/cache-negotiator.hpp"
#include "statik/connection-state.hpp"
#include "statik/connection.hpp"
#include "statik/error-reporter.hpp"
#include "statik/event-loop.hpp"
#include "statik/event.hpp"
#include "statik/http-constants.hpp"
#include "statik/http-request.hpp"
#include "statik/http-status-code.hpp"
#include "statik/log.hpp"
#include "statik/response-intent.hpp"
#include "statik/response-streamer.hpp"
#include "statik/server-config.hpp"
#include "statik/signal-handler.hpp"
#include "statik/socket-ops.hpp"
#include "statik/socket.hpp"
#include "statik/timedef.hpp"
#include "statik/transport.hpp"

namespace statik {

namespace {

// Time left to a client to read the end of its response after our write side has been shut down.
constexpr std::chrono::seconds kLingerTimeout{2};

constexpr EventBmp kClientEvents = EventIn | EventRdHup | EventEt;

ServerConfig Validated(ServerConfig config) {
  config.validate();
  return config;
}

bool ClosesConnection(http::StatusCode status) {
  return status == http::StatusCodeMethodNotAllowed || status == http::StatusCodeHTTPVersionNotSupported;
}

}  // namespace

FileServer::FileServer(ServerConfig config)
    : _config(Validated(std::move(config))),
      _handler(_config.staticFiles),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval) {
  _listenSocket.bindAndListen(_config.reusePort, _config.tcpNoDelay, _config.port);
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
  log::debug("Serving files from '{}' on port :{}", _config.staticFiles.rootDirectory, _config.port);
}

void FileServer::run() {
  runUntil([] { return false; });
}

void FileServer::runUntil(const std::function<bool()>& predicate) {
  log::info("Server running on port :{}", _config.port);
  while (!_stopRequested.load(std::memory_order_relaxed) && !predicate()) {
    eventLoop();
  }
  closeAllConnections();
  _stopRequested.store(false, std::memory_order_relaxed);
  log::info("Server stopped");
}

void FileServer::eventLoop() {
  for (const EventLoop::EventFd event : _eventLoop.poll()) {
    if (event.fd == _listenSocket.fd()) {
      acceptNewConnections();
      continue;
    }
    auto cnxIt = _connections.find(event.fd);
    if (cnxIt == _connections.end()) {
      // closed while handling a previous event of this batch
      continue;
    }
    if ((event.eventBmp & EventOut) != 0) {
      handleWritableClient(cnxIt);
      cnxIt = _connections.find(event.fd);
      if (cnxIt == _connections.end()) {
        continue;
      }
    }
    if ((event.eventBmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
      handleReadableClient(cnxIt);
    }
  }
  sweepLingeringConnections();
  if (SignalHandler::IsStopRequested() && !_stopRequested.load(std::memory_order_relaxed)) {
    log::info("Received signal {}, stopping", SignalHandler::ReceivedSignal());
    stop();
  }
}

void FileServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      const auto err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd, err, std::strerror(err));
    }
    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, kClientEvents})) {
      // cnx closes the socket
      continue;
    }
    auto [cnxIt, inserted] = _connections.try_emplace(cnxFd, std::move(cnx));
    if (!inserted) {
      log::error("Internal error: accepted connection fd # {} already present in connection map", cnxFd);
      _eventLoop.del(cnxFd);
      continue;
    }
    log::debug("Accepted connection fd # {}", cnxFd);
  }
}

void FileServer::handleReadableClient(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  do {
    if (!readAvailable(cnxIt)) {
      return;
    }
    if (state.writeShutdown) {
      if (state.peerClosed) {
        closeConnection(cnxIt);
      }
      return;
    }
    if (!processRequests(cnxIt)) {
      return;
    }
    // reading was paused on a full input buffer, pick up what is left in the socket once requests consumed it
  } while (state.readPaused && state.inBuffer.size() <= _config.maxHeaderBytes);
  closeIfPeerDone(cnxIt);
}

bool FileServer::readAvailable(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  const int cnxFd = state.connection.fd();
  state.readPaused = false;
  while (true) {
    if (!state.writeShutdown && state.inBuffer.size() > _config.maxHeaderBytes) {
      // More than any valid request head. The rest stays in the socket until the buffer is consumed.
      state.readPaused = true;
      break;
    }
    state.inBuffer.ensureAvailableCapacityExponential(_config.readChunkBytes);
    const auto [nbRead, want] =
        state.transport.read(state.inBuffer.data() + state.inBuffer.size(), _config.readChunkBytes);
    if (want == TransportHint::Error) {
      const auto err = errno;
      log::debug("Read failed on fd # {} err={} ({})", cnxFd, err, std::strerror(err));
      closeConnection(cnxIt);
      return false;
    }
    if (want == TransportHint::ReadReady) {
      break;
    }
    if (nbRead == 0) {
      state.peerClosed = true;
      break;
    }
    if (state.writeShutdown) {
      // lingering: input is dropped
      continue;
    }
    state.inBuffer.addSize(nbRead);
  }
  return true;
}

void FileServer::handleWritableClient(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  if (state.writeShutdown) {
    return;
  }
  if (!driveResponse(cnxIt)) {
    return;
  }
  if (state.readPaused) {
    // edge triggered: the input left in the socket will not be signaled again
    handleReadableClient(cnxIt);
    return;
  }
  // the previous response is complete, serve the pipelined requests that were waiting for it
  if (processRequests(cnxIt)) {
    closeIfPeerDone(cnxIt);
  }
}

bool FileServer::processRequests(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  while (!state.isStreaming() && state.outBuffer.empty() && !state.isAnyCloseRequested() &&
         !state.inBuffer.empty()) {
    const auto status = _request.parse(state.inBuffer, _config.maxHeaderBytes);
    if (status == HttpRequest::ParseStatus::NeedMore) {
      break;
    }
    ResponseIntent intent;
    bool closeAfterResponse = true;
    std::size_t consumed = state.inBuffer.size();
    switch (status) {
      case HttpRequest::ParseStatus::BadRequest:
        log::debug("Malformed request head on fd # {}", state.connection.fd());
        intent = _handler.makeError(http::StatusCodeBadRequest, "Malformed request");
        break;
      case HttpRequest::ParseStatus::HeadersTooLarge:
        log::debug("Request head too large on fd # {}", state.connection.fd());
        intent = _handler.makeError(http::StatusCodeRequestHeaderFieldsTooLarge, "Request header fields too large");
        break;
      default:
        intent = _handler(_request);
        consumed = _request.headLength();
        // A request body is never read, so the stream cannot be resynchronized after it.
        closeAfterResponse = !_config.enableKeepAlive || _request.wantsClose() || _request.hasBody() ||
                             ClosesConnection(intent.status);
        break;
    }
    state.inBuffer.erase_front(consumed);
    startResponse(state, std::move(intent), closeAfterResponse);
    if (!driveResponse(cnxIt)) {
      return false;
    }
  }
  return true;
}

void FileServer::startResponse(ConnectionState& state, ResponseIntent&& intent, bool closeAfterResponse) {
  if (closeAfterResponse) {
    intent.headers.set(http::Connection, http::close);
  }
  intent.headers.set(http::Date, MakeHttpDate(SysClock::now()));
  state.intent = std::move(intent);
  state.closeAfterResponse = closeAfterResponse;

  const auto& staticFiles = _config.staticFiles;
  state.streamer.emplace(state.intent, staticFiles.fileChunkBytes, staticFiles.gzipLevel);
  _firstChunk.clear();
  StreamStep step = state.streamer->produce(_firstChunk);
  if (step == StreamStep::Failed) {
    // Nothing has been sent yet, the response can still be turned into an error.
    const auto path = state.intent.resource ? state.intent.resource->path : std::string{};
    log::error("Unable to read '{}' for fd # {}", path, state.connection.fd());
    ReportError(state.intent, http::StatusCodeInternalServerError, "Unable to read requested resource");
    state.streamer.emplace(state.intent, staticFiles.fileChunkBytes, staticFiles.gzipLevel);
    _firstChunk.clear();
    step = state.streamer->produce(_firstChunk);
  }

  state.intent.committed = true;
  state.intent.serializeHead(state.outBuffer);
  state.outBuffer.append(_firstChunk);
  if (step != StreamStep::Produced) {
    state.streamer.reset();
    ++state.requestsServed;
    if (closeAfterResponse) {
      state.requestDrainAndClose();
    }
  }
}

bool FileServer::driveResponse(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  while (true) {
    while (state.isStreaming() && state.outBuffer.size() < _config.outboundHighWaterMark) {
      const StreamStep step = state.streamer->produce(state.outBuffer);
      if (step == StreamStep::Failed) {
        // The head is already on its way, the only option left is to abort the connection.
        log::error("Aborting response on fd # {} after a body production failure", state.connection.fd());
        state.outBuffer.clear();
        state.requestImmediateClose();
        closeConnection(cnxIt);
        return false;
      }
      if (step == StreamStep::Finished) {
        state.streamer.reset();
        ++state.requestsServed;
        if (state.closeAfterResponse) {
          state.requestDrainAndClose();
        }
      }
    }
    if (!flushOutbound(state)) {
      closeConnection(cnxIt);
      return false;
    }
    if (!state.outBuffer.empty()) {
      // socket buffer full, resume on writability
      if (!state.waitingWritable && !enableWritableInterest(cnxIt)) {
        closeConnection(cnxIt);
        return false;
      }
      return true;
    }
    if (!state.isStreaming()) {
      break;
    }
  }
  if (state.waitingWritable && !disableWritableInterest(cnxIt)) {
    closeConnection(cnxIt);
    return false;
  }
  return closeIfRequested(cnxIt);
}

bool FileServer::flushOutbound(ConnectionState& state) {
  if (state.outBuffer.empty()) {
    return true;
  }
  const auto [written, want] = state.transport.write(state.outBuffer);
  if (want == TransportHint::Error) {
    const auto err = errno;
    log::debug("Write failed on fd # {} err={} ({})", state.connection.fd(), err, std::strerror(err));
    state.outBuffer.clear();
    state.requestImmediateClose();
    return false;
  }
  state.outBuffer.erase_front(written);
  return true;
}

bool FileServer::enableWritableInterest(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  if (!_eventLoop.mod(EventLoop::EventFd{state.connection.fd(), kClientEvents | EventOut})) {
    return false;
  }
  state.waitingWritable = true;
  return true;
}

bool FileServer::disableWritableInterest(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  if (!_eventLoop.mod(EventLoop::EventFd{state.connection.fd(), kClientEvents})) {
    return false;
  }
  state.waitingWritable = false;
  return true;
}

bool FileServer::closeIfRequested(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  if (state.isImmediateCloseRequested()) {
    closeConnection(cnxIt);
    return false;
  }
  if (!state.isDrainCloseRequested() || state.isStreaming() || !state.outBuffer.empty()) {
    return true;
  }
  if (state.peerClosed) {
    closeConnection(cnxIt);
    return false;
  }
  // Closing right away while unread client data is pending would make the kernel send a RST,
  // which may discard the response before the client reads it. Shut down our side first,
  // and wait for the client to close its own.
  if (!ShutdownWrite(state.connection.fd())) {
    closeConnection(cnxIt);
    return false;
  }
  state.writeShutdown = true;
  state.inBuffer.shrink_to_empty();
  state.lingerDeadline = SteadyClock::now() + kLingerTimeout;
  return false;
}

void FileServer::closeIfPeerDone(ConnectionMapIt cnxIt) {
  const ConnectionState& state = cnxIt->second;
  // Requests received before the end of stream have all been answered, what remains is at most a partial head.
  if (state.peerClosed && !state.readPaused && !state.isStreaming() && state.outBuffer.empty()) {
    closeConnection(cnxIt);
  }
}

void FileServer::closeConnection(ConnectionMapIt cnxIt) {
  const int cnxFd = cnxIt->first;
  _eventLoop.del(cnxFd);
  log::debug("Closing connection fd # {} after {} request(s)", cnxFd, cnxIt->second.requestsServed);
  _connections.erase(cnxIt);
}

void FileServer::closeAllConnections() {
  while (!_connections.empty()) {
    closeConnection(_connections.begin());
  }
}

void FileServer::sweepLingeringConnections() {
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    if (cnxIt->second.writeShutdown && now > cnxIt->second.lingerDeadline) {
      auto toClose = cnxIt++;
      closeConnection(toClose);
    } else {
      ++cnxIt;
    }
  }
}

}  // namespace statik
