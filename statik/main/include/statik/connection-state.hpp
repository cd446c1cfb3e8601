#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

#include "statik/connection.hpp"
#include "statik/raw-chars.hpp"
#include "statik/response-intent.hpp"
#include "statik/response-streamer.hpp"
#include "statik/transport.hpp"

namespace statik {

// Per connection state, owned by the FileServer connection map.
// At most one response exchange is in flight: the next pipelined request is parsed only once
// the current response has been fully produced and flushed.
struct ConnectionState {
  enum class CloseMode : uint8_t {
    None,
    DrainThenClose,  // close once buffered output has been flushed
    Immediate        // close without flushing pending output
  };

  explicit ConnectionState(Connection&& cnx) noexcept : connection(std::move(cnx)), transport(connection.fd()) {}

  [[nodiscard]] bool isImmediateCloseRequested() const noexcept { return closeMode == CloseMode::Immediate; }
  [[nodiscard]] bool isDrainCloseRequested() const noexcept { return closeMode == CloseMode::DrainThenClose; }
  [[nodiscard]] bool isAnyCloseRequested() const noexcept { return closeMode != CloseMode::None; }

  [[nodiscard]] bool isStreaming() const noexcept { return streamer.has_value(); }

  // Request to close immediately (abort outstanding buffered writes).
  void requestImmediateClose() noexcept { closeMode = CloseMode::Immediate; }

  // Request to close after draining currently buffered writes.
  void requestDrainAndClose() noexcept {
    if (closeMode == CloseMode::None) {
      closeMode = CloseMode::DrainThenClose;
    }
  }

  Connection connection;
  PlainTransport transport;
  RawChars inBuffer;   // accumulated input raw data
  RawChars outBuffer;  // pending outbound data not yet written
  ResponseIntent intent;
  std::optional<ResponseStreamer> streamer;  // set while the body of intent is being produced
  // Once our write side is shut down, input is discarded until the peer closes or this deadline passes.
  std::chrono::steady_clock::time_point lingerDeadline;
  uint32_t requestsServed{0};
  CloseMode closeMode{CloseMode::None};
  bool closeAfterResponse{false};
  bool waitingWritable{false};
  bool writeShutdown{false};
  bool peerClosed{false};  // end of stream received from the client
  bool readPaused{false};  // input left in the socket because inBuffer exceeds maxHeaderBytes
};

}  // namespace statik
