#pragma once

namespace statik {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM that request a graceful stop.
  static void Enable();

  // Restores default behavior for SIGINT and SIGTERM.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Signal number received, 0 if none.
  static int ReceivedSignal();

 private:
  friend class SignalHandlerTest;

  // Allows multiple test runs in the same process.
  static void ResetStopRequest();
};

}  // namespace statik
