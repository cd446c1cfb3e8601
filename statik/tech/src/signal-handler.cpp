#include "statik/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe operations here, the server loop logs the stop request.
extern "C" void StatikSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace statik {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::StatikSignalHandler);
  std::signal(SIGTERM, ::StatikSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::ReceivedSignal() { return g_signalStatus; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace statik
