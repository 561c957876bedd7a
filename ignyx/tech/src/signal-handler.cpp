#include "ignyx/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void IgnyxSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace ignyx {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::IgnyxSignalHandler);
  std::signal(SIGTERM, ::IgnyxSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() noexcept { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() noexcept { g_signalStatus = 0; }

}  // namespace ignyx
