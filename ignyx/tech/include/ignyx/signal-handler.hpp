#pragma once

namespace ignyx {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM requesting a graceful stop of running servers.
  static void Enable();

  // Restores default dispositions.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested() noexcept;

  // Clears a previously received stop request so that a new server can be run in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace ignyx
