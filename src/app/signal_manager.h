/**
 * @file signal_manager.h
 * @brief RAII signal handler manager
 */

#ifndef MONITORGATE_APP_SIGNAL_MANAGER_H_
#define MONITORGATE_APP_SIGNAL_MANAGER_H_

#include <array>
#include <csignal>
#include <memory>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Signal flags (async-signal-safe)
 *
 * Only sig_atomic_t members; signal handlers write them and the main loop
 * polls them. Must remain POD.
 */
struct SignalFlags {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t shutdown_requested = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t log_reopen_requested = 0;
};

/**
 * @brief RAII signal handler manager
 *
 * Create() installs:
 * - SIGINT, SIGTERM: request shutdown
 * - SIGUSR1: request log file reopen (rotation: mv log log.1 && kill -USR1 pid)
 * - SIGPIPE: ignored
 *
 * The destructor restores the previous dispositions.
 */
class SignalManager {
 public:
  static Expected<std::unique_ptr<SignalManager>, Error> Create();

  ~SignalManager();

  // Non-copyable, non-movable
  SignalManager(const SignalManager&) = delete;
  SignalManager& operator=(const SignalManager&) = delete;
  SignalManager(SignalManager&&) = delete;
  SignalManager& operator=(SignalManager&&) = delete;

  /**
   * @brief True once SIGINT or SIGTERM was received (not reset)
   */
  static bool IsShutdownRequested();

  /**
   * @brief Read and clear the SIGUSR1 flag
   */
  static bool ConsumeLogReopenRequest();

  // Static signal flags (shared with signal handler)
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  static SignalFlags signal_flags_;

 private:
  static constexpr size_t kHandledSignalCount = 4;

  SignalManager() = default;  // Private: use Create()

  Expected<void, Error> RegisterHandlers();

  /**
   * @brief Restore the first `count` saved dispositions
   */
  void RestoreHandlers(size_t count);

  std::array<struct sigaction, kHandledSignalCount> original_actions_{};
  size_t installed_count_ = 0;
};

}  // namespace monitorgate::app

#endif  // MONITORGATE_APP_SIGNAL_MANAGER_H_
