/**
 * @file signal_manager.cpp
 * @brief RAII signal handler manager implementation
 */

#include "app/signal_manager.h"

#include <cerrno>
#include <cstring>
#include <string>

namespace monitorgate::app {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
SignalFlags SignalManager::signal_flags_;

namespace {

struct SignalSpec {
  int signal;
  const char* name;
};

// Installation order; restored in reverse on failure
constexpr std::array<SignalSpec, 4> kHandledSignals = {{
    {SIGINT, "SIGINT"},
    {SIGTERM, "SIGTERM"},
    {SIGUSR1, "SIGUSR1"},
    {SIGPIPE, "SIGPIPE"},
}};

/**
 * @brief Async-signal-safe handler: only assigns sig_atomic_t flags
 */
void SignalHandlerFunction(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    SignalManager::signal_flags_.shutdown_requested = 1;
  } else if (signal == SIGUSR1) {
    SignalManager::signal_flags_.log_reopen_requested = 1;
  }
}

}  // namespace

Expected<std::unique_ptr<SignalManager>, Error> SignalManager::Create() {
  auto manager = std::unique_ptr<SignalManager>(new SignalManager());

  auto register_result = manager->RegisterHandlers();
  if (!register_result) {
    return utils::MakeUnexpected(register_result.error());
  }

  return manager;
}

SignalManager::~SignalManager() {
  RestoreHandlers(installed_count_);
}

bool SignalManager::IsShutdownRequested() {  // static
  return signal_flags_.shutdown_requested != 0;
}

bool SignalManager::ConsumeLogReopenRequest() {  // static
  if (signal_flags_.log_reopen_requested != 0) {
    signal_flags_.log_reopen_requested = 0;
    return true;
  }
  return false;
}

Expected<void, Error> SignalManager::RegisterHandlers() {
  static_assert(kHandledSignals.size() == kHandledSignalCount, "one saved action per handled signal");

  for (size_t i = 0; i < kHandledSignals.size(); ++i) {
    struct sigaction action {};
    std::memset(&action, 0, sizeof(action));
    // SIGPIPE is ignored process-wide so that writes to closed sockets return EPIPE
    action.sa_handler = kHandledSignals[i].signal == SIGPIPE ? SIG_IGN : SignalHandlerFunction;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(kHandledSignals[i].signal, &action, &original_actions_[i]) != 0) {
      const std::string reason = std::strerror(errno);
      RestoreHandlers(i);
      installed_count_ = 0;
      return utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kInternalError,
          std::string("Failed to register ") + kHandledSignals[i].name + " handler: " + reason));
    }
  }

  installed_count_ = kHandledSignals.size();
  return {};
}

void SignalManager::RestoreHandlers(size_t count) {
  for (size_t i = count; i > 0; --i) {
    sigaction(kHandledSignals[i - 1].signal, &original_actions_[i - 1], nullptr);
  }
}

}  // namespace monitorgate::app
