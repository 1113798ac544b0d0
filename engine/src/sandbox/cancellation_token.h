#pragma once

#include <atomic>

namespace scriptbox {

/**
 * Cooperative cancellation flag shared between a caller and a running call.
 * Polled by the interpreter interrupt handler, the event loop and remote
 * module fetches.
 */
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace scriptbox
