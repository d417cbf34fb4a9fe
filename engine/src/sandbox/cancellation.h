#pragma once

#include <atomic>

namespace analysis_sandbox {

/**
 * Cooperative cancellation flag shared between a caller and a running session.
 * The sandbox polls it once per polling interval.
 */
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace analysis_sandbox
