#pragma once

#include <atomic>

namespace switchboard::common {

/// Cooperative cancellation flag shared between a streaming caller and the producer.
class CancellationToken {
public:
  void cancel() { canceled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool is_canceled() const { return canceled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> canceled_{false};
};

} // namespace switchboard::common
