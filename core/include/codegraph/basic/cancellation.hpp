// codegraph/basic/cancellation.hpp - Cooperative cancellation for long passes
//
#pragma once

#include <atomic>
#include <memory>

namespace codegraph
{

/**
 * Shared cancellation flag.
 *
 * The caller keeps a copy and calls cancel(); validator and propagator passes
 * poll is_cancelled() between units of work and discard their partial result.
 * A default-constructed token can never be cancelled.
 */
class CancellationToken
{
public:
  CancellationToken() = default;

  /// Create a token that can actually be cancelled
  [[nodiscard]] static CancellationToken make()
  {
    CancellationToken t;
    t.flag_ = std::make_shared<std::atomic<bool>>(false);
    return t;
  }

  void cancel() const noexcept
  {
    if (flag_) flag_->store(true, std::memory_order_relaxed);
  }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace codegraph
