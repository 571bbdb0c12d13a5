#pragma once
#include <atomic>
#include <memory>

#include "core/Errors.hpp"

// Read side of a cancellation flag. Copies share the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

  void throwIfCancelled() const {
    if (isCancelled()) throw Cancelled();
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
    : flag_(std::move(flag)) {}

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  // Lock-free store only; safe to call from a signal handler.
  void cancel() { flag_->store(true, std::memory_order_release); }

  bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

  CancellationToken token() const { return CancellationToken(flag_); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};
