#ifndef CTLOAD_SHUTDOWN_HPP_
#define CTLOAD_SHUTDOWN_HPP_

#include <csignal>
#include <cstddef>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ctload {

// ============================================================================
// ShutdownSignal - write-once, read-many stop flag
// ============================================================================

class ShutdownSignal {
 public:
  // Returns true for the call that actually raised the signal.
  bool request();

  bool requested() const { return requested_.load(std::memory_order_acquire); }

  // Sleep up to `timeout`, waking early on request(). Returns requested().
  bool wait_for(std::chrono::milliseconds timeout);
  bool wait_until(std::chrono::steady_clock::time_point deadline);

 private:
  std::atomic<bool> requested_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

// ============================================================================
// CompletionLatch - counts workers that have reached Stopped
// ============================================================================

class CompletionLatch {
 public:
  void arrive();

  size_t arrived() const;

  // Wait until at least `target` arrivals or the deadline. Returns arrivals.
  size_t wait_until(size_t target, std::chrono::steady_clock::time_point deadline);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t arrived_ = 0;
};

// ============================================================================
// InterruptSource - operator stop notification
// ============================================================================

class InterruptSource {
 public:
  virtual ~InterruptSource() = default;

  // Blocks until the operator asks the pool to stop.
  virtual void wait() = 0;
};

/**
 * @brief SIGINT/SIGTERM delivered synchronously through sigwait().
 *
 * The constructor blocks both signals in the calling thread's mask. Create it
 * before any other thread starts so every thread inherits the mask and the
 * signals stay pending for wait(). The destructor restores the old mask.
 */
class SignalInterruptSource : public InterruptSource {
 public:
  SignalInterruptSource();
  ~SignalInterruptSource() override;

  SignalInterruptSource(const SignalInterruptSource&) = delete;
  SignalInterruptSource& operator=(const SignalInterruptSource&) = delete;

  void wait() override;

  // Signal number that ended the last wait(), 0 before that.
  int last_signal() const { return last_signal_; }

 private:
  sigset_t set_;
  sigset_t previous_;
  bool mask_installed_ = false;
  int last_signal_ = 0;
};

// Programmatic interrupt for tests and embedding.
class ManualInterruptSource : public InterruptSource {
 public:
  void fire();
  void wait() override;

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool fired_ = false;
};

}  // namespace ctload

#endif  // CTLOAD_SHUTDOWN_HPP_
