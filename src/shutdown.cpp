#include "ctload/shutdown.hpp"

#include "ctload/log.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace ctload {

// ============================================================================
// ShutdownSignal
// ============================================================================

bool ShutdownSignal::request() {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    first = !requested_.exchange(true, std::memory_order_acq_rel);
  }
  cv_.notify_all();
  return first;
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return requested_.load(std::memory_order_acquire); });
}

bool ShutdownSignal::wait_until(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_until(lock, deadline, [this] { return requested_.load(std::memory_order_acquire); });
}

// ============================================================================
// CompletionLatch
// ============================================================================

void CompletionLatch::arrive() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++arrived_;
  }
  cv_.notify_all();
}

size_t CompletionLatch::arrived() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return arrived_;
}

size_t CompletionLatch::wait_until(size_t target, std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_until(lock, deadline, [this, target] { return arrived_ >= target; });
  return arrived_;
}

// ============================================================================
// SignalInterruptSource
// ============================================================================

SignalInterruptSource::SignalInterruptSource() {
  sigemptyset(&set_);
  sigaddset(&set_, SIGINT);
  sigaddset(&set_, SIGTERM);
  int rc = pthread_sigmask(SIG_BLOCK, &set_, &previous_);
  if (rc != 0) {
    CTLOAD_LOG_ERROR("pthread_sigmask failed: " + std::string(strerror(rc)));
    return;
  }
  mask_installed_ = true;
}

SignalInterruptSource::~SignalInterruptSource() {
  if (mask_installed_ && pthread_sigmask(SIG_SETMASK, &previous_, nullptr) != 0) {
    CTLOAD_LOG_WARN("Could not restore signal mask");
  }
}

void SignalInterruptSource::wait() {
  if (!mask_installed_) {
    // Without the mask the default handler terminates the process on SIGINT.
    CTLOAD_LOG_WARN("Interrupt mask not installed; waiting on default signal handling");
  }
  int sig = 0;
  int rc = 0;
  do {
    rc = sigwait(&set_, &sig);
  } while (rc == EINTR);
  if (rc != 0) {
    CTLOAD_LOG_ERROR("sigwait failed: " + std::string(strerror(rc)));
    return;
  }
  last_signal_ = sig;
  CTLOAD_LOG_DEBUG("Received signal " + std::to_string(sig));
}

// ============================================================================
// ManualInterruptSource
// ============================================================================

void ManualInterruptSource::fire() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fired_ = true;
  }
  cv_.notify_all();
}

void ManualInterruptSource::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return fired_; });
}

}  // namespace ctload
