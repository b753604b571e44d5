#ifndef CTLOAD_WORKER_HPP_
#define CTLOAD_WORKER_HPP_

#include "endpoint.hpp"
#include "metrics.hpp"
#include "shutdown.hpp"
#include "transport.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ctload {

// ============================================================================
// Worker phases
// ============================================================================

enum class WorkerPhase : uint8_t {
  kPending,       // Created, run() not entered yet
  kConnecting,    // Establishing transport + protocol handshake
  kConnected,     // Consuming messages
  kDisconnected,  // Between attempts (backoff)
  kStopped        // run() returned
};

const char* to_string(WorkerPhase phase);

// Thrown by a message consumer that cannot make sense of a payload.
// The worker logs it and keeps receiving.
class ProtocolDecodeError : public std::runtime_error {
 public:
  explicit ProtocolDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Optional consumer of every received message. Runs on the worker's thread.
using MessageHandler = std::function<void(uint32_t worker_id, std::string_view message)>;

/**
 * @brief One simulated client: connect, consume, back off, retry.
 *
 * Counting rules:
 *  - failed establish: error_total += 1 (never counted as a disconnect)
 *  - established session: connected_total += 1, and exactly one
 *    record_drop() when it ends (abnormal = receive failed)
 *
 * Everything run() touches is held by shared_ptr so that a worker abandoned
 * by the supervisor can finish safely on its own.
 */
class ConnectionWorker {
 public:
  ConnectionWorker(uint32_t id, std::shared_ptr<const Endpoint> endpoint, std::shared_ptr<Transport> transport,
                   std::shared_ptr<MetricsAggregator> metrics, std::shared_ptr<ShutdownSignal> shutdown,
                   std::chrono::milliseconds backoff, MessageHandler handler = nullptr);

  ConnectionWorker(const ConnectionWorker&) = delete;
  ConnectionWorker& operator=(const ConnectionWorker&) = delete;

  // Blocks until shutdown. Makes at least one attempt even if shutdown was
  // already requested.
  void run();

  uint32_t id() const { return id_; }
  WorkerPhase phase() const { return phase_.load(std::memory_order_acquire); }
  uint32_t attempts() const { return attempts_.load(std::memory_order_relaxed); }

  // Set by the supervisor before the worker's thread starts.
  void mark_launched(Clock::time_point at) { launched_at_ = at; }
  Clock::time_point launched_at() const { return launched_at_; }

 private:
  // Returns true if the session ended abnormally.
  bool consume(Session& session);
  void deliver(std::string_view message);
  void set_phase(WorkerPhase phase) { phase_.store(phase, std::memory_order_release); }

  const uint32_t id_;
  std::shared_ptr<const Endpoint> endpoint_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<MetricsAggregator> metrics_;
  std::shared_ptr<ShutdownSignal> shutdown_;
  const std::chrono::milliseconds backoff_;
  MessageHandler handler_;

  std::atomic<WorkerPhase> phase_{WorkerPhase::kPending};
  std::atomic<uint32_t> attempts_{0};
  Clock::time_point launched_at_;
};

}  // namespace ctload

#endif  // CTLOAD_WORKER_HPP_
