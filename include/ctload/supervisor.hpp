#ifndef CTLOAD_SUPERVISOR_HPP_
#define CTLOAD_SUPERVISOR_HPP_

#include "config.hpp"
#include "endpoint.hpp"
#include "metrics.hpp"
#include "shutdown.hpp"
#include "stats_reporter.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"
#include "worker.hpp"

#include <cstdint>

#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

namespace ctload {

// ============================================================================
// Pool state machine
// ============================================================================
//
//   Idle --start()--> Starting --> Running --stop()--> Stopping --> Stopped

enum class PoolState : uint8_t { kIdle, kStarting, kRunning, kStopping, kStopped };

const char* to_string(PoolState state);

struct StopReport {
  MetricsSnapshot totals;
  size_t launched = 0;     // Workers whose thread was started
  size_t stopped = 0;      // Reached Stopped within the grace period
  size_t unaccounted = 0;  // Abandoned after the grace period
};

/**
 * @brief Owns the workers, the reporter and the shutdown signal.
 *
 * Output (spawn progress, stats lines, final summary) goes to the
 * ConsoleWriter; diagnostics go to the log.
 */
class PoolSupervisor {
 public:
  PoolSupervisor(const PoolConfig& config, std::shared_ptr<const Endpoint> endpoint,
                 std::shared_ptr<Transport> transport, std::shared_ptr<ConsoleWriter> console);

  // Stops the pool if it is still running.
  ~PoolSupervisor();

  PoolSupervisor(const PoolSupervisor&) = delete;
  PoolSupervisor& operator=(const PoolSupervisor&) = delete;

  // Must be set before start().
  void set_message_handler(MessageHandler handler) { handler_ = std::move(handler); }

  // Idle -> Starting -> Running. Blocks for the staggered launch of every
  // worker (cut short if stop() is called meanwhile). error(kInvalidConfig)
  // if the config does not validate, error(kInvalidState) if not Idle.
  expected<void, ErrorCode> start();

  // start(), wait for the interrupt, stop(). An interrupt that arrives
  // while workers are still being launched is acted on once start() returns.
  expected<StopReport, ErrorCode> run(InterruptSource& interrupt);

  // Running -> Stopping -> Stopped, bounded by the grace period. Prints the
  // final summary once. Later (or concurrent) calls return the same report.
  // Before start() it does nothing and returns an empty report.
  StopReport stop();

  PoolState state() const;
  std::vector<PoolState> history() const;

  std::shared_ptr<MetricsAggregator> metrics() const { return metrics_; }

  // Launch timestamps in launch order.
  std::vector<Clock::time_point> launch_times() const;

 private:
  struct WorkerSlot {
    std::shared_ptr<ConnectionWorker> worker;
    std::thread thread;
  };

  void transition(PoolState next);  // Caller holds state_mutex_
  bool launch(uint32_t id);
  void print(const std::string& line);

  const PoolConfig config_;
  std::shared_ptr<const Endpoint> endpoint_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<ConsoleWriter> console_;
  std::shared_ptr<MetricsAggregator> metrics_;
  std::shared_ptr<ShutdownSignal> shutdown_;
  std::shared_ptr<CompletionLatch> stopped_latch_;
  MessageHandler handler_;

  // Raised by stop() before it takes lifecycle_mutex_, so a long start()
  // stops launching.
  ShutdownSignal stop_requested_;

  // Serializes start() and stop().
  std::mutex lifecycle_mutex_;

  mutable std::mutex state_mutex_;
  PoolState state_ = PoolState::kIdle;
  std::vector<PoolState> history_{PoolState::kIdle};
  std::vector<Clock::time_point> launch_times_;

  std::vector<WorkerSlot> workers_;
  std::unique_ptr<StatsReporter> reporter_;
  StopReport report_;
};

}  // namespace ctload

#endif  // CTLOAD_SUPERVISOR_HPP_
