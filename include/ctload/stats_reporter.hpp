#ifndef CTLOAD_STATS_REPORTER_HPP_
#define CTLOAD_STATS_REPORTER_HPP_

#include "metrics.hpp"
#include "shutdown.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace ctload {

// ============================================================================
// StatsSample - one printed reporter line
// ============================================================================

struct StatsSample {
  double elapsed_s = 0.0;
  uint64_t connected_total = 0;
  uint64_t disconnected_total = 0;
  uint64_t error_total = 0;
  uint64_t message_total = 0;
  uint64_t byte_total = 0;
  double message_rate = 0.0;  // Messages per second since the previous sample
};

// ============================================================================
// ConsoleWriter - serialized line output that never throws
// ============================================================================

class ConsoleWriter {
 public:
  explicit ConsoleWriter(std::ostream& out) : out_(out) {}

  // Writes `line` plus a newline and flushes. On failure logs a warning,
  // clears the stream state and returns false.
  bool write_line(const std::string& line);

 private:
  std::mutex mutex_;
  std::ostream& out_;
};

// ============================================================================
// StatsReporter
// ============================================================================

class StatsReporter {
 public:
  StatsReporter(std::shared_ptr<MetricsAggregator> metrics, std::shared_ptr<ConsoleWriter> console,
                std::chrono::milliseconds interval);
  ~StatsReporter();

  StatsReporter(const StatsReporter&) = delete;
  StatsReporter& operator=(const StatsReporter&) = delete;

  // Feed one snapshot. The first call only records a baseline; later calls
  // return a sample once the aggregator has seen activity.
  optional<StatsSample> observe(const MetricsSnapshot& snap);

  // Take a snapshot, observe it, print the sample if any.
  void tick();

  // Run tick() every interval on a background thread. Calling start() twice
  // returns kInvalidState.
  expected<void, ErrorCode> start();

  // Idempotent. Joins the reporter thread.
  void stop();

  static std::string render(const StatsSample& sample);
  static std::string render_summary(const MetricsSnapshot& snap, size_t unaccounted_workers);

 private:
  void loop();

  std::shared_ptr<MetricsAggregator> metrics_;
  std::shared_ptr<ConsoleWriter> console_;
  const std::chrono::milliseconds interval_;

  bool has_previous_ = false;
  MetricsSnapshot previous_;

  ShutdownSignal stop_signal_;
  std::thread thread_;
};

}  // namespace ctload

#endif  // CTLOAD_STATS_REPORTER_HPP_
