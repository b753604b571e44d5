#ifndef CTLOAD_METRICS_HPP_
#define CTLOAD_METRICS_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <mutex>

namespace ctload {

using Clock = std::chrono::steady_clock;

// ============================================================================
// MetricsSnapshot - consistent copy of every counter
// ============================================================================

struct MetricsSnapshot {
  uint64_t connected_total = 0;
  uint64_t disconnected_total = 0;
  uint64_t error_total = 0;
  uint64_t message_total = 0;
  uint64_t byte_total = 0;

  bool has_activity = false;    // Any counter has changed since start
  Clock::time_point start_time;  // First counter change; valid if has_activity
  Clock::time_point taken_at;

  // Seconds since the first counter change, 0 before any activity.
  double elapsed_seconds() const {
    if (!has_activity) return 0.0;
    return std::chrono::duration<double>(taken_at - start_time).count();
  }
};

// ============================================================================
// MetricsAggregator - process-wide counters shared by all workers
// ============================================================================
//
// One mutex guards every counter so that snapshot() never mixes values from
// before and after a single update. Counters only grow.

class alignas(kCacheLine) MetricsAggregator {
 public:
  MetricsAggregator() = default;

  MetricsAggregator(const MetricsAggregator&) = delete;
  MetricsAggregator& operator=(const MetricsAggregator&) = delete;

  void add_connected();
  void add_disconnected();
  void add_error();
  void add_message(uint64_t bytes);

  // A connected session ended: one disconnect, plus one error if abnormal,
  // applied as a single update.
  void record_drop(bool abnormal);

  MetricsSnapshot snapshot() const;

 private:
  // Caller holds mutex_.
  void touch();

  mutable std::mutex mutex_;
  MetricsSnapshot counters_;
};

}  // namespace ctload

#endif  // CTLOAD_METRICS_HPP_
