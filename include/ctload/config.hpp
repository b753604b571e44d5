#ifndef CTLOAD_CONFIG_HPP_
#define CTLOAD_CONFIG_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>

namespace ctload {

// ============================================================================
// PoolConfig
// ============================================================================

struct PoolConfig {
  static constexpr uint32_t kMaxWorkers = 100000;

  uint32_t worker_count = 500;
  std::chrono::milliseconds stagger{20};           // Pause between worker launches
  std::chrono::milliseconds stats_interval{5000};  // Reporter tick
  std::chrono::milliseconds backoff{1000};         // Minimum pause before a reconnect
  std::chrono::milliseconds grace_period{15000};   // Bound on the shutdown drain
  uint32_t progress_step = 50;                     // Spawn-progress line every N launches

  // Returns error(kInvalidConfig) and logs the offending field.
  expected<void, ErrorCode> validate() const;

  // One establish can block for connect plus handshake (twice the connect
  // timeout, three times with TLS). Returns false and logs a warning when the
  // grace period is shorter, since workers caught mid-connect at shutdown
  // would then be reported as unaccounted.
  bool grace_covers_connect(std::chrono::milliseconds connect_timeout, bool secure) const;
};

}  // namespace ctload

#endif  // CTLOAD_CONFIG_HPP_
