#include "ctload/config.hpp"

#include "ctload/log.hpp"

#include <string>

namespace ctload {

expected<void, ErrorCode> PoolConfig::validate() const {
  auto reject = [](const std::string& why) {
    CTLOAD_LOG_ERROR("Invalid pool configuration: " + why);
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
  };

  if (worker_count > kMaxWorkers) {
    return reject("worker count " + std::to_string(worker_count) + " exceeds " + std::to_string(kMaxWorkers));
  }
  if (stagger.count() < 0) return reject("stagger delay is negative");
  if (stats_interval.count() <= 0) return reject("stats interval must be positive");
  if (backoff.count() <= 0) return reject("reconnect backoff must be positive");
  if (grace_period.count() < 0) return reject("grace period is negative");
  if (progress_step == 0) return reject("progress step must be positive");
  return expected<void, ErrorCode>::success();
}

bool PoolConfig::grace_covers_connect(std::chrono::milliseconds connect_timeout, bool secure) const {
  const auto worst = connect_timeout * (secure ? 3 : 2);
  if (grace_period >= worst) return true;
  CTLOAD_LOG_WARN("Grace period " + std::to_string(grace_period.count()) + " ms is shorter than a worst-case connect (" +
                  std::to_string(worst.count()) + " ms); workers still connecting at shutdown will be unaccounted");
  return false;
}

}  // namespace ctload
