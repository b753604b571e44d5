#include "ctload/metrics.hpp"

namespace ctload {

void MetricsAggregator::touch() {
  if (!counters_.has_activity) {
    counters_.has_activity = true;
    counters_.start_time = Clock::now();
  }
}

void MetricsAggregator::add_connected() {
  std::lock_guard<std::mutex> lock(mutex_);
  touch();
  ++counters_.connected_total;
}

void MetricsAggregator::add_disconnected() {
  std::lock_guard<std::mutex> lock(mutex_);
  touch();
  ++counters_.disconnected_total;
}

void MetricsAggregator::add_error() {
  std::lock_guard<std::mutex> lock(mutex_);
  touch();
  ++counters_.error_total;
}

void MetricsAggregator::add_message(uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  touch();
  ++counters_.message_total;
  counters_.byte_total += bytes;
}

void MetricsAggregator::record_drop(bool abnormal) {
  std::lock_guard<std::mutex> lock(mutex_);
  touch();
  ++counters_.disconnected_total;
  if (abnormal) ++counters_.error_total;
}

MetricsSnapshot MetricsAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snap = counters_;
  snap.taken_at = Clock::now();
  return snap;
}

}  // namespace ctload
