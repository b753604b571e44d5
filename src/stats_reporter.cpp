#include "ctload/stats_reporter.hpp"

#include "ctload/log.hpp"

#include <cstdio>

#include <exception>
#include <ios>

namespace ctload {

// ============================================================================
// ConsoleWriter
// ============================================================================

bool ConsoleWriter::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    out_ << line << '\n';
    out_.flush();
  } catch (const std::ios_base::failure& e) {
    CTLOAD_LOG_WARN(std::string("Output failed: ") + e.what());
    out_.clear();
    return false;
  }
  if (!out_) {
    CTLOAD_LOG_WARN("Output stream in failed state; line dropped");
    out_.clear();
    return false;
  }
  return true;
}

// ============================================================================
// StatsReporter
// ============================================================================

StatsReporter::StatsReporter(std::shared_ptr<MetricsAggregator> metrics, std::shared_ptr<ConsoleWriter> console,
                             std::chrono::milliseconds interval)
    : metrics_(std::move(metrics)), console_(std::move(console)), interval_(interval) {}

StatsReporter::~StatsReporter() { stop(); }

optional<StatsSample> StatsReporter::observe(const MetricsSnapshot& snap) {
  if (!has_previous_) {
    previous_ = snap;
    has_previous_ = true;
    return optional<StatsSample>();
  }

  double seconds = std::chrono::duration<double>(snap.taken_at - previous_.taken_at).count();
  uint64_t delta = snap.message_total - previous_.message_total;
  previous_ = snap;
  if (!snap.has_activity) return optional<StatsSample>();

  StatsSample sample;
  sample.elapsed_s = snap.elapsed_seconds();
  sample.connected_total = snap.connected_total;
  sample.disconnected_total = snap.disconnected_total;
  sample.error_total = snap.error_total;
  sample.message_total = snap.message_total;
  sample.byte_total = snap.byte_total;
  sample.message_rate = seconds > 0.0 ? static_cast<double>(delta) / seconds : 0.0;
  return optional<StatsSample>(sample);
}

void StatsReporter::tick() {
  auto sample = observe(metrics_->snapshot());
  if (sample.has_value()) console_->write_line(render(sample.value()));
}

expected<void, ErrorCode> StatsReporter::start() {
  if (thread_.joinable()) return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  thread_ = std::thread(&StatsReporter::loop, this);
  return expected<void, ErrorCode>::success();
}

void StatsReporter::stop() {
  stop_signal_.request();
  if (thread_.joinable()) thread_.join();
}

void StatsReporter::loop() {
  tick();  // baseline
  auto next = Clock::now() + interval_;
  while (!stop_signal_.wait_until(next)) {
    tick();
    next += interval_;
  }
}

std::string StatsReporter::render(const StatsSample& sample) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "[%.0fs] Connected: %llu | Disconnected: %llu | Errors: %llu | Messages: %llu | Rate: %.1f/s",
                sample.elapsed_s, static_cast<unsigned long long>(sample.connected_total),
                static_cast<unsigned long long>(sample.disconnected_total),
                static_cast<unsigned long long>(sample.error_total),
                static_cast<unsigned long long>(sample.message_total), sample.message_rate);
  return std::string(buf);
}

std::string StatsReporter::render_summary(const MetricsSnapshot& snap, size_t unaccounted_workers) {
  std::string out = "=== Final Stats ===\n";
  char elapsed[32];
  std::snprintf(elapsed, sizeof(elapsed), "%.1fs", snap.elapsed_seconds());
  out += "Elapsed: " + std::string(elapsed) + "\n";
  out += "Total Connected: " + std::to_string(snap.connected_total) + "\n";
  out += "Total Disconnected: " + std::to_string(snap.disconnected_total) + "\n";
  out += "Total Errors: " + std::to_string(snap.error_total) + "\n";
  out += "Total Messages: " + std::to_string(snap.message_total) + "\n";
  out += "Total Bytes: " + std::to_string(snap.byte_total) + "\n";
  out += "Unaccounted Workers: " + std::to_string(unaccounted_workers);
  return out;
}

}  // namespace ctload
