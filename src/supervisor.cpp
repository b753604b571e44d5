#include "ctload/supervisor.hpp"

#include "ctload/log.hpp"

#include <string>
#include <system_error>

namespace ctload {

const char* to_string(PoolState state) {
  switch (state) {
    case PoolState::kIdle: return "idle";
    case PoolState::kStarting: return "starting";
    case PoolState::kRunning: return "running";
    case PoolState::kStopping: return "stopping";
    case PoolState::kStopped: return "stopped";
  }
  return "unknown";
}

PoolSupervisor::PoolSupervisor(const PoolConfig& config, std::shared_ptr<const Endpoint> endpoint,
                               std::shared_ptr<Transport> transport, std::shared_ptr<ConsoleWriter> console)
    : config_(config),
      endpoint_(std::move(endpoint)),
      transport_(std::move(transport)),
      console_(std::move(console)),
      metrics_(std::make_shared<MetricsAggregator>()),
      shutdown_(std::make_shared<ShutdownSignal>()),
      stopped_latch_(std::make_shared<CompletionLatch>()) {}

PoolSupervisor::~PoolSupervisor() {
  PoolState current = state();
  if (current != PoolState::kIdle && current != PoolState::kStopped) stop();
}

void PoolSupervisor::transition(PoolState next) {
  CTLOAD_LOG_DEBUG(std::string("Pool ") + to_string(state_) + " -> " + to_string(next));
  state_ = next;
  history_.push_back(next);
}

void PoolSupervisor::print(const std::string& line) { console_->write_line(line); }

expected<void, ErrorCode> PoolSupervisor::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != PoolState::kIdle) {
      CTLOAD_LOG_WARN(std::string("start() ignored: pool is ") + to_string(state_));
      return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
    }
  }
  auto valid = config_.validate();
  if (!valid) return valid;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transition(PoolState::kStarting);
    launch_times_.reserve(config_.worker_count);
  }

  const uint32_t total = config_.worker_count;
  print("Starting stress test with " + std::to_string(total) + " clients");
  print("URL: " + endpoint_->url());
  print("");

  reporter_ = std::make_unique<StatsReporter>(metrics_, console_, config_.stats_interval);
  auto reporting = reporter_->start();
  if (!reporting) CTLOAD_LOG_WARN(std::string("Stats reporter not started: ") + to_string(reporting.get_error()));

  workers_.reserve(total);
  const auto first = Clock::now();
  uint32_t launched = 0;
  for (uint32_t i = 0; i < total; ++i) {
    // Launch i is due at first + i * stagger, so sleep overshoot never accumulates.
    if (i > 0 && stop_requested_.wait_until(first + config_.stagger * i)) break;
    if (!launch(i)) break;
    ++launched;
    if (launched % config_.progress_step == 0) {
      print("Spawned " + std::to_string(launched) + "/" + std::to_string(total) + " clients...");
    }
  }

  if (launched == total) {
    print("");
    print("All " + std::to_string(total) + " clients spawned. Press Ctrl+C to stop.");
    print("");
  } else {
    CTLOAD_LOG_WARN("Launched " + std::to_string(launched) + " of " + std::to_string(total) + " workers");
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  transition(PoolState::kRunning);
  return expected<void, ErrorCode>::success();
}

bool PoolSupervisor::launch(uint32_t id) {
  auto worker = std::make_shared<ConnectionWorker>(id, endpoint_, transport_, metrics_, shutdown_, config_.backoff,
                                                   handler_);
  const auto now = Clock::now();
  worker->mark_launched(now);

  // The thread owns its own references; an abandoned worker never outlives
  // what it uses.
  auto latch = stopped_latch_;
  WorkerSlot slot;
  slot.worker = worker;
  try {
    slot.thread = std::thread([worker, latch] {
      worker->run();
      latch->arrive();
    });
  } catch (const std::system_error& e) {
    CTLOAD_LOG_ERROR("Cannot start worker thread " + std::to_string(id) + ": " + e.what());
    return false;
  }
  workers_.push_back(std::move(slot));

  std::lock_guard<std::mutex> lock(state_mutex_);
  launch_times_.push_back(now);
  return true;
}

expected<StopReport, ErrorCode> PoolSupervisor::run(InterruptSource& interrupt) {
  auto started = start();
  if (!started) return expected<StopReport, ErrorCode>::error(started.get_error());
  interrupt.wait();
  return expected<StopReport, ErrorCode>::success(stop());
}

StopReport PoolSupervisor::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == PoolState::kIdle) return report_;
  }
  stop_requested_.request();

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == PoolState::kStopped) return report_;
    transition(PoolState::kStopping);
  }

  print("");
  print("Stopping...");
  shutdown_->request();

  const auto deadline = Clock::now() + config_.grace_period;
  size_t arrived = stopped_latch_->wait_until(workers_.size(), deadline);
  CTLOAD_LOG_DEBUG(std::to_string(arrived) + "/" + std::to_string(workers_.size()) + " workers stopped in time");

  size_t stopped = 0;
  size_t unaccounted = 0;
  for (auto& slot : workers_) {
    if (slot.worker->phase() == WorkerPhase::kStopped) {
      slot.thread.join();
      ++stopped;
    } else {
      CTLOAD_LOG_DEBUG("Abandoning worker " + std::to_string(slot.worker->id()) + " in phase " +
                       to_string(slot.worker->phase()));
      slot.thread.detach();
      ++unaccounted;
    }
  }
  if (unaccounted > 0) {
    CTLOAD_LOG_WARN(std::to_string(unaccounted) + " workers did not stop within " +
                    std::to_string(config_.grace_period.count()) + " ms");
  }

  if (reporter_) reporter_->stop();

  report_.totals = metrics_->snapshot();
  report_.launched = workers_.size();
  report_.stopped = stopped;
  report_.unaccounted = unaccounted;
  workers_.clear();

  print("");
  print(StatsReporter::render_summary(report_.totals, unaccounted));

  std::lock_guard<std::mutex> lock(state_mutex_);
  transition(PoolState::kStopped);
  return report_;
}

PoolState PoolSupervisor::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::vector<PoolState> PoolSupervisor::history() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return history_;
}

std::vector<Clock::time_point> PoolSupervisor::launch_times() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return launch_times_;
}

}  // namespace ctload
