#include "ctload/worker.hpp"

#include "ctload/log.hpp"

#include <exception>

namespace ctload {

const char* to_string(WorkerPhase phase) {
  switch (phase) {
    case WorkerPhase::kPending: return "pending";
    case WorkerPhase::kConnecting: return "connecting";
    case WorkerPhase::kConnected: return "connected";
    case WorkerPhase::kDisconnected: return "disconnected";
    case WorkerPhase::kStopped: return "stopped";
  }
  return "unknown";
}

ConnectionWorker::ConnectionWorker(uint32_t id, std::shared_ptr<const Endpoint> endpoint,
                                   std::shared_ptr<Transport> transport, std::shared_ptr<MetricsAggregator> metrics,
                                   std::shared_ptr<ShutdownSignal> shutdown, std::chrono::milliseconds backoff,
                                   MessageHandler handler)
    : id_(id),
      endpoint_(std::move(endpoint)),
      transport_(std::move(transport)),
      metrics_(std::move(metrics)),
      shutdown_(std::move(shutdown)),
      backoff_(backoff),
      handler_(std::move(handler)) {}

void ConnectionWorker::run() {
  const std::string tag = "[worker " + std::to_string(id_) + "] ";

  do {
    attempts_.fetch_add(1, std::memory_order_relaxed);
    set_phase(WorkerPhase::kConnecting);

    auto session = transport_->establish(*endpoint_);
    if (!session) {
      CTLOAD_LOG_DEBUG(tag + "connect failed: " + to_string(session.get_error()));
      set_phase(WorkerPhase::kDisconnected);
      metrics_->add_error();
      continue;
    }

    set_phase(WorkerPhase::kConnected);
    metrics_->add_connected();
    CTLOAD_LOG_DEBUG(tag + "connected");

    bool abnormal = consume(*session.value());
    session.value()->close();

    set_phase(WorkerPhase::kDisconnected);
    metrics_->record_drop(abnormal);
    CTLOAD_LOG_DEBUG(tag + (abnormal ? "dropped" : "closed"));
  } while (!shutdown_->wait_for(backoff_));

  set_phase(WorkerPhase::kStopped);
}

bool ConnectionWorker::consume(Session& session) {
  const auto timeout = endpoint_->options().receive_timeout;
  std::string message;

  while (!shutdown_->requested()) {
    message.clear();
    auto status = session.receive(timeout, message);
    if (!status) {
      CTLOAD_LOG_DEBUG("[worker " + std::to_string(id_) + "] receive failed: " + to_string(status.get_error()));
      return true;
    }

    switch (status.value()) {
      case ReceiveStatus::kMessage:
        metrics_->add_message(message.size());
        deliver(message);
        break;
      case ReceiveStatus::kIdle:
        break;
      case ReceiveStatus::kEndOfStream:
        return false;
    }
  }
  return false;
}

void ConnectionWorker::deliver(std::string_view message) {
  if (!handler_) return;
  try {
    handler_(id_, message);
  } catch (const std::exception& e) {
    CTLOAD_LOG_DEBUG("[worker " + std::to_string(id_) + "] message handler failed: " + e.what());
  }
}

}  // namespace ctload
