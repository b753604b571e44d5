#ifndef CTLOAD_TESTS_FAKE_TRANSPORT_HPP_
#define CTLOAD_TESTS_FAKE_TRANSPORT_HPP_

#include "ctload/transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ctload {
namespace testing {

// One scripted receive() result.
struct FakeStep {
  enum class Kind { kMessage, kIdle, kEnd, kError };

  Kind kind = Kind::kIdle;
  std::string text;
  ErrorCode code = ErrorCode::kOk;

  static FakeStep message(std::string text) { return {Kind::kMessage, std::move(text), ErrorCode::kOk}; }
  static FakeStep idle() { return {Kind::kIdle, std::string(), ErrorCode::kOk}; }
  static FakeStep end() { return {Kind::kEnd, std::string(), ErrorCode::kOk}; }
  static FakeStep error(ErrorCode e) { return {Kind::kError, std::string(), e}; }
};

// What a session does once its script is used up.
enum class FakeTail {
  kIdle,   // Short sleep, then kIdle (a quiet but healthy stream)
  kEnd,    // Clean end of stream
  kError,  // Abnormal closure
  kBlock   // Ignore the timeout until release() (a stuck peer)
};

/**
 * @brief Transport that never touches the network.
 *
 * Configure the public fields before any worker uses it. Counters may be
 * read while workers run.
 */
class FakeTransport : public Transport, public std::enable_shared_from_this<FakeTransport> {
 public:
  bool fail_connect = false;
  ErrorCode connect_error = ErrorCode::kConnectFailed;
  std::vector<FakeStep> script;
  FakeTail tail = FakeTail::kIdle;
  std::function<void()> on_exhausted;  // Called once per session, before the tail

  std::atomic<int> establish_calls{0};
  std::atomic<int> open_sessions{0};
  std::atomic<int> closes{0};

  expected<std::unique_ptr<Session>, ErrorCode> establish(const Endpoint& /* endpoint */) override {
    using Result = expected<std::unique_ptr<Session>, ErrorCode>;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      establish_times_.push_back(std::chrono::steady_clock::now());
    }
    establish_calls.fetch_add(1);
    if (fail_connect) return Result::error(connect_error);
    return Result::success(std::unique_ptr<Session>(new FakeSession(shared_from_this())));
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  std::vector<std::chrono::steady_clock::time_point> establish_times() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return establish_times_;
  }

 private:
  class FakeSession : public Session {
   public:
    explicit FakeSession(std::shared_ptr<FakeTransport> owner) : owner_(std::move(owner)) {
      owner_->open_sessions.fetch_add(1);
    }
    ~FakeSession() override { owner_->open_sessions.fetch_sub(1); }

    expected<ReceiveStatus, ErrorCode> receive(std::chrono::milliseconds timeout, std::string& out) override {
      using Result = expected<ReceiveStatus, ErrorCode>;
      if (next_ < owner_->script.size()) {
        const FakeStep& step = owner_->script[next_++];
        switch (step.kind) {
          case FakeStep::Kind::kMessage:
            out = step.text;
            return Result::success(ReceiveStatus::kMessage);
          case FakeStep::Kind::kIdle:
            return Result::success(ReceiveStatus::kIdle);
          case FakeStep::Kind::kEnd:
            return Result::success(ReceiveStatus::kEndOfStream);
          case FakeStep::Kind::kError:
            return Result::error(step.code);
        }
      }

      if (!exhausted_) {
        exhausted_ = true;
        if (owner_->on_exhausted) owner_->on_exhausted();
      }
      switch (owner_->tail) {
        case FakeTail::kIdle:
          std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
          return Result::success(ReceiveStatus::kIdle);
        case FakeTail::kEnd:
          return Result::success(ReceiveStatus::kEndOfStream);
        case FakeTail::kError:
          return Result::error(ErrorCode::kConnectionClosed);
        case FakeTail::kBlock:
          owner_->wait_released();
          return Result::success(ReceiveStatus::kEndOfStream);
      }
      return Result::error(ErrorCode::kInternalError);
    }

    void close() override {
      if (closed_) return;
      closed_ = true;
      owner_->closes.fetch_add(1);
    }

   private:
    std::shared_ptr<FakeTransport> owner_;
    size_t next_ = 0;
    bool exhausted_ = false;
    bool closed_ = false;
  };

  void wait_released() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return released_; });
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool released_ = false;
  std::vector<std::chrono::steady_clock::time_point> establish_times_;
};

// Poll `done` every millisecond until it holds or `limit` passes.
inline bool eventually(const std::function<bool()>& done,
                       std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

inline std::shared_ptr<const Endpoint> fake_endpoint(const char* url = "ws://localhost:8080/") {
  auto parsed = Endpoint::parse(url);
  return std::make_shared<Endpoint>(parsed.value());
}

}  // namespace testing
}  // namespace ctload

#endif  // CTLOAD_TESTS_FAKE_TRANSPORT_HPP_
