#include "ctload/metrics.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace ctload;

TEST_CASE("Metrics - fresh aggregator is all zero", "[metrics]") {
  MetricsAggregator metrics;
  MetricsSnapshot snap = metrics.snapshot();
  REQUIRE(snap.connected_total == 0);
  REQUIRE(snap.disconnected_total == 0);
  REQUIRE(snap.error_total == 0);
  REQUIRE(snap.message_total == 0);
  REQUIRE(snap.byte_total == 0);
  REQUIRE(!snap.has_activity);
  REQUIRE(snap.elapsed_seconds() == 0.0);
}

TEST_CASE("Metrics - counters and activity start", "[metrics]") {
  MetricsAggregator metrics;
  auto before = Clock::now();
  metrics.add_connected();
  metrics.add_message(120);
  metrics.add_message(80);
  metrics.add_error();
  metrics.add_disconnected();

  MetricsSnapshot snap = metrics.snapshot();
  REQUIRE(snap.connected_total == 1);
  REQUIRE(snap.disconnected_total == 1);
  REQUIRE(snap.error_total == 1);
  REQUIRE(snap.message_total == 2);
  REQUIRE(snap.byte_total == 200);
  REQUIRE(snap.has_activity);
  REQUIRE(snap.start_time >= before);
  REQUIRE(snap.taken_at >= snap.start_time);
  REQUIRE(snap.elapsed_seconds() >= 0.0);

  // Start time is fixed by the first change.
  metrics.add_connected();
  REQUIRE(metrics.snapshot().start_time == snap.start_time);
}

TEST_CASE("Metrics - record_drop", "[metrics]") {
  MetricsAggregator metrics;
  metrics.record_drop(false);
  metrics.record_drop(true);
  MetricsSnapshot snap = metrics.snapshot();
  REQUIRE(snap.disconnected_total == 2);
  REQUIRE(snap.error_total == 1);
}

TEST_CASE("Metrics - concurrent updates are not lost", "[metrics]") {
  MetricsAggregator metrics;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 5000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&metrics]() {
      for (int i = 0; i < kPerThread; ++i) {
        metrics.add_message(3);
        if (i % 10 == 0) metrics.add_connected();
        if (i % 100 == 0) metrics.record_drop(i % 200 == 0);
      }
    });
  }
  for (auto& t : threads) t.join();

  MetricsSnapshot snap = metrics.snapshot();
  REQUIRE(snap.message_total == static_cast<uint64_t>(kThreads) * kPerThread);
  REQUIRE(snap.byte_total == static_cast<uint64_t>(kThreads) * kPerThread * 3);
  REQUIRE(snap.connected_total == static_cast<uint64_t>(kThreads) * 500);
  REQUIRE(snap.disconnected_total == static_cast<uint64_t>(kThreads) * 50);
  REQUIRE(snap.error_total == static_cast<uint64_t>(kThreads) * 25);
}

TEST_CASE("Metrics - snapshots never go backwards and drops are atomic", "[metrics]") {
  MetricsAggregator metrics;
  std::atomic<bool> done{false};

  std::thread writer([&]() {
    for (int i = 0; i < 20000; ++i) {
      metrics.add_message(1);
      metrics.record_drop(true);
    }
    done.store(true);
  });

  MetricsSnapshot last = metrics.snapshot();
  bool ok = true;
  while (!done.load()) {
    MetricsSnapshot snap = metrics.snapshot();
    if (snap.message_total < last.message_total || snap.disconnected_total < last.disconnected_total ||
        snap.error_total < last.error_total || snap.taken_at < last.taken_at) {
      ok = false;
    }
    // A drop updates both counters in one step.
    if (snap.disconnected_total != snap.error_total) ok = false;
    last = snap;
  }
  writer.join();
  REQUIRE(ok);
  REQUIRE(metrics.snapshot().error_total == 20000);
}
