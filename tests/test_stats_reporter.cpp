#include "ctload/stats_reporter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <thread>

using namespace ctload;

namespace {

MetricsSnapshot snapshot_at(Clock::time_point start, int seconds, uint64_t messages) {
  MetricsSnapshot snap;
  snap.has_activity = true;
  snap.start_time = start;
  snap.taken_at = start + std::chrono::seconds(seconds);
  snap.connected_total = 10;
  snap.message_total = messages;
  snap.byte_total = messages * 100;
  return snap;
}

size_t count_lines(const std::string& text) {
  size_t n = 0;
  for (char c : text) {
    if (c == '\n') ++n;
  }
  return n;
}

}  // namespace

TEST_CASE("StatsReporter - rate is the delta since the previous sample", "[stats]") {
  auto metrics = std::make_shared<MetricsAggregator>();
  std::ostringstream out;
  auto console = std::make_shared<ConsoleWriter>(out);
  StatsReporter reporter(metrics, console, std::chrono::seconds(5));

  auto start = Clock::now();
  REQUIRE(!reporter.observe(snapshot_at(start, 0, 0)).has_value());

  auto first = reporter.observe(snapshot_at(start, 5, 50));
  REQUIRE(first.has_value());
  REQUIRE(first.value().message_rate == 10.0);
  REQUIRE(first.value().message_total == 50);
  REQUIRE(first.value().elapsed_s == 5.0);

  auto second = reporter.observe(snapshot_at(start, 10, 120));
  REQUIRE(second.has_value());
  REQUIRE(second.value().message_rate == 14.0);
  REQUIRE(second.value().connected_total == 10);
}

TEST_CASE("StatsReporter - silent before any activity", "[stats]") {
  auto metrics = std::make_shared<MetricsAggregator>();
  std::ostringstream out;
  auto console = std::make_shared<ConsoleWriter>(out);
  StatsReporter reporter(metrics, console, std::chrono::seconds(5));

  reporter.tick();
  reporter.tick();
  REQUIRE(out.str().empty());

  metrics->add_connected();
  reporter.tick();
  REQUIRE(out.str().find("Connected: 1 |") != std::string::npos);
}

TEST_CASE("StatsReporter - render", "[stats]") {
  StatsSample sample;
  sample.elapsed_s = 15.2;
  sample.connected_total = 500;
  sample.disconnected_total = 3;
  sample.error_total = 1;
  sample.message_total = 12345;
  sample.message_rate = 823.04;
  REQUIRE(StatsReporter::render(sample) ==
          "[15s] Connected: 500 | Disconnected: 3 | Errors: 1 | Messages: 12345 | Rate: 823.0/s");
}

TEST_CASE("StatsReporter - summary", "[stats]") {
  MetricsSnapshot snap = snapshot_at(Clock::now(), 12, 7);
  snap.disconnected_total = 4;
  snap.error_total = 2;
  std::string text = StatsReporter::render_summary(snap, 3);
  REQUIRE(text ==
          "=== Final Stats ===\n"
          "Elapsed: 12.0s\n"
          "Total Connected: 10\n"
          "Total Disconnected: 4\n"
          "Total Errors: 2\n"
          "Total Messages: 7\n"
          "Total Bytes: 700\n"
          "Unaccounted Workers: 3");

  MetricsSnapshot empty;
  REQUIRE(StatsReporter::render_summary(empty, 0).find("Elapsed: 0.0s\n") != std::string::npos);
}

TEST_CASE("StatsReporter - periodic output and stop", "[stats]") {
  auto metrics = std::make_shared<MetricsAggregator>();
  metrics->add_connected();
  std::ostringstream out;
  auto console = std::make_shared<ConsoleWriter>(out);
  StatsReporter reporter(metrics, console, std::chrono::milliseconds(20));

  REQUIRE(reporter.start().has_value());
  auto again = reporter.start();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == ErrorCode::kInvalidState);

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  reporter.stop();
  reporter.stop();

  // Reading the stream is safe once the reporter thread is joined.
  std::string text = out.str();
  REQUIRE(count_lines(text) >= 2);
  size_t lines = count_lines(text);
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(count_lines(out.str()) == lines);
}

TEST_CASE("ConsoleWriter - failed stream is reported and cleared", "[stats]") {
  std::ostringstream out;
  ConsoleWriter console(out);
  REQUIRE(console.write_line("ok"));
  REQUIRE(out.str() == "ok\n");

  out.setstate(std::ios::badbit);
  REQUIRE(!console.write_line("lost"));
  REQUIRE(out.good());

  REQUIRE(console.write_line("again"));
  REQUIRE(out.str() == "ok\nagain\n");
}
