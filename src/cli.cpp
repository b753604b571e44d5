#include "ctload/cli.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>

#include <limits>
#include <utility>

namespace ctload {

namespace {

// Unsigned decimal, no sign, no trailing characters.
bool parse_uint(const std::string& text, uint64_t max, uint64_t& out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0' || value > max) return false;
  out = value;
  return true;
}

bool parse_header(const std::string& text, std::pair<std::string, std::string>& out) {
  size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0) return false;
  std::string name = text.substr(0, colon);
  if (name.find_first_of(" \t\r\n") != std::string::npos) return false;
  size_t value_start = text.find_first_not_of(" \t", colon + 1);
  std::string value = value_start == std::string::npos ? std::string() : text.substr(value_start);
  if (value.find_first_of("\r\n") != std::string::npos) return false;
  out = {name, value};
  return true;
}

}  // namespace

std::string usage(const std::string& program) {
  return "Usage: " + program +
         " run [endpoint] [worker_count] [options]\n"
         "\n"
         "Opens worker_count persistent streaming connections to endpoint, keeps\n"
         "them alive and prints connection/message statistics until Ctrl+C.\n"
         "\n"
         "  endpoint       ws://, wss://, http:// or https:// (SSE), tcp:// or tcps://\n"
         "                 (default " + std::string(CliOptions::kDefaultEndpoint) + ")\n"
         "  worker_count   number of concurrent clients (default 500)\n"
         "\n"
         "Options:\n"
         "  --stagger-ms N          pause between worker launches (default 20)\n"
         "  --interval-s N          stats reporting interval (default 5)\n"
         "  --backoff-ms N          reconnect backoff (default 1000)\n"
         "  --grace-ms N            shutdown grace period (default 15000)\n"
         "  --connect-timeout-ms N  connect + handshake timeout (default 5000)\n"
         "  --receive-timeout-ms N  blocking receive bound, at most 5000 (default 1000)\n"
         "  --header \"K: V\"         extra request header, repeatable\n"
         "  --stream full|lite|domains\n"
         "                          stream variant to request\n"
         "  --insecure              do not verify TLS certificates\n"
         "  --ca-file PATH          PEM trust anchors for TLS\n"
         "  --log-level LEVEL       debug, info, warn or error (env CTLOAD_LOG_LEVEL)\n"
         "  -h, --help              show this help\n";
}

expected<CliOptions, ErrorCode> parse_cli(const std::vector<std::string>& args, std::string& error) {
  using Result = expected<CliOptions, ErrorCode>;
  auto fail = [&error](const std::string& why) {
    error = why;
    return Result::error(ErrorCode::kInvalidConfig);
  };

  CliOptions opts;
  std::vector<std::string> positional;

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return Result::success(opts);
    }
    if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
      positional.push_back(arg);
      continue;
    }

    if (arg == "--insecure") {
      opts.endpoint_options.tls.verify_peer = false;
      continue;
    }

    // Every remaining option takes a value.
    if (i + 1 >= args.size()) return fail("option " + arg + " needs a value");
    const std::string& value = args[++i];
    uint64_t n = 0;

    if (arg == "--stagger-ms") {
      if (!parse_uint(value, 3600000, n)) return fail("bad --stagger-ms: " + value);
      opts.pool.stagger = std::chrono::milliseconds(n);
    } else if (arg == "--interval-s") {
      if (!parse_uint(value, 86400, n) || n == 0) return fail("bad --interval-s: " + value);
      opts.pool.stats_interval = std::chrono::seconds(n);
    } else if (arg == "--backoff-ms") {
      if (!parse_uint(value, 3600000, n) || n == 0) return fail("bad --backoff-ms: " + value);
      opts.pool.backoff = std::chrono::milliseconds(n);
    } else if (arg == "--grace-ms") {
      if (!parse_uint(value, 3600000, n)) return fail("bad --grace-ms: " + value);
      opts.pool.grace_period = std::chrono::milliseconds(n);
    } else if (arg == "--connect-timeout-ms") {
      if (!parse_uint(value, 600000, n) || n == 0) return fail("bad --connect-timeout-ms: " + value);
      opts.endpoint_options.connect_timeout = std::chrono::milliseconds(n);
    } else if (arg == "--receive-timeout-ms") {
      if (!parse_uint(value, 600000, n) || n == 0) return fail("bad --receive-timeout-ms: " + value);
      opts.endpoint_options.receive_timeout = std::chrono::milliseconds(n);
    } else if (arg == "--header") {
      std::pair<std::string, std::string> header;
      if (!parse_header(value, header)) return fail("bad --header (expected \"Name: value\"): " + value);
      opts.endpoint_options.headers.push_back(header);
    } else if (arg == "--stream") {
      if (!parse_stream_mode(value, opts.endpoint_options.stream_mode)) return fail("bad --stream: " + value);
    } else if (arg == "--ca-file") {
      opts.endpoint_options.tls.ca_file = value;
    } else if (arg == "--log-level") {
      if (!Logger::parse_level(value, opts.log_level)) return fail("bad --log-level: " + value);
      opts.log_level_set = true;
    } else {
      return fail("unknown option " + arg);
    }
  }

  if (positional.empty()) return fail("missing command");
  if (positional[0] != "run") return fail("unknown command " + positional[0]);
  if (positional.size() > 3) return fail("unexpected argument " + positional[3]);

  if (positional.size() > 1) opts.endpoint = positional[1];
  if (positional.size() > 2) {
    uint64_t count = 0;
    if (!parse_uint(positional[2], std::numeric_limits<uint32_t>::max(), count)) {
      return fail("bad worker_count: " + positional[2]);
    }
    opts.pool.worker_count = static_cast<uint32_t>(count);
  }
  return Result::success(opts);
}

}  // namespace ctload
