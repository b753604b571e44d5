#ifndef CTLOAD_CLI_HPP_
#define CTLOAD_CLI_HPP_

#include "config.hpp"
#include "endpoint.hpp"
#include "log.hpp"
#include "vocabulary.hpp"

#include <string>
#include <vector>

namespace ctload {

// ============================================================================
// Command line: ctload run <endpoint> [worker_count] [options]
// ============================================================================

struct CliOptions {
  static constexpr const char* kDefaultEndpoint = "ws://localhost:8080/";

  bool show_help = false;
  std::string endpoint = kDefaultEndpoint;
  PoolConfig pool;
  EndpointOptions endpoint_options;
  bool log_level_set = false;
  Logger::Level log_level = Logger::Level::kInfo;
};

// Parses the arguments (args[0] is the program name). Endpoint URL and pool
// configuration are only checked for syntax here; Endpoint::parse() and
// PoolConfig::validate() run later.
// On failure returns error(kInvalidConfig) and describes the problem in `error`.
expected<CliOptions, ErrorCode> parse_cli(const std::vector<std::string>& args, std::string& error);

std::string usage(const std::string& program);

}  // namespace ctload

#endif  // CTLOAD_CLI_HPP_
