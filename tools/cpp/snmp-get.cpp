/**
 * @file snmp-get.cpp
 * @brief Single SNMPv2c GET against one agent.
 *
 * Prints the decoded value on success. Exit status is 0 on success, 1 on usage
 * errors and 2 when the request fails.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/snmp/inc/SnmpClient.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = proxwatch::helpers::args;
namespace snmp = proxwatch::snmp;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_HOST = 1,
  ARG_OID = 2,
  ARG_COMMUNITY = 3,
  ARG_PORT = 4,
  ARG_TIMEOUT = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION = "Send one SNMPv2c GetRequest and print the value.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_HOST] = {"--host", 1, true, "Agent host name or address"};
  map[ARG_OID] = {"--oid", 1, true, "Dotted OID to query"};
  map[ARG_COMMUNITY] = {"--community", 1, false, "Community string (default: public)"};
  map[ARG_PORT] = {"--port", 1, false, "Agent UDP port (default: 161)"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Timeout in milliseconds (default: 5000)"};
  return map;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  // --help wins over missing required flags
  for (const std::string_view ARG : argList) {
    if (ARG == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  args::ParsedArgs pargs;
  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  snmp::SnmpClientConfig cfg;
  cfg.community = std::string(args::valueOr(pargs, ARG_COMMUNITY, cfg.community));

  if (args::has(pargs, ARG_PORT)) {
    std::uint64_t port = 0;
    if (!args::parseUnsigned(args::valueOr(pargs, ARG_PORT, ""), port) || port == 0 ||
        port > std::numeric_limits<std::uint16_t>::max()) {
      fmt::print(stderr, "Error: Port must be 1..65535\n");
      return 1;
    }
    cfg.port = static_cast<std::uint16_t>(port);
  }

  if (args::has(pargs, ARG_TIMEOUT)) {
    std::uint64_t timeoutMs = 0;
    if (!args::parseUnsigned(args::valueOr(pargs, ARG_TIMEOUT, ""), timeoutMs) || timeoutMs == 0) {
      fmt::print(stderr, "Error: Timeout must be >= 1 ms\n");
      return 1;
    }
    cfg.timeout = std::chrono::milliseconds(timeoutMs);
  }

  const std::string HOST(args::valueOr(pargs, ARG_HOST, ""));
  const std::string OID(args::valueOr(pargs, ARG_OID, ""));

  const snmp::SnmpClient CLIENT(cfg);
  const snmp::SnmpResult RES = CLIENT.get(HOST, OID);

  if (!RES.ok()) {
    fmt::print(stderr, "{} {}: {}\n", HOST, OID, RES.toString());
    return 2;
  }

  if (RES.isCounter) {
    fmt::print("{} = {}\n", OID, RES.counter);
  } else {
    fmt::print("{} = {}\n", OID, RES.value);
  }
  return 0;
}
