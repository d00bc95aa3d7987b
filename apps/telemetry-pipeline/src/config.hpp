#ifndef TELEMETRY_PIPELINE_CONFIG_HPP
#define TELEMETRY_PIPELINE_CONFIG_HPP

#include <ostream>
#include <string>
#include <vector>

#include "chain_builder.hpp"
#include "coordinator.hpp"
#include "gateway.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "lookup_client.hpp"

namespace telemetry {

constexpr const char* kListenAddressEnv = "TELEMETRY_LISTEN_ADDRESS";
constexpr const char* kAssetEndpointEnv = "ASSET_ENDPOINT";
constexpr const char* kUserEndpointEnv = "USER_ENDPOINT";
constexpr const char* kThreatIntelEndpointEnv = "THREAT_INTEL_ENDPOINT";
constexpr const char* kSinkAddressEnv = "SINK_ADDRESS";
constexpr const char* kLogLevelEnv = "LOG_LEVEL";

struct ServiceConfig {
  HttpServerConfig http;
  GatewayConfig gateway;
  PipelineConfig pipeline;
  LookupClientConfig lookup;
  ChainSettings chain;
  std::string output = "-";
  std::string sink_address;
  std::string dead_letter;
  LogLevel log_level = LogLevel::kInfo;
  bool show_help = false;
};

void printUsage(std::ostream& out);

// "host:port", ":port" (all interfaces) or "[v6]:port".
bool parseListenAddress(const std::string& text, std::string& host, unsigned short& port);

// Comma separated, blanks trimmed, empty items skipped.
std::vector<std::string> splitList(const std::string& text);

// Environment variables supply defaults; flags parsed afterwards override them.
bool applyEnvironment(ServiceConfig& config, std::string& error);

bool parseArguments(int argc, char** argv, ServiceConfig& config, std::string& error);

} // namespace telemetry

#endif
