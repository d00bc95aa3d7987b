#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace telemetry {

namespace {

bool parseSize(const std::string& value, std::size_t& out) {
  char* end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || parsed <= 0) {
    return false;
  }
  out = static_cast<std::size_t>(parsed);
  return true;
}

bool parseMillis(const std::string& value, std::chrono::milliseconds& out) {
  std::size_t parsed = 0;
  if (!parseSize(value, parsed)) {
    return false;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
  return true;
}

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t");
  return text.substr(begin, end - begin + 1);
}

bool readEnv(const char* name, std::string& out) {
  const char* value = std::getenv(name);
  if (value == nullptr || std::string(value).empty()) {
    return false;
  }
  out = value;
  return true;
}

} // namespace

void printUsage(std::ostream& out) {
  out << "Usage: telemetry-pipeline [options]\n\n"
      << "Ingestion:\n"
      << "  --listen <host:port>          HTTP listen address (default: 0.0.0.0:8080, env "
      << kListenAddressEnv << ")\n"
      << "  --path <path>                 Ingestion path (default: /events)\n"
      << "  --max-batch-size <num>        Events per submission (default: 100)\n"
      << "  --max-body-bytes <num>        Request body limit (default: 10485760)\n"
      << "  --queue-size <num>            Buffered events (default: 100)\n"
      << "  --replay <file>               Submit an NDJSON file instead of serving HTTP\n\n"
      << "Processing:\n"
      << "  --workers <num>               Chain worker threads (default: CPU count)\n"
      << "  --poll-timeout-ms <ms>        Worker poll timeout (default: 30000)\n"
      << "  --drain-timeout-ms <ms>       Shutdown drain timeout (default: 10000)\n"
      << "  --on-fail <drop|dead-letter>  Failed record policy (default: drop)\n"
      << "  --dead-letter <file>          NDJSON file for failed records\n\n"
      << "Units:\n"
      << "  --category-field <path>       Category field (default: category)\n"
      << "  --include <a,b>               Categories to keep\n"
      << "  --exclude <a,b>               Categories to drop\n"
      << "  --asset-endpoint <url>        Asset lookup service (env " << kAssetEndpointEnv << ")\n"
      << "  --asset-id-field <path>       Asset id field (default: asset_id)\n"
      << "  --user-endpoint <url>         User lookup service (env " << kUserEndpointEnv << ")\n"
      << "  --user-id-field <path>        User id field (default: user_id)\n"
      << "  --threat-intel-endpoint <url> Threat-intel service (env " << kThreatIntelEndpointEnv << ")\n"
      << "  --threat-intel-collect <field> Also append enriched observables to this field\n"
      << "  --lookup-timeout-ms <ms>      Per lookup timeout (default: 5000)\n"
      << "  --max-connections <num>       Cached lookup connections (default: 16)\n"
      << "  --tag-fields <a,b>            Fields copied to tag.* (default: class_uid,severity_id,category_uid)\n"
      << "  --no-timestamp-tag            Do not write tag.ingested_at\n"
      << "  --source-tag                  Write tag.source=http_receiver\n\n"
      << "Output:\n"
      << "  --output <file>               NDJSON output, - for stdout (default: -)\n"
      << "  --sink-address <host:port>    Publish to an EventSinkService instead (env " << kSinkAddressEnv
      << ")\n"
      << "  --log-level <level>           debug, info, warn or error (default: info, env " << kLogLevelEnv
      << ")\n"
      << "  -h, --help                    Show this help message\n";
}

bool parseListenAddress(const std::string& text, std::string& host, unsigned short& port) {
  const auto colon = text.rfind(':');
  if (colon == std::string::npos) {
    return false;
  }

  std::string parsed_host = text.substr(0, colon);
  if (parsed_host.size() >= 2 && parsed_host.front() == '[' && parsed_host.back() == ']') {
    parsed_host = parsed_host.substr(1, parsed_host.size() - 2);
  }
  if (parsed_host.empty()) {
    parsed_host = "0.0.0.0";
  }

  const std::string port_text = text.substr(colon + 1);
  char* end = nullptr;
  const long parsed_port = std::strtol(port_text.c_str(), &end, 10);
  if (port_text.empty() || *end != '\0' || parsed_port < 0 || parsed_port > 65535) {
    return false;
  }

  host = parsed_host;
  port = static_cast<unsigned short>(parsed_port);
  return true;
}

std::vector<std::string> splitList(const std::string& text) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto comma = text.find(',', start);
    if (comma == std::string::npos) {
      comma = text.size();
    }
    std::string item = trim(text.substr(start, comma - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    start = comma + 1;
  }
  return items;
}

bool applyEnvironment(ServiceConfig& config, std::string& error) {
  std::string value;
  if (readEnv(kListenAddressEnv, value) && !parseListenAddress(value, config.http.address, config.http.port)) {
    error = std::string("Invalid value for ") + kListenAddressEnv + ": " + value;
    return false;
  }
  if (readEnv(kAssetEndpointEnv, value)) {
    config.chain.asset.endpoint = value;
  }
  if (readEnv(kUserEndpointEnv, value)) {
    config.chain.user.endpoint = value;
  }
  if (readEnv(kThreatIntelEndpointEnv, value)) {
    config.chain.threat_intel.endpoint = value;
  }
  if (readEnv(kSinkAddressEnv, value)) {
    config.sink_address = value;
  }
  if (readEnv(kLogLevelEnv, value) && !parseLogLevel(value, config.log_level)) {
    error = std::string("Invalid value for ") + kLogLevelEnv + ": " + value;
    return false;
  }
  return true;
}

bool parseArguments(int argc, char** argv, ServiceConfig& config, std::string& error) {
  for (int i = 1; i < argc; i += 1) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      return true;
    }
    if (arg == "--no-timestamp-tag") {
      config.chain.tagger.add_timestamp_tag = false;
      continue;
    }
    if (arg == "--source-tag") {
      config.chain.tagger.add_source_tag = true;
      continue;
    }

    if (arg.rfind("--", 0) != 0) {
      error = "Unknown argument: " + arg;
      return false;
    }
    if (i + 1 >= argc) {
      error = "Missing value for " + arg;
      return false;
    }
    const std::string value = argv[i + 1];
    i += 1;

    bool valid = true;
    if (arg == "--listen") {
      valid = parseListenAddress(value, config.http.address, config.http.port);
    } else if (arg == "--path") {
      valid = !value.empty() && value.front() == '/';
      config.http.path = value;
    } else if (arg == "--max-batch-size") {
      valid = parseSize(value, config.gateway.max_batch_size);
    } else if (arg == "--max-body-bytes") {
      valid = parseSize(value, config.http.max_body_bytes);
    } else if (arg == "--queue-size") {
      valid = parseSize(value, config.gateway.queue_capacity);
    } else if (arg == "--workers") {
      valid = parseSize(value, config.pipeline.workers);
    } else if (arg == "--poll-timeout-ms") {
      valid = parseMillis(value, config.pipeline.poll_timeout);
    } else if (arg == "--drain-timeout-ms") {
      valid = parseMillis(value, config.pipeline.drain_timeout);
    } else if (arg == "--lookup-timeout-ms") {
      valid = parseMillis(value, config.lookup.default_timeout);
    } else if (arg == "--max-connections") {
      std::size_t connections = 0;
      valid = parseSize(value, connections);
      config.lookup.max_connections = static_cast<long>(connections);
    } else if (arg == "--asset-endpoint") {
      config.chain.asset.endpoint = value;
    } else if (arg == "--asset-id-field") {
      valid = !value.empty();
      config.chain.asset.id_field = value;
    } else if (arg == "--user-endpoint") {
      config.chain.user.endpoint = value;
    } else if (arg == "--user-id-field") {
      valid = !value.empty();
      config.chain.user.id_field = value;
    } else if (arg == "--threat-intel-endpoint") {
      config.chain.threat_intel.endpoint = value;
    } else if (arg == "--threat-intel-collect") {
      config.chain.threat_intel.collect_field = value;
    } else if (arg == "--category-field") {
      valid = !value.empty();
      config.chain.filter.field = value;
    } else if (arg == "--include") {
      config.chain.filter.include = splitList(value);
    } else if (arg == "--exclude") {
      config.chain.filter.exclude = splitList(value);
    } else if (arg == "--tag-fields") {
      config.chain.tagger.tag_fields = splitList(value);
    } else if (arg == "--output") {
      valid = !value.empty();
      config.output = value;
    } else if (arg == "--sink-address") {
      config.sink_address = value;
    } else if (arg == "--dead-letter") {
      valid = !value.empty();
      config.dead_letter = value;
    } else if (arg == "--on-fail") {
      valid = parseFailurePolicy(value, config.pipeline.on_fail);
    } else if (arg == "--replay") {
      valid = !value.empty();
      config.pipeline.replay_file = value;
    } else if (arg == "--log-level") {
      valid = parseLogLevel(value, config.log_level);
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }

    if (!valid) {
      error = "Invalid value for " + arg + ": " + value;
      return false;
    }
  }

  if (config.pipeline.on_fail == FailurePolicy::kDeadLetter && config.dead_letter.empty()) {
    error = "--on-fail dead-letter requires --dead-letter <file>";
    return false;
  }

  config.chain.asset.timeout = config.lookup.default_timeout;
  config.chain.user.timeout = config.lookup.default_timeout;
  config.chain.threat_intel.timeout = config.lookup.default_timeout;
  return true;
}

} // namespace telemetry
