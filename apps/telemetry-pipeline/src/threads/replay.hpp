#ifndef TELEMETRY_PIPELINE_REPLAY_HPP
#define TELEMETRY_PIPELINE_REPLAY_HPP

#include <cstdint>
#include <string>

#include "../cancellation.hpp"
#include "../gateway.hpp"

namespace telemetry {

struct ReplayStats {
  std::int64_t lines = 0;
  std::int64_t accepted = 0;
  std::int64_t rejected = 0;
  bool opened = false;
};

// Submits every non-empty line of an NDJSON file through the gateway, backing off
// while the buffer is full.
ReplayStats replayThread(const std::string& input_file, IngestionGateway& gateway, CancellationToken& cancel);

} // namespace telemetry

#endif
