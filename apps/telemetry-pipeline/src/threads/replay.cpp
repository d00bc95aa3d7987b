#include "replay.hpp"

#include <chrono>
#include <fstream>
#include <thread>

#include "../log.hpp"

namespace telemetry {

namespace {

constexpr const char* kComponent = "replay";
constexpr auto kQueueFullBackoff = std::chrono::milliseconds(10);

} // namespace

ReplayStats replayThread(const std::string& input_file, IngestionGateway& gateway, CancellationToken& cancel) {
  ReplayStats stats;
  std::ifstream input(input_file);
  if (!input.is_open()) {
    logError(kComponent) << "Failed to open input file: " << input_file;
    return stats;
  }
  stats.opened = true;

  std::string line;
  while (!cancel.cancelled() && std::getline(input, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    stats.lines += 1;

    while (true) {
      const SubmissionResult result = gateway.submit(line);
      stats.accepted += static_cast<std::int64_t>(result.accepted);

      // Retry only when nothing from the line went in; resubmitting a partially
      // accepted batch would duplicate events.
      if (result.status == SubmitStatus::kQueueFull && result.accepted == 0 && !cancel.cancelled()) {
        std::this_thread::sleep_for(kQueueFullBackoff);
        continue;
      }
      if (result.status != SubmitStatus::kAccepted) {
        const std::size_t lost = result.total > result.accepted ? result.total - result.accepted : 1;
        stats.rejected += static_cast<std::int64_t>(lost);
        logWarn(kComponent) << "line " << stats.lines << " rejected: " << submitStatusName(result.status) << " ("
                            << result.error << ")";
      }
      break;
    }

    if (!gateway.accepting()) {
      break;
    }
  }

  logInfo(kComponent) << "Replayed " << stats.lines << " lines from " << input_file << ", " << stats.accepted
                      << " events accepted";
  return stats;
}

} // namespace telemetry
