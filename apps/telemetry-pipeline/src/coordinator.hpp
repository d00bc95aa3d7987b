#ifndef TELEMETRY_PIPELINE_COORDINATOR_HPP
#define TELEMETRY_PIPELINE_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "chain.hpp"
#include "gateway.hpp"
#include "metrics.hpp"
#include "sink.hpp"
#include "threads/chain_worker.hpp"
#include "threads/replay.hpp"

namespace telemetry {

struct PipelineConfig {
  std::size_t workers = 0;
  std::chrono::milliseconds poll_timeout{30000};
  std::chrono::milliseconds drain_timeout{10000};
  FailurePolicy on_fail = FailurePolicy::kLogAndDrop;
  std::string replay_file;
};

// Owns the chain worker threads (and the optional replay thread) that drain the
// gateway into the sink.
class PipelineCoordinator {
 public:
  PipelineCoordinator(
    PipelineConfig config,
    IngestionGateway& gateway,
    const ProcessorChain& chain,
    EventSink& sink,
    EventSink* dead_letter,
    Metrics& metrics
  );
  ~PipelineCoordinator();

  PipelineCoordinator(const PipelineCoordinator&) = delete;
  PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

  void start();

  // Blocks until the replay file has been fully submitted. No-op without one.
  ReplayStats waitForReplay();
  bool replayFinished() const { return replay_done_.load(); }

  // Graceful stop: closes the gateway, lets workers drain it for up to
  // drain_timeout, then joins them. Returns the number of events released
  // undelivered.
  std::size_t shutdown();

  // Immediate stop: cancels blocked polls and joins the workers.
  void abort();

 private:
  void joinWorkers();

  PipelineConfig config_;
  IngestionGateway& gateway_;
  Metrics& metrics_;
  CancellationToken cancel_;
  WorkerContext context_;
  std::vector<std::thread> workers_;
  std::thread replay_thread_;
  ReplayStats replay_stats_;
  std::atomic<bool> replay_done_{false};
  bool started_ = false;
};

} // namespace telemetry

#endif
