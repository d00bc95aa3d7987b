#include "coordinator.hpp"

#include <utility>

#include "log.hpp"

namespace telemetry {

PipelineCoordinator::PipelineCoordinator(
  PipelineConfig config,
  IngestionGateway& gateway,
  const ProcessorChain& chain,
  EventSink& sink,
  EventSink* dead_letter,
  Metrics& metrics
)
    : config_(std::move(config)),
      gateway_(gateway),
      metrics_(metrics),
      context_{gateway, chain, sink, dead_letter, config_.on_fail, config_.poll_timeout, cancel_, metrics} {}

PipelineCoordinator::~PipelineCoordinator() {
  abort();
}

void PipelineCoordinator::start() {
  if (started_) {
    return;
  }
  started_ = true;

  const std::size_t worker_count = config_.workers > 0 ? config_.workers : 1;
  metrics_.markStart();

  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; i += 1) {
    workers_.emplace_back(chainWorkerThread, std::cref(context_));
  }
  logInfo("coordinator") << "Started " << worker_count << " chain workers";

  if (!config_.replay_file.empty()) {
    replay_thread_ = std::thread([this]() {
      replay_stats_ = replayThread(config_.replay_file, gateway_, cancel_);
      replay_done_.store(true);
    });
  }
}

ReplayStats PipelineCoordinator::waitForReplay() {
  if (replay_thread_.joinable()) {
    replay_thread_.join();
  }
  return replay_stats_;
}

std::size_t PipelineCoordinator::shutdown() {
  if (!started_) {
    return 0;
  }
  const std::size_t released = gateway_.shutdown(config_.drain_timeout);
  joinWorkers();
  return released;
}

void PipelineCoordinator::abort() {
  cancel_.cancel();
  joinWorkers();
}

void PipelineCoordinator::joinWorkers() {
  if (replay_thread_.joinable()) {
    replay_thread_.join();
  }
  for (auto& thread : workers_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  workers_.clear();
  if (started_) {
    metrics_.markEnd();
    started_ = false;
  }
}

} // namespace telemetry
