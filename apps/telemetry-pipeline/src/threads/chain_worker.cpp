#include "chain_worker.hpp"

#include <utility>

#include "../log.hpp"

namespace telemetry {

namespace {

constexpr const char* kComponent = "worker";

void deliver(EventSink& sink, EventRecord record, Metrics& metrics) {
  const std::int64_t sequence = record.sequence();
  const auto sink_start = std::chrono::steady_clock::now();
  std::string error;
  const bool delivered = sink.deliver(std::move(record), error);
  metrics.addSinkProcessing(elapsedMs(sink_start, std::chrono::steady_clock::now()));
  if (!delivered) {
    metrics.incrementSinkErrors();
    logError(kComponent) << "sink rejected event #" << sequence << ": " << error;
  }
}

} // namespace

bool parseFailurePolicy(const std::string& text, FailurePolicy& out) {
  if (text == "drop") {
    out = FailurePolicy::kLogAndDrop;
    return true;
  }
  if (text == "dead-letter") {
    out = FailurePolicy::kDeadLetter;
    return true;
  }
  return false;
}

ChainStatus processRecord(EventRecord record, const WorkerContext& context) {
  const auto process_start = std::chrono::steady_clock::now();
  const ChainResult result = context.chain.run(record);
  context.metrics.addChainProcessing(elapsedMs(process_start, std::chrono::steady_clock::now()));

  switch (result.status) {
    case ChainStatus::kForwarded:
      context.metrics.incrementForwarded();
      deliver(context.sink, std::move(record), context.metrics);
      break;

    case ChainStatus::kDropped:
      context.metrics.incrementDropped();
      break;

    case ChainStatus::kFailed:
      context.metrics.incrementFailed();
      logWarn(kComponent) << "event #" << record.sequence() << " failed in " << result.unit << ": " << result.error;
      if (context.on_fail == FailurePolicy::kDeadLetter && context.dead_letter != nullptr) {
        record.setMeta(kPipelineErrorKey, result.error);
        record.setMeta(kPipelineErrorUnitKey, result.unit);
        context.metrics.incrementDeadLettered();
        deliver(*context.dead_letter, std::move(record), context.metrics);
      }
      break;
  }
  return result.status;
}

void chainWorkerThread(const WorkerContext& context) {
  while (true) {
    PollResult polled = context.gateway.poll(context.poll_timeout, &context.cancel);
    if (polled.status == PollStatus::kEmpty) {
      continue;
    }
    if (polled.status != PollStatus::kEvent) {
      break;
    }
    processRecord(std::move(polled.event), context);
  }
}

} // namespace telemetry
