#ifndef TELEMETRY_PIPELINE_CHAIN_WORKER_HPP
#define TELEMETRY_PIPELINE_CHAIN_WORKER_HPP

#include <chrono>
#include <string>

#include "../cancellation.hpp"
#include "../chain.hpp"
#include "../gateway.hpp"
#include "../metrics.hpp"
#include "../sink.hpp"

namespace telemetry {

enum class FailurePolicy {
  kLogAndDrop,
  kDeadLetter,
};

bool parseFailurePolicy(const std::string& text, FailurePolicy& out);

constexpr const char* kPipelineErrorKey = "pipeline_error";
constexpr const char* kPipelineErrorUnitKey = "pipeline_error_unit";

struct WorkerContext {
  IngestionGateway& gateway;
  const ProcessorChain& chain;
  EventSink& sink;
  // Receives failed records under kDeadLetter; may be null.
  EventSink* dead_letter;
  FailurePolicy on_fail;
  std::chrono::milliseconds poll_timeout;
  CancellationToken& cancel;
  Metrics& metrics;
};

// Runs one record through the chain and hands it to the sink or dead-letter sink.
ChainStatus processRecord(EventRecord record, const WorkerContext& context);

// Polls the gateway until it is closed and drained, or until cancelled.
void chainWorkerThread(const WorkerContext& context);

} // namespace telemetry

#endif
