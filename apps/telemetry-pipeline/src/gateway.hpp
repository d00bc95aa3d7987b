#ifndef TELEMETRY_PIPELINE_GATEWAY_HPP
#define TELEMETRY_PIPELINE_GATEWAY_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "cancellation.hpp"
#include "event.hpp"
#include "metrics.hpp"
#include "queue.hpp"

namespace telemetry {

struct GatewayConfig {
  std::size_t max_batch_size = 100;
  std::size_t queue_capacity = 100;
};

enum class SubmitStatus {
  kAccepted,
  kMalformedInput,
  kBatchTooLarge,
  kQueueFull,
  kShuttingDown,
};

const char* submitStatusName(SubmitStatus status);

struct SubmissionResult {
  SubmitStatus status = SubmitStatus::kAccepted;
  // Events enqueued by this submission. Non-zero on kQueueFull/kShuttingDown when
  // the buffer filled part-way; those events stay enqueued.
  std::size_t accepted = 0;
  std::size_t total = 0;
  std::string error;
};

enum class PollStatus {
  kEvent,
  kEmpty,
  kCancelled,
  kClosed,
};

struct PollResult {
  PollStatus status = PollStatus::kEmpty;
  EventRecord event;
};

// Front door of the pipeline: decodes submissions, applies the batch limit and
// feeds the bounded buffer that chain workers poll.
class IngestionGateway {
 public:
  explicit IngestionGateway(GatewayConfig config, Metrics* metrics = nullptr);

  IngestionGateway(const IngestionGateway&) = delete;
  IngestionGateway& operator=(const IngestionGateway&) = delete;

  // A JSON array is split into one event per element; any other JSON value is one
  // event. Every event must be an object. Never blocks.
  SubmissionResult submit(const std::string& payload);

  // Waits up to `timeout` for an event. kEmpty is a retry signal; kClosed means
  // the gateway has shut down and the buffer is drained.
  PollResult poll(std::chrono::milliseconds timeout, CancellationToken* cancel = nullptr);

  // Rejects new submissions, gives consumers up to `drain_timeout` to empty the
  // buffer, then releases whatever is left. Returns the number of events released
  // undelivered.
  std::size_t shutdown(std::chrono::milliseconds drain_timeout);

  bool accepting() const { return accepting_.load(); }
  std::size_t buffered() const { return queue_.size(); }
  const GatewayConfig& config() const { return config_; }

 private:
  GatewayConfig config_;
  BoundedQueue<EventRecord> queue_;
  std::atomic<bool> accepting_{true};
  std::atomic<std::int64_t> next_sequence_{0};
  Metrics* metrics_;
};

} // namespace telemetry

#endif
