#include "gateway.hpp"

#include <utility>
#include <vector>

#include "log.hpp"

namespace telemetry {

namespace {

constexpr const char* kComponent = "gateway";

SubmissionResult rejected(SubmitStatus status, std::string error) {
  SubmissionResult result;
  result.status = status;
  result.error = std::move(error);
  return result;
}

} // namespace

const char* submitStatusName(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::kAccepted:
      return "accepted";
    case SubmitStatus::kMalformedInput:
      return "malformed input";
    case SubmitStatus::kBatchTooLarge:
      return "batch too large";
    case SubmitStatus::kQueueFull:
      return "queue full";
    case SubmitStatus::kShuttingDown:
      return "shutting down";
  }
  return "unknown";
}

IngestionGateway::IngestionGateway(GatewayConfig config, Metrics* metrics)
    : config_(config), queue_(config.queue_capacity), metrics_(metrics) {}

SubmissionResult IngestionGateway::submit(const std::string& payload) {
  if (!accepting_.load()) {
    return rejected(SubmitStatus::kShuttingDown, "Pipeline is shutting down");
  }

  Value decoded;
  std::string parse_error;
  if (!parseJson(payload, decoded, parse_error)) {
    logWarn(kComponent) << "Invalid JSON: " << parse_error;
    if (metrics_ != nullptr) {
      // An unparseable payload counts as one received event.
      metrics_->addReceived(1);
      metrics_->incrementMalformed();
    }
    return rejected(SubmitStatus::kMalformedInput, "Invalid JSON");
  }

  std::vector<Value> events;
  if (isList(decoded)) {
    List* list = decoded.mutable_list_value();
    events.reserve(static_cast<std::size_t>(list->values_size()));
    for (int i = 0; i < list->values_size(); i += 1) {
      events.push_back(std::move(*list->mutable_values(i)));
    }
  } else {
    events.push_back(std::move(decoded));
  }
  // Includes events of submissions rejected below.
  if (metrics_ != nullptr) {
    metrics_->addReceived(static_cast<std::int64_t>(events.size()));
  }

  for (std::size_t i = 0; i < events.size(); i += 1) {
    if (!isObject(events[i])) {
      logWarn(kComponent) << "Event #" << i << " of submission is not a JSON object";
      if (metrics_ != nullptr) {
        metrics_->incrementMalformed();
      }
      return rejected(SubmitStatus::kMalformedInput, "Event " + std::to_string(i) + " is not a JSON object");
    }
  }

  if (events.size() > config_.max_batch_size) {
    logWarn(kComponent) << "Batch size " << events.size() << " exceeds maximum " << config_.max_batch_size;
    if (metrics_ != nullptr) {
      metrics_->incrementTooLarge();
    }
    SubmissionResult result = rejected(
      SubmitStatus::kBatchTooLarge,
      "Batch size exceeds maximum of " + std::to_string(config_.max_batch_size)
    );
    result.total = events.size();
    return result;
  }

  SubmissionResult result;
  result.total = events.size();
  for (auto& body : events) {
    EventRecord record(std::move(body));
    record.setMeta(kReceivedAtKey, rfc3339Now());
    record.setSequence(next_sequence_.fetch_add(1));

    const PushStatus pushed = queue_.tryPush(std::move(record));
    if (pushed == PushStatus::kOk) {
      result.accepted += 1;
      continue;
    }

    if (pushed == PushStatus::kFull) {
      logWarn(kComponent) << "Event queue full, accepted " << result.accepted << "/" << result.total << " events";
      if (metrics_ != nullptr) {
        metrics_->incrementQueueFull();
      }
      result.status = SubmitStatus::kQueueFull;
      result.error = "Event queue full, try again later";
    } else {
      logWarn(kComponent) << "Gateway closed, accepted " << result.accepted << "/" << result.total << " events";
      result.status = SubmitStatus::kShuttingDown;
      result.error = "Pipeline is shutting down";
    }
    break;
  }

  if (metrics_ != nullptr) {
    metrics_->addAccepted(static_cast<std::int64_t>(result.accepted));
  }
  return result;
}

PollResult IngestionGateway::poll(std::chrono::milliseconds timeout, CancellationToken* cancel) {
  PollResult result;
  switch (queue_.pollFor(result.event, timeout, cancel)) {
    case PopStatus::kItem:
      result.status = PollStatus::kEvent;
      break;
    case PopStatus::kTimeout:
      result.status = PollStatus::kEmpty;
      break;
    case PopStatus::kCancelled:
      result.status = PollStatus::kCancelled;
      break;
    case PopStatus::kClosed:
      result.status = PollStatus::kClosed;
      break;
  }
  return result;
}

std::size_t IngestionGateway::shutdown(std::chrono::milliseconds drain_timeout) {
  if (!accepting_.exchange(false)) {
    return 0;
  }
  logInfo(kComponent) << "Shutting down, " << queue_.size() << " events buffered";

  queue_.close();
  if (queue_.waitUntilEmpty(drain_timeout)) {
    logInfo(kComponent) << "Buffer drained";
    return 0;
  }

  const std::size_t released = queue_.clear();
  if (released > 0) {
    logError(kComponent) << "Drain timeout after " << drain_timeout.count() << "ms, released " << released
                         << " undelivered events";
  }
  return released;
}

} // namespace telemetry
