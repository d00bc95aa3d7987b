#include "metrics.hpp"

namespace telemetry
{

  void Metrics::markStart()
  {
    start_ = std::chrono::steady_clock::now();
    started_ = true;
  }

  void Metrics::markEnd()
  {
    end_ = std::chrono::steady_clock::now();
    ended_ = true;
  }

  void Metrics::addReceived(std::int64_t count)
  {
    received_events_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::addAccepted(std::int64_t count)
  {
    accepted_events_.fetch_add(count, std::memory_order_relaxed);
  }

  void Metrics::incrementMalformed()
  {
    rejected_malformed_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementTooLarge()
  {
    rejected_too_large_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementQueueFull()
  {
    rejected_queue_full_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementForwarded()
  {
    forwarded_events_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementDropped()
  {
    dropped_events_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementFailed()
  {
    failed_events_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementDeadLettered()
  {
    dead_lettered_events_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementSinkErrors()
  {
    sink_errors_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::incrementLookupFailures()
  {
    lookup_failures_.fetch_add(1, std::memory_order_relaxed);
  }

  void Metrics::addChainProcessing(double ms)
  {
    chain_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  void Metrics::addSinkProcessing(double ms)
  {
    sink_processing_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
  }

  MetricsSnapshot Metrics::snapshot() const
  {
    MetricsSnapshot snapshot;
    snapshot.received_events = received_events_.load(std::memory_order_relaxed);
    snapshot.accepted_events = accepted_events_.load(std::memory_order_relaxed);
    snapshot.rejected_malformed = rejected_malformed_.load(std::memory_order_relaxed);
    snapshot.rejected_too_large = rejected_too_large_.load(std::memory_order_relaxed);
    snapshot.rejected_queue_full = rejected_queue_full_.load(std::memory_order_relaxed);
    snapshot.forwarded_events = forwarded_events_.load(std::memory_order_relaxed);
    snapshot.dropped_events = dropped_events_.load(std::memory_order_relaxed);
    snapshot.failed_events = failed_events_.load(std::memory_order_relaxed);
    snapshot.dead_lettered_events = dead_lettered_events_.load(std::memory_order_relaxed);
    snapshot.sink_errors = sink_errors_.load(std::memory_order_relaxed);
    snapshot.lookup_failures = lookup_failures_.load(std::memory_order_relaxed);
    snapshot.chain_processing_ms = chain_processing_us_.load(std::memory_order_relaxed) / 1000.0;
    snapshot.sink_processing_ms = sink_processing_us_.load(std::memory_order_relaxed) / 1000.0;

    if (started_ && ended_)
    {
      const auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_ - start_);
      snapshot.duration_sec = duration.count();
      if (snapshot.duration_sec > 0.0)
      {
        snapshot.throughput_per_sec = snapshot.forwarded_events / snapshot.duration_sec;
      }
    }

    return snapshot;
  }

} // namespace telemetry
