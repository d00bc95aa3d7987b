#ifndef TELEMETRY_PIPELINE_METRICS_HPP
#define TELEMETRY_PIPELINE_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace telemetry
{

  struct MetricsSnapshot
  {
    std::int64_t received_events = 0;
    std::int64_t accepted_events = 0;
    std::int64_t rejected_malformed = 0;
    std::int64_t rejected_too_large = 0;
    std::int64_t rejected_queue_full = 0;
    std::int64_t forwarded_events = 0;
    std::int64_t dropped_events = 0;
    std::int64_t failed_events = 0;
    std::int64_t dead_lettered_events = 0;
    std::int64_t sink_errors = 0;
    std::int64_t lookup_failures = 0;
    double throughput_per_sec = 0.0;
    double duration_sec = 0.0;
    double chain_processing_ms = 0.0;
    double sink_processing_ms = 0.0;
  };

  class Metrics
  {
  public:
    void markStart();
    void markEnd();

    void addReceived(std::int64_t count);
    void addAccepted(std::int64_t count);
    void incrementMalformed();
    void incrementTooLarge();
    void incrementQueueFull();
    void incrementForwarded();
    void incrementDropped();
    void incrementFailed();
    void incrementDeadLettered();
    void incrementSinkErrors();
    void incrementLookupFailures();

    void addChainProcessing(double ms);
    void addSinkProcessing(double ms);

    MetricsSnapshot snapshot() const;

  private:
    std::atomic<std::int64_t> received_events_{0};
    std::atomic<std::int64_t> accepted_events_{0};
    std::atomic<std::int64_t> rejected_malformed_{0};
    std::atomic<std::int64_t> rejected_too_large_{0};
    std::atomic<std::int64_t> rejected_queue_full_{0};
    std::atomic<std::int64_t> forwarded_events_{0};
    std::atomic<std::int64_t> dropped_events_{0};
    std::atomic<std::int64_t> failed_events_{0};
    std::atomic<std::int64_t> dead_lettered_events_{0};
    std::atomic<std::int64_t> sink_errors_{0};
    std::atomic<std::int64_t> lookup_failures_{0};
    std::atomic<std::int64_t> chain_processing_us_{0};
    std::atomic<std::int64_t> sink_processing_us_{0};
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
    bool started_ = false;
    bool ended_ = false;
  };

  inline double elapsedMs(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end)
  {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start).count();
  }

} // namespace telemetry

#endif
