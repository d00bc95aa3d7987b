#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <curl/curl.h>

#include "chain_builder.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "gateway.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "lookup_client.hpp"
#include "metrics.hpp"
#include "sinks/ndjson_sink.hpp"

#ifdef TELEMETRY_PIPELINE_HAS_GRPC_SINK
#include "sinks/grpc_sink.hpp"
#endif

namespace
{

  constexpr const char *kComponent = "main";

  std::atomic<bool> g_running{true};

  void HandleSignal(int /*signal*/)
  {
    g_running = false;
  }

  std::unique_ptr<telemetry::EventSink> OpenOutputSink(const telemetry::ServiceConfig &config, std::string &error)
  {
    if (!config.sink_address.empty())
    {
#ifdef TELEMETRY_PIPELINE_HAS_GRPC_SINK
      telemetry::GrpcSinkConfig sink_config;
      sink_config.address = config.sink_address;
      auto sink = std::make_unique<telemetry::GrpcSink>(sink_config);
      std::string connect_error;
      if (!sink->connect(connect_error))
      {
        telemetry::logWarn(kComponent) << connect_error << ", will retry on delivery";
      }
      return sink;
#else
      error = "This build has no gRPC sink support, use --output instead of --sink-address";
      return nullptr;
#endif
    }
    return telemetry::NdjsonSink::open(config.output, error);
  }

  void PrintSummary(const telemetry::MetricsSnapshot &snapshot, std::size_t released)
  {
    std::cout << "\n=== Telemetry Pipeline ===\n"
              << "Received: " << snapshot.received_events << " events\n"
              << "Accepted: " << snapshot.accepted_events << " events\n"
              << "Rejected: " << snapshot.rejected_malformed << " malformed, " << snapshot.rejected_too_large
              << " too large, " << snapshot.rejected_queue_full << " queue full\n"
              << "Forwarded: " << snapshot.forwarded_events << " events\n"
              << "Dropped: " << snapshot.dropped_events << " events\n"
              << "Failed: " << snapshot.failed_events << " events (" << snapshot.dead_lettered_events
              << " dead-lettered)\n"
              << "Released at shutdown: " << released << " events\n"
              << "Sink errors: " << snapshot.sink_errors << "\n"
              << "Lookup failures: " << snapshot.lookup_failures << "\n"
              << "Duration: " << snapshot.duration_sec << " sec\n"
              << "Throughput: " << snapshot.throughput_per_sec << " events/sec\n";

    const double total_processing = snapshot.chain_processing_ms + snapshot.sink_processing_ms;
    if (total_processing > 0)
    {
      std::cout << "\n=== Time Breakdown ===\n"
                << "Chain processing: " << snapshot.chain_processing_ms << "ms "
                << "(" << (snapshot.chain_processing_ms / total_processing * 100) << "%)\n"
                << "Sink processing: " << snapshot.sink_processing_ms << "ms "
                << "(" << (snapshot.sink_processing_ms / total_processing * 100) << "%)\n";
    }
  }

  int Run(const telemetry::ServiceConfig &config)
  {
    std::string error;
    std::unique_ptr<telemetry::EventSink> sink = OpenOutputSink(config, error);
    if (!sink)
    {
      telemetry::logError(kComponent) << error;
      return 1;
    }

    std::unique_ptr<telemetry::EventSink> dead_letter;
    if (config.pipeline.on_fail == telemetry::FailurePolicy::kDeadLetter)
    {
      dead_letter = telemetry::NdjsonSink::open(config.dead_letter, error);
      if (!dead_letter)
      {
        telemetry::logError(kComponent) << error;
        return 1;
      }
    }
    else if (!config.dead_letter.empty())
    {
      telemetry::logWarn(kComponent) << "--dead-letter is ignored without --on-fail dead-letter";
    }

    telemetry::Metrics metrics;
    telemetry::CurlLookupClient lookup_client(config.lookup);
    const telemetry::ProcessorChain chain = telemetry::buildProcessorChain(config.chain, lookup_client, &metrics);

    std::string units;
    for (const auto &name : chain.unitNames())
    {
      units += units.empty() ? name : " -> " + name;
    }
    telemetry::logInfo(kComponent) << "Processor chain: " << units;

    telemetry::IngestionGateway gateway(config.gateway, &metrics);
    telemetry::PipelineCoordinator coordinator(config.pipeline, gateway, chain, *sink, dead_letter.get(), metrics);
    coordinator.start();

    const bool replay_only = !config.pipeline.replay_file.empty();
    std::unique_ptr<telemetry::HttpServer> server;
    if (!replay_only)
    {
      server = std::make_unique<telemetry::HttpServer>(config.http, gateway);
      if (!server->start(error))
      {
        telemetry::logError(kComponent) << error;
        coordinator.abort();
        return 1;
      }
    }

    while (g_running.load() && !(replay_only && coordinator.replayFinished()))
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    telemetry::logInfo(kComponent) << (g_running.load() ? "Replay finished" : "Signal received") << ", shutting down";

    if (server)
    {
      server->stop();
    }
    const std::size_t released = coordinator.shutdown();
    const telemetry::ReplayStats replay = coordinator.waitForReplay();

    sink->flush();
    if (dead_letter)
    {
      dead_letter->flush();
    }

    PrintSummary(metrics.snapshot(), released);

    if (replay_only)
    {
      std::cout << "Replayed: " << replay.lines << " lines, " << replay.accepted << " events accepted, "
                << replay.rejected << " rejected\n";
      if (!replay.opened)
      {
        return 1;
      }
    }
    return 0;
  }

} // namespace

int main(int argc, char **argv)
{
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  telemetry::ServiceConfig config;
  const unsigned int hardware_threads = std::thread::hardware_concurrency();
  config.pipeline.workers = hardware_threads > 0 ? hardware_threads : 4;

  std::string error;
  if (!telemetry::applyEnvironment(config, error) || !telemetry::parseArguments(argc, argv, config, error))
  {
    std::cerr << error << "\n\n";
    telemetry::printUsage(std::cerr);
    return 1;
  }
  if (config.show_help)
  {
    telemetry::printUsage(std::cout);
    return 0;
  }
  telemetry::setLogLevel(config.log_level);

  curl_global_init(CURL_GLOBAL_ALL);

  int result = 1;
  try
  {
    result = Run(config);
  }
  catch (const std::exception &e)
  {
    telemetry::logError(kComponent) << "Fatal: " << e.what();
  }

  curl_global_cleanup();
  return result;
}
