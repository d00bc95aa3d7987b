#ifndef TELEMETRY_PIPELINE_GRPC_SINK_HPP
#define TELEMETRY_PIPELINE_GRPC_SINK_HPP

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "../sink.hpp"
#include "telemetry/v1/event_sink.grpc.pb.h"

namespace telemetry {

struct GrpcSinkConfig {
  std::string address;
  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds rpc_timeout{3000};
};

// Publishes finished records to a telemetry.v1.EventSinkService endpoint.
class GrpcSink : public EventSink {
 public:
  explicit GrpcSink(GrpcSinkConfig config);

  // Waits up to connect_timeout for the channel; deliveries still work (and
  // reconnect) if this fails.
  bool connect(std::string& error);

  bool deliver(EventRecord record, std::string& error) override;

 private:
  GrpcSinkConfig config_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<v1::EventSinkService::Stub> stub_;
};

} // namespace telemetry

#endif
