#include "grpc_sink.hpp"

#include <utility>

namespace telemetry {

GrpcSink::GrpcSink(GrpcSinkConfig config)
    : config_(std::move(config)),
      channel_(grpc::CreateChannel(config_.address, grpc::InsecureChannelCredentials())),
      stub_(v1::EventSinkService::NewStub(channel_)) {}

bool GrpcSink::connect(std::string& error) {
  const auto deadline = std::chrono::system_clock::now() + config_.connect_timeout;
  if (!channel_->WaitForConnected(deadline)) {
    error = "sink at " + config_.address + " not ready (timeout " + std::to_string(config_.connect_timeout.count()) +
            "ms)";
    return false;
  }
  return true;
}

bool GrpcSink::deliver(EventRecord record, std::string& error) {
  Object* body = record.object();
  if (body == nullptr) {
    error = "event body is not an object";
    return false;
  }

  v1::PublishRequest request;
  const FieldResult<std::string> uid = stringAt(*body, "metadata.uid");
  if (uid.ok()) {
    request.set_event_id(uid.value());
  }
  *request.mutable_event() = std::move(*body);
  for (const auto& [key, value] : record.metadata()) {
    (*request.mutable_metadata())[key] = value;
  }

  v1::PublishResponse response;
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + config_.rpc_timeout);

  const grpc::Status status = stub_->Publish(&context, request, &response);
  if (!status.ok()) {
    error = "Publish failed: " + status.error_message();
    return false;
  }
  if (!response.error().empty()) {
    error = "Publish rejected: " + response.error();
    return false;
  }
  return true;
}

} // namespace telemetry
