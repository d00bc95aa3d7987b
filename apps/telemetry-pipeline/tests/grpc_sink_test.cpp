#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include "sinks/grpc_sink.hpp"
#include "test_support.hpp"

using namespace telemetry;
using telemetry::test::makeRecord;
using telemetry::test::sameJson;

namespace {

class RecordingSinkService final : public v1::EventSinkService::Service {
 public:
  grpc::Status Publish(grpc::ServerContext*, const v1::PublishRequest* request, v1::PublishResponse* response)
    override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(*request);
    if (!reject_with_.empty()) {
      response->set_error(reject_with_);
    }
    return grpc::Status::OK;
  }

  void rejectWith(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_with_ = error;
  }

  std::vector<v1::PublishRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<v1::PublishRequest> requests_;
  std::string reject_with_;
};

} // namespace

class GrpcSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    ASSERT_TRUE(server_ != nullptr);
    ASSERT_NE(port_, 0);
  }

  void TearDown() override { server_->Shutdown(); }

  GrpcSinkConfig sinkConfig() const {
    GrpcSinkConfig config;
    config.address = "127.0.0.1:" + std::to_string(port_);
    return config;
  }

  RecordingSinkService service_;
  std::unique_ptr<grpc::Server> server_;
  int port_ = 0;
};

TEST_F(GrpcSinkTest, PublishesEventWithMetadata) {
  GrpcSink sink(sinkConfig());
  std::string error;
  ASSERT_TRUE(sink.connect(error)) << error;

  EventRecord record = makeRecord(R"({"class_uid":2004,"metadata":{"uid":"evt-42"}})");
  record.setMeta("tag.severity", "critical");
  ASSERT_TRUE(sink.deliver(std::move(record), error)) << error;

  const std::vector<v1::PublishRequest> requests = service_.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].event_id(), "evt-42");
  EXPECT_TRUE(sameJson(requests[0].event(), R"({"class_uid":2004,"metadata":{"uid":"evt-42"}})"));
  EXPECT_EQ(requests[0].metadata().at("tag.severity"), "critical");
}

TEST_F(GrpcSinkTest, ReceiverErrorsFailTheDelivery) {
  service_.rejectWith("disk full");
  GrpcSink sink(sinkConfig());

  std::string error;
  EXPECT_FALSE(sink.deliver(makeRecord(R"({"a":1})"), error));
  EXPECT_EQ(error, "Publish rejected: disk full");
}

TEST_F(GrpcSinkTest, NonObjectBodiesAreRefused) {
  GrpcSink sink(sinkConfig());
  std::string error;
  EXPECT_FALSE(sink.deliver(makeRecord("[1,2]"), error));
  EXPECT_EQ(error, "event body is not an object");
  EXPECT_TRUE(service_.requests().empty());
}

TEST(GrpcSinkUnavailableTest, ReportsRpcFailure) {
  GrpcSinkConfig config;
  config.address = "127.0.0.1:1";
  config.connect_timeout = std::chrono::milliseconds(200);
  config.rpc_timeout = std::chrono::milliseconds(500);
  GrpcSink sink(config);

  std::string error;
  EXPECT_FALSE(sink.connect(error));
  EXPECT_FALSE(sink.deliver(makeRecord(R"({"a":1})"), error));
  EXPECT_EQ(error.rfind("Publish failed: ", 0), 0u);
}
