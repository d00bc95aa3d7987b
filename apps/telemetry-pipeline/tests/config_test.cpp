#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "config.hpp"

using namespace telemetry;

namespace {

// argv[0] is supplied; the vector holds the flags only.
bool parse(std::vector<std::string> args, ServiceConfig& config, std::string& error) {
  std::vector<char*> argv;
  static std::string program = "telemetry-pipeline";
  argv.push_back(&program[0]);
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  return parseArguments(static_cast<int>(argv.size()), argv.data(), config, error);
}

} // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* name :
         {kListenAddressEnv, kAssetEndpointEnv, kUserEndpointEnv, kThreatIntelEndpointEnv, kSinkAddressEnv,
          kLogLevelEnv}) {
      ::unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  ServiceConfig config;
  std::string error;
  ASSERT_TRUE(parse({}, config, error)) << error;

  EXPECT_EQ(config.http.address, "0.0.0.0");
  EXPECT_EQ(config.http.port, 8080);
  EXPECT_EQ(config.http.path, "/events");
  EXPECT_EQ(config.gateway.max_batch_size, 100u);
  EXPECT_EQ(config.gateway.queue_capacity, 100u);
  EXPECT_EQ(config.pipeline.poll_timeout.count(), 30000);
  EXPECT_EQ(config.pipeline.drain_timeout.count(), 10000);
  EXPECT_EQ(config.pipeline.on_fail, FailurePolicy::kLogAndDrop);
  EXPECT_EQ(config.chain.asset.id_field, "asset_id");
  EXPECT_EQ(config.chain.user.id_field, "user_id");
  EXPECT_EQ(config.chain.asset.timeout.count(), 5000);
  EXPECT_EQ(config.output, "-");
  EXPECT_FALSE(config.show_help);
}

TEST_F(ConfigTest, FlagsPopulateEverySection) {
  ServiceConfig config;
  std::string error;
  ASSERT_TRUE(parse(
                {"--listen", "127.0.0.1:9090", "--path", "/ingest", "--max-batch-size", "10", "--queue-size", "20",
                 "--workers", "3", "--lookup-timeout-ms", "250", "--asset-endpoint", "http://assets",
                 "--user-id-field", "actor.user.uid", "--include", "security, network", "--exclude", "test",
                 "--tag-fields", "class_uid", "--no-timestamp-tag", "--source-tag", "--on-fail", "dead-letter",
                 "--dead-letter", "failed.ndjson", "--log-level", "debug"},
                config, error
              ))
    << error;

  EXPECT_EQ(config.http.address, "127.0.0.1");
  EXPECT_EQ(config.http.port, 9090);
  EXPECT_EQ(config.http.path, "/ingest");
  EXPECT_EQ(config.gateway.max_batch_size, 10u);
  EXPECT_EQ(config.gateway.queue_capacity, 20u);
  EXPECT_EQ(config.pipeline.workers, 3u);
  EXPECT_EQ(config.chain.asset.endpoint, "http://assets");
  EXPECT_EQ(config.chain.asset.timeout.count(), 250);
  EXPECT_EQ(config.chain.threat_intel.timeout.count(), 250);
  EXPECT_EQ(config.chain.user.id_field, "actor.user.uid");
  EXPECT_EQ(config.chain.filter.include, (std::vector<std::string>{"security", "network"}));
  EXPECT_EQ(config.chain.filter.exclude, (std::vector<std::string>{"test"}));
  EXPECT_EQ(config.chain.tagger.tag_fields, (std::vector<std::string>{"class_uid"}));
  EXPECT_FALSE(config.chain.tagger.add_timestamp_tag);
  EXPECT_TRUE(config.chain.tagger.add_source_tag);
  EXPECT_EQ(config.pipeline.on_fail, FailurePolicy::kDeadLetter);
  EXPECT_EQ(config.dead_letter, "failed.ndjson");
  EXPECT_EQ(config.log_level, LogLevel::kDebug);
}

TEST_F(ConfigTest, RejectsBadValues) {
  const std::vector<std::vector<std::string>> cases = {
    {"--max-batch-size", "0"},
    {"--queue-size", "ten"},
    {"--listen", "localhost"},
    {"--listen", ":70000"},
    {"--path", "events"},
    {"--on-fail", "retry"},
    {"--log-level", "loud"},
    {"--workers"},
    {"--bogus", "1"},
    {"stray"},
    {"--on-fail", "dead-letter"},
  };
  for (const auto& args : cases) {
    ServiceConfig config;
    std::string error;
    EXPECT_FALSE(parse(args, config, error)) << args[0];
    EXPECT_FALSE(error.empty()) << args[0];
  }
}

TEST_F(ConfigTest, HelpStopsParsing) {
  ServiceConfig config;
  std::string error;
  ASSERT_TRUE(parse({"--help", "--bogus"}, config, error));
  EXPECT_TRUE(config.show_help);
}

TEST_F(ConfigTest, EnvironmentSuppliesDefaultsFlagsOverride) {
  ::setenv(kListenAddressEnv, ":7070", 1);
  ::setenv(kAssetEndpointEnv, "http://env-assets", 1);
  ::setenv(kThreatIntelEndpointEnv, "http://env-intel", 1);
  ::setenv(kLogLevelEnv, "warn", 1);

  ServiceConfig config;
  std::string error;
  ASSERT_TRUE(applyEnvironment(config, error)) << error;
  ASSERT_TRUE(parse({"--asset-endpoint", "http://flag-assets"}, config, error)) << error;

  EXPECT_EQ(config.http.address, "0.0.0.0");
  EXPECT_EQ(config.http.port, 7070);
  EXPECT_EQ(config.chain.asset.endpoint, "http://flag-assets");
  EXPECT_EQ(config.chain.threat_intel.endpoint, "http://env-intel");
  EXPECT_EQ(config.log_level, LogLevel::kWarn);
}

TEST_F(ConfigTest, InvalidEnvironmentIsReported) {
  ::setenv(kLogLevelEnv, "chatty", 1);
  ServiceConfig config;
  std::string error;
  EXPECT_FALSE(applyEnvironment(config, error));
  EXPECT_EQ(error, "Invalid value for LOG_LEVEL: chatty");
}

TEST(ListenAddressTest, Forms) {
  std::string host;
  unsigned short port = 0;

  ASSERT_TRUE(parseListenAddress("10.1.2.3:80", host, port));
  EXPECT_EQ(host, "10.1.2.3");
  EXPECT_EQ(port, 80);

  ASSERT_TRUE(parseListenAddress("[::1]:8443", host, port));
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 8443);

  ASSERT_TRUE(parseListenAddress(":0", host, port));
  EXPECT_EQ(host, "0.0.0.0");
  EXPECT_EQ(port, 0);

  EXPECT_FALSE(parseListenAddress("host:", host, port));
  EXPECT_FALSE(parseListenAddress("host:http", host, port));
}

TEST(SplitListTest, TrimsAndSkipsEmptyItems) {
  EXPECT_EQ(splitList(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(splitList("").empty());
  EXPECT_TRUE(splitList(" , ").empty());
}
