#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "chain.hpp"
#include "chain_builder.hpp"
#include "test_support.hpp"

using namespace telemetry;
using telemetry::test::FakeLookupClient;
using telemetry::test::makeRecord;

namespace {

// Records its name in the "visited" metadata entry, then returns a fixed outcome.
class ScriptedUnit : public TransformUnit {
 public:
  ScriptedUnit(std::string name, std::function<Outcome()> outcome)
      : name_(std::move(name)), outcome_(std::move(outcome)) {}

  const std::string& name() const override { return name_; }

  Outcome apply(EventRecord& record) override {
    std::string visited;
    record.getMeta("visited", visited);
    record.setMeta("visited", visited + name_ + ";");
    return outcome_();
  }

 private:
  std::string name_;
  std::function<Outcome()> outcome_;
};

std::unique_ptr<TransformUnit> unit(const std::string& name, std::function<Outcome()> outcome) {
  return std::make_unique<ScriptedUnit>(name, std::move(outcome));
}

ProcessorChain chainOf(std::vector<std::unique_ptr<TransformUnit>> units) {
  return ProcessorChain(std::move(units));
}

std::string visited(const EventRecord& record) {
  std::string out;
  record.getMeta("visited", out);
  return out;
}

} // namespace

TEST(ProcessorChainTest, ContinueRunsEveryUnitInOrder) {
  std::vector<std::unique_ptr<TransformUnit>> units;
  units.push_back(unit("a", Outcome::next));
  units.push_back(unit("b", Outcome::next));
  units.push_back(unit("c", Outcome::next));
  const ProcessorChain chain = chainOf(std::move(units));

  EventRecord record = makeRecord("{}");
  const ChainResult result = chain.run(record);
  EXPECT_EQ(result.status, ChainStatus::kForwarded);
  EXPECT_TRUE(result.unit.empty());
  EXPECT_EQ(visited(record), "a;b;c;");
}

TEST(ProcessorChainTest, DropStopsTraversal) {
  std::vector<std::unique_ptr<TransformUnit>> units;
  units.push_back(unit("a", Outcome::next));
  units.push_back(unit("filter", Outcome::drop));
  units.push_back(unit("c", Outcome::next));
  const ProcessorChain chain = chainOf(std::move(units));

  EventRecord record = makeRecord("{}");
  const ChainResult result = chain.run(record);
  EXPECT_EQ(result.status, ChainStatus::kDropped);
  EXPECT_EQ(result.unit, "filter");
  EXPECT_EQ(visited(record), "a;filter;");
}

TEST(ProcessorChainTest, FailCarriesTheError) {
  std::vector<std::unique_ptr<TransformUnit>> units;
  units.push_back(unit("broken", []() { return Outcome::fail("bad input"); }));
  units.push_back(unit("after", Outcome::next));
  const ProcessorChain chain = chainOf(std::move(units));

  EventRecord record = makeRecord("{}");
  const ChainResult result = chain.run(record);
  EXPECT_EQ(result.status, ChainStatus::kFailed);
  EXPECT_EQ(result.unit, "broken");
  EXPECT_EQ(result.error, "bad input");
  EXPECT_EQ(visited(record), "broken;");
}

TEST(ProcessorChainTest, ThrowingUnitFailsOnlyThatRecord) {
  std::vector<std::unique_ptr<TransformUnit>> units;
  units.push_back(unit("thrower", []() -> Outcome { throw std::runtime_error("boom"); }));
  const ProcessorChain chain = chainOf(std::move(units));

  EventRecord record = makeRecord("{}");
  const ChainResult result = chain.run(record);
  EXPECT_EQ(result.status, ChainStatus::kFailed);
  EXPECT_EQ(result.error, "unhandled exception: boom");
}

TEST(ProcessorChainTest, EmptyChainForwards) {
  const ProcessorChain chain;
  EventRecord record = makeRecord("{}");
  EXPECT_EQ(chain.run(record).status, ChainStatus::kForwarded);
  EXPECT_EQ(chain.size(), 0u);
}

TEST(ProcessorChainTest, StatusNames) {
  EXPECT_STREQ(chainStatusName(ChainStatus::kForwarded), "forwarded");
  EXPECT_STREQ(chainStatusName(ChainStatus::kDropped), "dropped");
  EXPECT_STREQ(chainStatusName(ChainStatus::kFailed), "failed");
  EXPECT_EQ(recordFormatError("unit").error, "unit expects object");
}

TEST(ChainBuilderTest, LeavesOutEnrichersWithoutEndpoints) {
  FakeLookupClient client;
  const ProcessorChain chain = buildProcessorChain(ChainSettings(), client, nullptr);
  const std::vector<std::string> expected = {"category_filter", "payload_tagger"};
  EXPECT_EQ(chain.unitNames(), expected);
}

TEST(ChainBuilderTest, KeepsDeclaredOrder) {
  FakeLookupClient client;
  ChainSettings settings;
  settings.asset.endpoint = "http://assets";
  settings.user.endpoint = "http://users";
  settings.threat_intel.endpoint = "http://intel";

  const ProcessorChain chain = buildProcessorChain(settings, client, nullptr);
  const std::vector<std::string> expected = {
    "category_filter", "asset_enricher", "user_enricher", "threat_intel_enricher", "payload_tagger"};
  EXPECT_EQ(chain.unitNames(), expected);
}
