#include <string>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "units/payload_tagger.hpp"

using namespace telemetry;
using telemetry::test::makeRecord;

namespace {

std::string meta(const EventRecord& record, const std::string& key) {
  std::string value;
  record.getMeta(key, value);
  return value;
}

} // namespace

TEST(PayloadTaggerTest, CopiesClassifiersAndAddsSemanticTags) {
  PayloadTagger tagger{PayloadTaggerConfig()};
  EventRecord record = makeRecord(R"({"class_uid":2004,"severity_id":5,"category_uid":2})");

  EXPECT_EQ(tagger.apply(record).kind, OutcomeKind::kContinue);
  EXPECT_EQ(meta(record, "tag.class_uid"), "2004");
  EXPECT_EQ(meta(record, "tag.severity_id"), "5");
  EXPECT_EQ(meta(record, "tag.category_uid"), "2");
  EXPECT_EQ(meta(record, "tag.category"), "detection");
  EXPECT_EQ(meta(record, "tag.type"), "alert");
  EXPECT_EQ(meta(record, "tag.severity"), "critical");
  EXPECT_EQ(meta(record, "tag.priority"), "critical");
  EXPECT_EQ(meta(record, "tag.domain"), "findings");
}

TEST(PayloadTaggerTest, AuthenticationHasNoType) {
  PayloadTagger tagger{PayloadTaggerConfig()};
  EventRecord record = makeRecord(R"({"class_uid":3002,"severity_id":1})");
  tagger.apply(record);

  EXPECT_EQ(meta(record, "tag.category"), "authentication");
  EXPECT_FALSE(record.hasMeta("tag.type"));
  EXPECT_EQ(meta(record, "tag.severity"), "informational");
  EXPECT_EQ(meta(record, "tag.priority"), "low");
}

TEST(PayloadTaggerTest, FractionalCodesAreCopiedButNotInterpreted) {
  PayloadTagger tagger{PayloadTaggerConfig()};
  EventRecord record = makeRecord(R"({"severity_id":2.5})");
  tagger.apply(record);

  EXPECT_EQ(meta(record, "tag.severity_id"), "2.5");
  EXPECT_FALSE(record.hasMeta("tag.severity"));
}

TEST(PayloadTaggerTest, ShapeTags) {
  PayloadTagger tagger{PayloadTaggerConfig()};
  EventRecord record = makeRecord(R"({
    "observables":[{"name":"a"},{"name":"b","threat_intel":{"severity":"high"}}],
    "asset":{"owner":"IT"},
    "status_id":1,
    "metadata":{"uid":"evt-1"}})");
  tagger.apply(record);

  EXPECT_EQ(meta(record, "tag.has_observables"), "true");
  EXPECT_EQ(meta(record, "tag.observable_count"), "2");
  EXPECT_EQ(meta(record, "tag.has_threat_intel"), "true");
  EXPECT_EQ(meta(record, "tag.threat_detected"), "true");
  EXPECT_EQ(meta(record, "tag.enriched"), "asset");
  EXPECT_EQ(meta(record, "tag.status"), "success");
  EXPECT_EQ(meta(record, "tag.event_id"), "evt-1");

  EventRecord failed = makeRecord(R"({"status_id":2,"observables":[]})");
  tagger.apply(failed);
  EXPECT_EQ(meta(failed, "tag.status"), "failure");
  EXPECT_FALSE(failed.hasMeta("tag.has_observables"));
}

TEST(PayloadTaggerTest, TimestampAndSourceOptions) {
  PayloadTaggerConfig config;
  config.add_source_tag = true;
  PayloadTagger tagger(config);

  EventRecord record = makeRecord("{}");
  record.setMeta(kReceivedAtKey, "2026-03-01T10:00:00Z");
  tagger.apply(record);
  EXPECT_EQ(meta(record, "tag.ingested_at"), "2026-03-01T10:00:00Z");
  EXPECT_EQ(meta(record, "tag.source"), "http_receiver");

  PayloadTaggerConfig quiet;
  quiet.add_timestamp_tag = false;
  PayloadTagger quiet_tagger(quiet);
  EventRecord untagged = makeRecord("{}");
  untagged.setMeta(kReceivedAtKey, "2026-03-01T10:00:00Z");
  quiet_tagger.apply(untagged);
  EXPECT_FALSE(untagged.hasMeta("tag.ingested_at"));
  EXPECT_FALSE(untagged.hasMeta("tag.source"));
}

TEST(PayloadTaggerTest, CustomTagFieldsAcceptNestedPaths) {
  PayloadTaggerConfig config;
  config.tag_fields = {"device.os", "missing"};
  PayloadTagger tagger(config);

  EventRecord record = makeRecord(R"({"device":{"os":"linux"},"class_uid":2004})");
  tagger.apply(record);
  EXPECT_EQ(meta(record, "tag.device.os"), "linux");
  EXPECT_FALSE(record.hasMeta("tag.missing"));
  EXPECT_FALSE(record.hasMeta("tag.class_uid"));
}

TEST(PayloadTaggerTest, ApplyingTwiceEqualsApplyingOnce) {
  PayloadTaggerConfig config;
  config.add_source_tag = true;
  PayloadTagger tagger(config);
  const std::string body =
    R"({"class_uid":2004,"severity_id":4,"category_uid":2,"status_id":1,"observables":[{"name":"x","threat_intel":{}}]})";

  EventRecord once = makeRecord(body);
  once.setMeta(kReceivedAtKey, "2026-03-01T10:00:00Z");
  tagger.apply(once);

  EventRecord twice = makeRecord(body);
  twice.setMeta(kReceivedAtKey, "2026-03-01T10:00:00Z");
  tagger.apply(twice);
  tagger.apply(twice);

  EXPECT_EQ(once.metadata(), twice.metadata());
  EXPECT_TRUE(telemetry::test::sameJson(twice.body(), body));
}

TEST(PayloadTaggerTest, NonObjectBodyPassesWithoutTags) {
  PayloadTagger tagger{PayloadTaggerConfig()};
  EventRecord record = makeRecord("[1,2]");
  EXPECT_EQ(tagger.apply(record).kind, OutcomeKind::kContinue);
  EXPECT_TRUE(record.metadata().empty());
}
