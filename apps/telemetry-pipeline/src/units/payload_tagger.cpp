#include "payload_tagger.hpp"

#include <utility>

#include "../log.hpp"

namespace telemetry {

PayloadTagger::PayloadTagger(PayloadTaggerConfig config) : config_(std::move(config)) {}

Outcome PayloadTagger::apply(EventRecord& record) {
  const Object* event = record.object();
  if (event == nullptr) {
    logWarn(kName) << "event #" << record.sequence() << " is not an object, no tags added";
    return Outcome::next();
  }

  if (config_.add_source_tag) {
    record.setMeta("tag.source", "http_receiver");
  }

  if (config_.add_timestamp_tag) {
    std::string received_at;
    if (record.getMeta(kReceivedAtKey, received_at)) {
      record.setMeta("tag.ingested_at", received_at);
    }
  }

  for (const auto& field : config_.tag_fields) {
    const Value* value = findPath(*event, field);
    if (value == nullptr) {
      continue;
    }
    record.setMeta("tag." + field, toDisplayString(*value));
    addSemanticTags(record, field, *value);
  }

  addContentTags(record, *event);
  return Outcome::next();
}

void PayloadTagger::addSemanticTags(EventRecord& record, const std::string& field, const Value& value) const {
  std::int64_t code = 0;
  if (!asInteger(value, code)) {
    return;
  }

  if (field == "class_uid") {
    switch (code) {
      case 2004:
        record.setMeta("tag.category", "detection");
        record.setMeta("tag.type", "alert");
        break;
      case 5001:
        record.setMeta("tag.category", "asset");
        record.setMeta("tag.type", "inventory");
        break;
      case 4001:
      case 4002:
      case 4003:
        record.setMeta("tag.category", "network");
        record.setMeta("tag.type", "activity");
        break;
      case 3001:
      case 3002:
        record.setMeta("tag.category", "authentication");
        break;
      case 1001:
      case 1002:
      case 1003:
        record.setMeta("tag.category", "system");
        record.setMeta("tag.type", "process");
        break;
      default:
        break;
    }
  } else if (field == "severity_id") {
    switch (code) {
      case 1:
        record.setMeta("tag.severity", "informational");
        record.setMeta("tag.priority", "low");
        break;
      case 2:
        record.setMeta("tag.severity", "low");
        record.setMeta("tag.priority", "low");
        break;
      case 3:
        record.setMeta("tag.severity", "medium");
        record.setMeta("tag.priority", "medium");
        break;
      case 4:
        record.setMeta("tag.severity", "high");
        record.setMeta("tag.priority", "high");
        break;
      case 5:
      case 6:
        record.setMeta("tag.severity", "critical");
        record.setMeta("tag.priority", "critical");
        break;
      default:
        break;
    }
  } else if (field == "category_uid") {
    switch (code) {
      case 1:
        record.setMeta("tag.domain", "system");
        break;
      case 2:
        record.setMeta("tag.domain", "findings");
        break;
      case 3:
        record.setMeta("tag.domain", "identity");
        break;
      case 4:
        record.setMeta("tag.domain", "network");
        break;
      case 5:
        record.setMeta("tag.domain", "discovery");
        break;
      default:
        break;
    }
  }
}

void PayloadTagger::addContentTags(EventRecord& record, const Object& event) const {
  const FieldResult<const List*> observables = listAt(event, "observables");
  if (observables.ok() && observables.value()->values_size() > 0) {
    record.setMeta("tag.has_observables", "true");
    record.setMeta("tag.observable_count", std::to_string(observables.value()->values_size()));

    for (const Value& entry : observables.value()->values()) {
      if (isObject(entry) && entry.struct_value().fields().count("threat_intel") > 0) {
        record.setMeta("tag.has_threat_intel", "true");
        record.setMeta("tag.threat_detected", "true");
        break;
      }
    }
  }

  if (event.fields().count("asset") > 0) {
    record.setMeta("tag.enriched", "asset");
  }

  const FieldResult<double> status = numberAt(event, "status_id");
  if (status.ok()) {
    record.setMeta("tag.status", status.value() == 1 ? "success" : "failure");
  }

  const FieldResult<std::string> uid = stringAt(event, "metadata.uid");
  if (uid.ok()) {
    record.setMeta("tag.event_id", uid.value());
  }
}

} // namespace telemetry
