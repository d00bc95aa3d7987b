#include "threat_intel_enricher.hpp"

#include <utility>
#include <vector>

#include "../log.hpp"

namespace telemetry {

bool isThreatIntelEligible(std::int64_t type_id) {
  switch (static_cast<ObservableType>(type_id)) {
    case ObservableType::kHostname:
    case ObservableType::kIpAddress:
    case ObservableType::kDomainName:
    case ObservableType::kEmailAddress:
    case ObservableType::kFileName:
    case ObservableType::kFileHash:
    case ObservableType::kUrl:
      return true;
    default:
      return false;
  }
}

ThreatIntelEnricher::ThreatIntelEnricher(ThreatIntelConfig config, LookupClient& client, Metrics* metrics)
    : config_(std::move(config)), client_(client), metrics_(metrics) {}

Outcome ThreatIntelEnricher::apply(EventRecord& record) {
  Object* obj = record.object();
  if (obj == nullptr) {
    return recordFormatError(name_);
  }

  auto found = obj->mutable_fields()->find("observables");
  if (found == obj->mutable_fields()->end() || !isList(found->second) ||
      found->second.list_value().values_size() == 0) {
    return Outcome::next();
  }

  List* observables = found->second.mutable_list_value();
  logDebug(kName) << "event #" << record.sequence() << ": " << observables->values_size() << " observables";

  int enriched = 0;
  int failed = 0;
  std::vector<Value> collected;
  for (int i = 0; i < observables->values_size(); i += 1) {
    Value& entry = *observables->mutable_values(i);
    if (!isObject(entry)) {
      logDebug(kName) << "observable #" << i << " is not an object, skipping";
      continue;
    }
    Object& observable = *entry.mutable_struct_value();

    const FieldResult<std::int64_t> type_id = integerAt(observable, "type_id");
    if (!type_id.ok() || !isThreatIntelEligible(type_id.value())) {
      continue;
    }
    const FieldResult<std::string> ioc = stringAt(observable, "name");
    if (!ioc.ok() || ioc.value().empty()) {
      continue;
    }

    LookupResult lookup = client_.fetch(config_.endpoint, ioc.value(), config_.timeout);
    if (!lookup.ok) {
      logWarn(kName) << "threat_intel lookup failed for " << ioc.value() << ": " << lookup.error;
      record.setMeta(kErrorKey, ioc.value() + ": " + lookup.error);
      if (metrics_ != nullptr) {
        metrics_->incrementLookupFailures();
      }
      failed += 1;
      continue;
    }

    *(*observable.mutable_fields())["threat_intel"].mutable_struct_value() = std::move(lookup.data);
    enriched += 1;
    if (!config_.collect_field.empty()) {
      collected.push_back(entry);
    }
  }

  if (!collected.empty()) {
    Value& target = (*obj->mutable_fields())[config_.collect_field];
    if (!isList(target)) {
      target.mutable_list_value()->Clear();
    }
    for (auto& value : collected) {
      *target.mutable_list_value()->add_values() = std::move(value);
    }
  }

  record.setMeta(kCountKey, std::to_string(enriched));
  if (enriched > 0) {
    logDebug(kName) << "enriched " << enriched << " observables";
  } else if (failed > 0) {
    logWarn(kName) << "no observables were enriched for event #" << record.sequence();
  }
  return Outcome::next();
}

} // namespace telemetry
