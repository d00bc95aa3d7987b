#include "asset_enricher.hpp"

#include <utility>

namespace telemetry {

namespace {

constexpr std::int64_t kDetectionFinding = 2004;
constexpr std::int64_t kProcessActivity = 1007;

} // namespace

AssetEnricher::AssetEnricher(EnricherConfig config, LookupClient& client, Metrics* metrics)
    : KeyedEnricher(kName, kOutputField, kErrorKey, std::move(config), client, metrics) {}

std::vector<std::string> deriveAssetTags(const Object& event, const Object& asset) {
  std::vector<std::string> tags;

  const FieldResult<std::int64_t> class_uid = integerAt(event, "class_uid");
  if (class_uid.ok() && class_uid.value() == kDetectionFinding) {
    tags.emplace_back("ocsf_detection_finding");

    // 1=Info, 2=Low, 3=Medium, 4=High, 5=Critical
    const FieldResult<double> severity = numberAt(event, "severity_id");
    if (severity.ok()) {
      if (severity.value() >= 4) {
        tags.emplace_back("high_severity");
      }
      if (severity.value() == 5) {
        tags.emplace_back("critical_severity");
      }
    }

    const FieldResult<std::string> title = stringAt(event, "finding.title");
    if (title.ok() && !title.value().empty()) {
      tags.emplace_back("has_finding_title");
    }
  }

  if (class_uid.ok() && class_uid.value() == kProcessActivity) {
    tags.emplace_back("ocsf_process_activity");
    tags.emplace_back("edr_event");
  }

  const FieldResult<const List*> observables = listAt(event, "observables");
  if (observables.ok() && observables.value()->values_size() > 0) {
    tags.emplace_back("has_observables");
  }

  const FieldResult<std::string> owner = stringAt(asset, "owner");
  if (owner.ok() && owner.value() == "IT") {
    tags.emplace_back("it_asset");
  }
  const FieldResult<std::string> criticality = stringAt(asset, "criticality");
  if (criticality.ok() && criticality.value() == "high") {
    tags.emplace_back("critical_asset");
  }

  return tags;
}

void AssetEnricher::onEnriched(EventRecord& record, const Object& asset) {
  const Object* event = record.object();
  if (event == nullptr) {
    return;
  }
  const std::vector<std::string> tags = deriveAssetTags(*event, asset);
  for (const auto& tag : tags) {
    record.appendTag(tag);
  }
}

} // namespace telemetry
