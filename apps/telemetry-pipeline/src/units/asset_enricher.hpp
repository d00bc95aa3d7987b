#ifndef TELEMETRY_PIPELINE_ASSET_ENRICHER_HPP
#define TELEMETRY_PIPELINE_ASSET_ENRICHER_HPP

#include <string>
#include <vector>

#include "enricher.hpp"

namespace telemetry {

// Attaches the asset service response under "asset" and appends contextual tags
// derived from the event classification and the fetched asset.
class AssetEnricher : public KeyedEnricher {
 public:
  static constexpr const char* kName = "asset_enricher";
  static constexpr const char* kErrorKey = "asset_enrich_error";
  static constexpr const char* kOutputField = "asset";
  static constexpr const char* kDefaultIdField = "asset_id";

  AssetEnricher(EnricherConfig config, LookupClient& client, Metrics* metrics = nullptr);

 protected:
  void onEnriched(EventRecord& record, const Object& asset) override;
};

// Tags for a record whose asset lookup succeeded. Depends only on its inputs.
std::vector<std::string> deriveAssetTags(const Object& event, const Object& asset);

} // namespace telemetry

#endif
