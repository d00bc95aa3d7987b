#include "chain_builder.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace telemetry {

ProcessorChain buildProcessorChain(const ChainSettings& settings, LookupClient& client, Metrics* metrics) {
  std::vector<std::unique_ptr<TransformUnit>> units;

  units.push_back(std::make_unique<CategoryFilter>(settings.filter));
  if (!settings.asset.endpoint.empty()) {
    units.push_back(std::make_unique<AssetEnricher>(settings.asset, client, metrics));
  }
  if (!settings.user.endpoint.empty()) {
    units.push_back(std::make_unique<UserEnricher>(settings.user, client, metrics));
  }
  if (!settings.threat_intel.endpoint.empty()) {
    units.push_back(std::make_unique<ThreatIntelEnricher>(settings.threat_intel, client, metrics));
  }
  units.push_back(std::make_unique<PayloadTagger>(settings.tagger));

  return ProcessorChain(std::move(units));
}

} // namespace telemetry
