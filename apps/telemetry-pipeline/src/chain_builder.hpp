#ifndef TELEMETRY_PIPELINE_CHAIN_BUILDER_HPP
#define TELEMETRY_PIPELINE_CHAIN_BUILDER_HPP

#include "chain.hpp"
#include "lookup_client.hpp"
#include "metrics.hpp"
#include "units/asset_enricher.hpp"
#include "units/category_filter.hpp"
#include "units/payload_tagger.hpp"
#include "units/threat_intel_enricher.hpp"
#include "units/user_enricher.hpp"

namespace telemetry {

struct ChainSettings {
  CategoryFilterConfig filter;
  EnricherConfig asset{"", AssetEnricher::kDefaultIdField};
  EnricherConfig user{"", UserEnricher::kDefaultIdField};
  ThreatIntelConfig threat_intel;
  PayloadTaggerConfig tagger;
};

// Declared order: category filter, asset, user, threat intel, payload tagger.
// Enrichers without an endpoint are left out.
ProcessorChain buildProcessorChain(const ChainSettings& settings, LookupClient& client, Metrics* metrics);

} // namespace telemetry

#endif
