#include "user_enricher.hpp"

#include <utility>

namespace telemetry {

UserEnricher::UserEnricher(EnricherConfig config, LookupClient& client, Metrics* metrics)
    : KeyedEnricher(kName, kOutputField, kErrorKey, std::move(config), client, metrics) {}

} // namespace telemetry
