#ifndef TELEMETRY_PIPELINE_USER_ENRICHER_HPP
#define TELEMETRY_PIPELINE_USER_ENRICHER_HPP

#include "enricher.hpp"

namespace telemetry {

// Attaches the user directory response under "user".
class UserEnricher : public KeyedEnricher {
 public:
  static constexpr const char* kName = "user_enricher";
  static constexpr const char* kErrorKey = "user_enrich_error";
  static constexpr const char* kOutputField = "user";
  static constexpr const char* kDefaultIdField = "user_id";

  UserEnricher(EnricherConfig config, LookupClient& client, Metrics* metrics = nullptr);
};

} // namespace telemetry

#endif
