#ifndef TELEMETRY_PIPELINE_THREAT_INTEL_ENRICHER_HPP
#define TELEMETRY_PIPELINE_THREAT_INTEL_ENRICHER_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "../chain.hpp"
#include "../lookup_client.hpp"
#include "../metrics.hpp"

namespace telemetry {

// Observable type_id values carried in "observables".
enum class ObservableType : std::int64_t {
  kHostname = 1,
  kIpAddress = 2,
  kUserName = 3,
  kDomainName = 4,
  kEmailAddress = 5,
  kFileName = 7,
  kFileHash = 8,
  kProcessName = 9,
  kPort = 14,
  kUserAgent = 22,
  kUrl = 23,
};

// Types worth a reputation lookup: hostname, IP, domain, email, file name, hash, URL.
bool isThreatIntelEligible(std::int64_t type_id);

struct ThreatIntelConfig {
  std::string endpoint;
  std::chrono::milliseconds timeout{5000};
  // When set, a copy of every enriched observable is appended to this top-level
  // sequence as well.
  std::string collect_field;
};

// Looks up each eligible observable by name and stores the response on that
// observable as "threat_intel". Lookup failures are logged and skipped.
class ThreatIntelEnricher : public TransformUnit {
 public:
  static constexpr const char* kName = "threat_intel_enricher";
  static constexpr const char* kErrorKey = "threat_intel_error";
  static constexpr const char* kCountKey = "threat_intel_enriched";

  ThreatIntelEnricher(ThreatIntelConfig config, LookupClient& client, Metrics* metrics = nullptr);

  const std::string& name() const override { return name_; }
  Outcome apply(EventRecord& record) override;

 private:
  std::string name_ = kName;
  ThreatIntelConfig config_;
  LookupClient& client_;
  Metrics* metrics_;
};

} // namespace telemetry

#endif
