#ifndef TELEMETRY_PIPELINE_ENRICHER_HPP
#define TELEMETRY_PIPELINE_ENRICHER_HPP

#include <chrono>
#include <string>

#include "../chain.hpp"
#include "../lookup_client.hpp"
#include "../metrics.hpp"

namespace telemetry {

struct EnricherConfig {
  std::string endpoint;
  std::string id_field;
  std::chrono::milliseconds timeout{5000};
};

// Looks up one key taken from the record and stores the response under a fixed
// output field. Every miss or failure leaves the body untouched and records
// "<error_key>" in the metadata; the record itself always continues.
class KeyedEnricher : public TransformUnit {
 public:
  KeyedEnricher(
    std::string name,
    std::string output_field,
    std::string error_key,
    EnricherConfig config,
    LookupClient& client,
    Metrics* metrics
  );

  const std::string& name() const override { return name_; }
  Outcome apply(EventRecord& record) override;

  const EnricherConfig& config() const { return config_; }

 protected:
  // Called after the response has been attached to the body.
  virtual void onEnriched(EventRecord& record, const Object& data);

 private:
  std::string name_;
  std::string output_field_;
  std::string error_key_;
  EnricherConfig config_;
  LookupClient& client_;
  Metrics* metrics_;
};

} // namespace telemetry

#endif
