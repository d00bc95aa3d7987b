#include "enricher.hpp"

#include <utility>

#include "../log.hpp"

namespace telemetry {

KeyedEnricher::KeyedEnricher(
  std::string name,
  std::string output_field,
  std::string error_key,
  EnricherConfig config,
  LookupClient& client,
  Metrics* metrics
)
    : name_(std::move(name)),
      output_field_(std::move(output_field)),
      error_key_(std::move(error_key)),
      config_(std::move(config)),
      client_(client),
      metrics_(metrics) {}

void KeyedEnricher::onEnriched(EventRecord& /*record*/, const Object& /*data*/) {}

Outcome KeyedEnricher::apply(EventRecord& record) {
  Object* obj = record.object();
  if (obj == nullptr) {
    return recordFormatError(name_);
  }

  const FieldResult<std::string> id = stringAt(*obj, config_.id_field);
  if (!id.ok() || id.value().empty()) {
    const std::string reason = id.ok() ? "empty" : fieldErrorName(id.error());
    logDebug(name_.c_str()) << "event #" << record.sequence() << ": id field " << config_.id_field << " " << reason;
    record.setMeta(error_key_, "id field " + config_.id_field + ": " + reason);
    return Outcome::next();
  }

  LookupResult lookup = client_.fetch(config_.endpoint, id.value(), config_.timeout);
  if (!lookup.ok) {
    logWarn(name_.c_str()) << name_ << " failed for " << id.value() << ": " << lookup.error;
    record.setMeta(error_key_, lookup.error);
    if (metrics_ != nullptr) {
      metrics_->incrementLookupFailures();
    }
    return Outcome::next();
  }

  Value& slot = (*obj->mutable_fields())[output_field_];
  *slot.mutable_struct_value() = std::move(lookup.data);
  onEnriched(record, slot.struct_value());
  return Outcome::next();
}

} // namespace telemetry
