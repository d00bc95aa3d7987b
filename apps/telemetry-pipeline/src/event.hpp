#ifndef TELEMETRY_PIPELINE_EVENT_HPP
#define TELEMETRY_PIPELINE_EVENT_HPP

#include <cstdint>
#include <map>
#include <string>

#include "value.hpp"

namespace telemetry {

// Metadata keys shared between the gateway, units and sinks.
constexpr const char* kReceivedAtKey = "http.received_at";
constexpr const char* kTagsField = "tags";

using Metadata = std::map<std::string, std::string>;

// One in-flight event: the JSON body plus the metadata sidecar that travels with it.
class EventRecord {
 public:
  EventRecord() = default;
  explicit EventRecord(Value body);

  const Value& body() const { return body_; }
  Value& body() { return body_; }

  // The body as a mapping, or nullptr when the body is anything else.
  const Object* object() const;
  Object* object();

  const Metadata& metadata() const { return metadata_; }
  void setMeta(const std::string& key, const std::string& value);
  bool hasMeta(const std::string& key) const;
  bool getMeta(const std::string& key, std::string& out) const;

  // Appends to the body's "tags" sequence, creating it (or replacing a non-sequence
  // value) as needed. Returns false if the tag was already present or the body is
  // not a mapping.
  bool appendTag(const std::string& tag);

  std::int64_t sequence() const { return sequence_; }
  void setSequence(std::int64_t sequence) { sequence_ = sequence; }

  std::string bodyJson() const;

 private:
  Value body_;
  Metadata metadata_;
  std::int64_t sequence_ = 0;
};

} // namespace telemetry

#endif
