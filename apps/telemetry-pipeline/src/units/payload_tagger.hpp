#ifndef TELEMETRY_PIPELINE_PAYLOAD_TAGGER_HPP
#define TELEMETRY_PIPELINE_PAYLOAD_TAGGER_HPP

#include <string>
#include <vector>

#include "../chain.hpp"

namespace telemetry {

struct PayloadTaggerConfig {
  std::vector<std::string> tag_fields = {"class_uid", "severity_id", "category_uid"};
  bool add_timestamp_tag = true;
  bool add_source_tag = false;
};

// Writes "tag.*" metadata derived from classifier fields and the record's shape.
// No I/O, never drops or fails a record, and re-running it overwrites each tag
// with the same value.
class PayloadTagger : public TransformUnit {
 public:
  static constexpr const char* kName = "payload_tagger";

  explicit PayloadTagger(PayloadTaggerConfig config);

  const std::string& name() const override { return name_; }
  Outcome apply(EventRecord& record) override;

 private:
  void addSemanticTags(EventRecord& record, const std::string& field, const Value& value) const;
  void addContentTags(EventRecord& record, const Object& event) const;

  std::string name_ = kName;
  PayloadTaggerConfig config_;
};

} // namespace telemetry

#endif
