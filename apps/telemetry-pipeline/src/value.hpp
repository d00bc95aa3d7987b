#ifndef TELEMETRY_PIPELINE_VALUE_HPP
#define TELEMETRY_PIPELINE_VALUE_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace telemetry {

using Value = google::protobuf::Value;
using Object = google::protobuf::Struct;
using List = google::protobuf::ListValue;

enum class FieldError {
  kNone,
  kMissing,
  kTypeMismatch,
};

const char* fieldErrorName(FieldError error);

// Outcome of a typed field access. A missing field and a field of the wrong type
// are distinct states; neither carries a usable value.
template <typename T>
class FieldResult {
 public:
  static FieldResult found(T value) { return FieldResult(FieldError::kNone, std::move(value)); }
  static FieldResult missing() { return FieldResult(FieldError::kMissing, T{}); }
  static FieldResult mismatch() { return FieldResult(FieldError::kTypeMismatch, T{}); }

  bool ok() const { return error_ == FieldError::kNone; }
  bool isMissing() const { return error_ == FieldError::kMissing; }
  bool isMismatch() const { return error_ == FieldError::kTypeMismatch; }
  FieldError error() const { return error_; }

  const T& value() const { return value_; }

 private:
  FieldResult(FieldError error, T value) : error_(error), value_(std::move(value)) {}

  FieldError error_;
  T value_;
};

// "device.uid" -> {"device", "uid"}. Empty segments are skipped.
std::vector<std::string> splitFieldPath(const std::string& path);

// Descends one mapping level per path segment. Returns nullptr when a segment is
// absent or an intermediate value is not a mapping.
const Value* findPath(const Object& object, const std::string& path);

FieldResult<const Value*> valueAt(const Object& object, const std::string& path);
FieldResult<std::string> stringAt(const Object& object, const std::string& path);
FieldResult<double> numberAt(const Object& object, const std::string& path);
FieldResult<std::int64_t> integerAt(const Object& object, const std::string& path);
FieldResult<const Object*> objectAt(const Object& object, const std::string& path);
FieldResult<const List*> listAt(const Object& object, const std::string& path);

bool isObject(const Value& value);
bool isList(const Value& value);

// Integral numbers only; 7.0 converts, 7.5 and non-numbers do not.
bool asInteger(const Value& value, std::int64_t& out);

Value makeString(const std::string& text);
Value makeNumber(double number);
Value makeObject(const Object& object);

// Numbers without a trailing ".0" when integral, strings verbatim, booleans as
// true/false, everything else as compact JSON.
std::string toDisplayString(const Value& value);

bool parseJson(const std::string& text, Value& out, std::string& error);
std::string toJson(const Value& value);
std::string toJson(const Object& object);

} // namespace telemetry

#endif
