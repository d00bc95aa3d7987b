#include "value.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include <google/protobuf/util/json_util.h>

namespace telemetry {

namespace {

// 2^63; int64 max rounds up to it as a double, so the upper bound is exclusive.
constexpr double kInt64Bound = -static_cast<double>(std::numeric_limits<std::int64_t>::min());

bool isIntegral(double number) {
  return std::isfinite(number) && std::floor(number) == number && number >= -kInt64Bound && number < kInt64Bound;
}

} // namespace

const char* fieldErrorName(FieldError error) {
  switch (error) {
    case FieldError::kNone:
      return "none";
    case FieldError::kMissing:
      return "missing";
    case FieldError::kTypeMismatch:
      return "type mismatch";
  }
  return "unknown";
}

std::vector<std::string> splitFieldPath(const std::string& path) {
  std::vector<std::string> parts;
  std::string current;
  for (const char ch : path) {
    if (ch == '.') {
      if (!current.empty()) {
        parts.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

const Value* findPath(const Object& object, const std::string& path) {
  const std::vector<std::string> parts = splitFieldPath(path);
  if (parts.empty()) {
    return nullptr;
  }

  const Object* level = &object;
  const Value* current = nullptr;
  for (std::size_t i = 0; i < parts.size(); i += 1) {
    if (level == nullptr) {
      return nullptr;
    }
    const auto it = level->fields().find(parts[i]);
    if (it == level->fields().end()) {
      return nullptr;
    }
    current = &it->second;
    level = isObject(*current) ? &current->struct_value() : nullptr;
  }
  return current;
}

FieldResult<const Value*> valueAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<const Value*>::missing();
  }
  return FieldResult<const Value*>::found(value);
}

FieldResult<std::string> stringAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<std::string>::missing();
  }
  if (value->kind_case() != Value::kStringValue) {
    return FieldResult<std::string>::mismatch();
  }
  return FieldResult<std::string>::found(value->string_value());
}

FieldResult<double> numberAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<double>::missing();
  }
  if (value->kind_case() != Value::kNumberValue) {
    return FieldResult<double>::mismatch();
  }
  return FieldResult<double>::found(value->number_value());
}

FieldResult<std::int64_t> integerAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<std::int64_t>::missing();
  }
  std::int64_t integer = 0;
  if (!asInteger(*value, integer)) {
    return FieldResult<std::int64_t>::mismatch();
  }
  return FieldResult<std::int64_t>::found(integer);
}

FieldResult<const Object*> objectAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<const Object*>::missing();
  }
  if (!isObject(*value)) {
    return FieldResult<const Object*>::mismatch();
  }
  return FieldResult<const Object*>::found(&value->struct_value());
}

FieldResult<const List*> listAt(const Object& object, const std::string& path) {
  const Value* value = findPath(object, path);
  if (value == nullptr) {
    return FieldResult<const List*>::missing();
  }
  if (!isList(*value)) {
    return FieldResult<const List*>::mismatch();
  }
  return FieldResult<const List*>::found(&value->list_value());
}

bool isObject(const Value& value) {
  return value.kind_case() == Value::kStructValue;
}

bool isList(const Value& value) {
  return value.kind_case() == Value::kListValue;
}

bool asInteger(const Value& value, std::int64_t& out) {
  if (value.kind_case() != Value::kNumberValue || !isIntegral(value.number_value())) {
    return false;
  }
  out = static_cast<std::int64_t>(value.number_value());
  return true;
}

Value makeString(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value makeNumber(double number) {
  Value value;
  value.set_number_value(number);
  return value;
}

Value makeObject(const Object& object) {
  Value value;
  *value.mutable_struct_value() = object;
  return value;
}

std::string toDisplayString(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double number = value.number_value();
      if (isIntegral(number)) {
        return std::to_string(static_cast<long long>(number));
      }
      std::ostringstream stream;
      stream << std::setprecision(15) << number;
      return stream.str();
    }
    default:
      return toJson(value);
  }
}

bool parseJson(const std::string& text, Value& out, std::string& error) {
  out.Clear();
  const auto status = google::protobuf::util::JsonStringToMessage(text, &out);
  if (!status.ok()) {
    error = status.ToString();
    return false;
  }
  return true;
}

std::string toJson(const Value& value) {
  std::string out;
  const auto status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    // Only non-finite numbers fail to print; they never come out of parseJson.
    return "null";
  }
  return out;
}

std::string toJson(const Object& object) {
  std::string out;
  const auto status = google::protobuf::util::MessageToJsonString(object, &out);
  if (!status.ok()) {
    return "{}";
  }
  return out;
}

} // namespace telemetry
