#include "event.hpp"

#include <utility>

namespace telemetry {

EventRecord::EventRecord(Value body) : body_(std::move(body)) {}

const Object* EventRecord::object() const {
  return isObject(body_) ? &body_.struct_value() : nullptr;
}

Object* EventRecord::object() {
  return isObject(body_) ? body_.mutable_struct_value() : nullptr;
}

void EventRecord::setMeta(const std::string& key, const std::string& value) {
  metadata_[key] = value;
}

bool EventRecord::hasMeta(const std::string& key) const {
  return metadata_.find(key) != metadata_.end();
}

bool EventRecord::getMeta(const std::string& key, std::string& out) const {
  const auto it = metadata_.find(key);
  if (it == metadata_.end()) {
    return false;
  }
  out = it->second;
  return true;
}

bool EventRecord::appendTag(const std::string& tag) {
  Object* obj = object();
  if (obj == nullptr) {
    return false;
  }

  Value& tags = (*obj->mutable_fields())[kTagsField];
  if (!isList(tags)) {
    tags.mutable_list_value()->Clear();
  }
  List* list = tags.mutable_list_value();
  for (const Value& existing : list->values()) {
    if (existing.kind_case() == Value::kStringValue && existing.string_value() == tag) {
      return false;
    }
  }
  list->add_values()->set_string_value(tag);
  return true;
}

std::string EventRecord::bodyJson() const {
  return toJson(body_);
}

} // namespace telemetry
