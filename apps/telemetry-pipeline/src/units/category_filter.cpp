#include "category_filter.hpp"

namespace telemetry {

CategoryFilter::CategoryFilter(const CategoryFilterConfig& config)
    : field_(config.field),
      include_(config.include.begin(), config.include.end()),
      exclude_(config.exclude.begin(), config.exclude.end()) {}

Outcome CategoryFilter::apply(EventRecord& record) {
  const Object* obj = record.object();
  if (obj == nullptr) {
    return recordFormatError(name_);
  }

  const FieldResult<std::string> category = stringAt(*obj, field_);
  if (!category.ok()) {
    return Outcome::next();
  }

  if (!include_.empty() && include_.count(category.value()) == 0) {
    return Outcome::drop();
  }
  if (!exclude_.empty() && exclude_.count(category.value()) > 0) {
    return Outcome::drop();
  }
  return Outcome::next();
}

} // namespace telemetry
