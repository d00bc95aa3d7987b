#ifndef TELEMETRY_PIPELINE_CATEGORY_FILTER_HPP
#define TELEMETRY_PIPELINE_CATEGORY_FILTER_HPP

#include <string>
#include <unordered_set>
#include <vector>

#include "../chain.hpp"

namespace telemetry {

struct CategoryFilterConfig {
  std::string field = "category";
  std::vector<std::string> include;
  std::vector<std::string> exclude;
};

// Keeps or drops a record from one string field:
//   field absent or not a string  -> keep
//   include non-empty, not listed  -> drop
//   exclude non-empty, listed      -> drop
//   otherwise                      -> keep
class CategoryFilter : public TransformUnit {
 public:
  static constexpr const char* kName = "category_filter";

  explicit CategoryFilter(const CategoryFilterConfig& config);

  const std::string& name() const override { return name_; }
  Outcome apply(EventRecord& record) override;

 private:
  std::string name_ = kName;
  std::string field_;
  std::unordered_set<std::string> include_;
  std::unordered_set<std::string> exclude_;
};

} // namespace telemetry

#endif
