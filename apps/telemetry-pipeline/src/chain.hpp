#ifndef TELEMETRY_PIPELINE_CHAIN_HPP
#define TELEMETRY_PIPELINE_CHAIN_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "event.hpp"

namespace telemetry {

enum class OutcomeKind {
  kContinue,
  kDrop,
  kFail,
};

struct Outcome {
  OutcomeKind kind = OutcomeKind::kContinue;
  std::string error;

  static Outcome next() { return Outcome{OutcomeKind::kContinue, {}}; }
  static Outcome drop() { return Outcome{OutcomeKind::kDrop, {}}; }
  static Outcome fail(std::string message) { return Outcome{OutcomeKind::kFail, std::move(message)}; }
};

// One step of the chain. apply() may read and mutate the record and its metadata.
// Implementations may be called concurrently for different records; any state
// they keep must be guarded by the unit itself.
class TransformUnit {
 public:
  virtual ~TransformUnit() = default;

  virtual const std::string& name() const = 0;
  virtual Outcome apply(EventRecord& record) = 0;
};

enum class ChainStatus {
  kForwarded,
  kDropped,
  kFailed,
};

const char* chainStatusName(ChainStatus status);

struct ChainResult {
  ChainStatus status = ChainStatus::kForwarded;
  // Unit that dropped or failed the record.
  std::string unit;
  std::string error;
};

// Fixed, declared-order sequence of units. Immutable once built, so one chain can
// serve every worker.
class ProcessorChain {
 public:
  ProcessorChain() = default;
  explicit ProcessorChain(std::vector<std::unique_ptr<TransformUnit>> units);

  ProcessorChain(ProcessorChain&&) = default;
  ProcessorChain& operator=(ProcessorChain&&) = default;

  ChainResult run(EventRecord& record) const;

  std::size_t size() const { return units_.size(); }
  std::vector<std::string> unitNames() const;

 private:
  std::vector<std::unique_ptr<TransformUnit>> units_;
};

// Fail outcome for units that need the record body to be a mapping.
Outcome recordFormatError(const std::string& unit);

} // namespace telemetry

#endif
