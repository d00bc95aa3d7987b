#include "chain.hpp"

#include <exception>

#include "log.hpp"

namespace telemetry {

const char* chainStatusName(ChainStatus status) {
  switch (status) {
    case ChainStatus::kForwarded:
      return "forwarded";
    case ChainStatus::kDropped:
      return "dropped";
    case ChainStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

Outcome recordFormatError(const std::string& unit) {
  return Outcome::fail(unit + " expects object");
}

ProcessorChain::ProcessorChain(std::vector<std::unique_ptr<TransformUnit>> units) : units_(std::move(units)) {}

ChainResult ProcessorChain::run(EventRecord& record) const {
  ChainResult result;
  OutcomeKind state = OutcomeKind::kContinue;

  for (std::size_t i = 0; i < units_.size() && state == OutcomeKind::kContinue; i += 1) {
    TransformUnit& unit = *units_[i];

    Outcome outcome;
    try {
      outcome = unit.apply(record);
    } catch (const std::exception& e) {
      outcome = Outcome::fail(std::string("unhandled exception: ") + e.what());
    }

    state = outcome.kind;
    if (state != OutcomeKind::kContinue) {
      result.unit = unit.name();
      result.error = std::move(outcome.error);
    }
  }

  switch (state) {
    case OutcomeKind::kContinue:
      result.status = ChainStatus::kForwarded;
      break;
    case OutcomeKind::kDrop:
      result.status = ChainStatus::kDropped;
      logDebug("chain") << "event #" << record.sequence() << " dropped by " << result.unit;
      break;
    case OutcomeKind::kFail:
      result.status = ChainStatus::kFailed;
      break;
  }
  return result;
}

std::vector<std::string> ProcessorChain::unitNames() const {
  std::vector<std::string> names;
  names.reserve(units_.size());
  for (const auto& unit : units_) {
    names.push_back(unit->name());
  }
  return names;
}

} // namespace telemetry
