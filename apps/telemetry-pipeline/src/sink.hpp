#ifndef TELEMETRY_PIPELINE_SINK_HPP
#define TELEMETRY_PIPELINE_SINK_HPP

#include <string>

#include "event.hpp"

namespace telemetry {

// Downstream collaborator. Takes ownership of a finished record; routing between
// destinations is the sink's business. Must be safe to call from several workers.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual bool deliver(EventRecord record, std::string& error) = 0;
  virtual void flush() {}
};

} // namespace telemetry

#endif
