#ifndef TELEMETRY_PIPELINE_NDJSON_SINK_HPP
#define TELEMETRY_PIPELINE_NDJSON_SINK_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../sink.hpp"

namespace telemetry {

// Writes one line per record: {"event":<body>,"metadata":{...}}.
class NdjsonSink : public EventSink {
  struct OwnedFile {};

 public:
  explicit NdjsonSink(std::ostream& output);
  // Reachable only through open().
  NdjsonSink(OwnedFile, std::unique_ptr<std::ofstream> file);

  // "-" selects stdout. Returns nullptr and fills `error` if the file cannot be opened.
  static std::unique_ptr<NdjsonSink> open(const std::string& path, std::string& error);

  bool deliver(EventRecord record, std::string& error) override;
  void flush() override;

 private:
  std::unique_ptr<std::ofstream> file_;
  std::ostream* output_;
  std::mutex mutex_;
};

std::string formatNdjsonLine(const EventRecord& record);

} // namespace telemetry

#endif
