#include "ndjson_sink.hpp"

#include <iostream>
#include <utility>

namespace telemetry {

NdjsonSink::NdjsonSink(std::ostream& output) : output_(&output) {}

NdjsonSink::NdjsonSink(OwnedFile, std::unique_ptr<std::ofstream> file) : file_(std::move(file)), output_(file_.get()) {}

std::unique_ptr<NdjsonSink> NdjsonSink::open(const std::string& path, std::string& error) {
  if (path == "-") {
    return std::make_unique<NdjsonSink>(std::cout);
  }

  auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
  if (!file->is_open()) {
    error = "Failed to open output file: " + path;
    return nullptr;
  }
  return std::make_unique<NdjsonSink>(OwnedFile{}, std::move(file));
}

std::string formatNdjsonLine(const EventRecord& record) {
  Object metadata;
  for (const auto& [key, value] : record.metadata()) {
    (*metadata.mutable_fields())[key].set_string_value(value);
  }
  return "{\"event\":" + record.bodyJson() + ",\"metadata\":" + toJson(metadata) + "}";
}

bool NdjsonSink::deliver(EventRecord record, std::string& error) {
  const std::string line = formatNdjsonLine(record);

  std::lock_guard<std::mutex> lock(mutex_);
  *output_ << line << "\n";
  if (!*output_) {
    error = "write failed";
    return false;
  }
  return true;
}

void NdjsonSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  output_->flush();
}

} // namespace telemetry
