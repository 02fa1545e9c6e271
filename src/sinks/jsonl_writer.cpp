#include "sinks/jsonl_writer.hpp"

#include <stdexcept>
#include <utility>

namespace neuro_guard::sinks {

JsonlWriter::JsonlWriter(std::string path) : path_(std::move(path)) {
  stream_.open(path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    throw std::runtime_error("unable to open output stream: " + path_);
  }
}

bool JsonlWriter::write(const nlohmann::json& record) {
  stream_ << record.dump() << '\n';
  stream_.flush();
  if (!stream_) {
    stream_.clear();
    return false;
  }
  return true;
}

}  // namespace neuro_guard::sinks
