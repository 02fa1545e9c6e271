#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace neuro_guard::sinks {

// Append-only, one JSON object per line, flushed per record.
class JsonlWriter {
 public:
  explicit JsonlWriter(std::string path);

  bool write(const nlohmann::json& record);

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
  std::ofstream stream_;
};

}  // namespace neuro_guard::sinks
