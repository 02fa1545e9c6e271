#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/epoch_record.hpp"
#include "model/signal_snapshot.hpp"

struct redisContext;

namespace neuro_guard::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"neuro:session"};
  std::uint32_t connect_timeout_ms{1000};
  std::vector<model::channel> axes{};
};

// RedisTimeSeries mirror of risk, tier, axis severities and assets. Advisory output only.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::epoch_record& record);

  [[nodiscard]] const std::vector<std::string>& series() const noexcept { return series_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::epoch_record& record);

  RedisTsOptions options_;
  std::vector<std::string> series_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace neuro_guard::sinks
