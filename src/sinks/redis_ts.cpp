#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace neuro_guard::sinks {
namespace {

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const std::string& suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

std::string axis_series(const model::channel axis) {
  return std::string("axis:") + model::channel_name(axis);
}

std::string asset_series(const model::asset a) {
  return std::string("asset:") + model::asset_name(a);
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  series_ = {"risk:roh", "risk:tier"};
  for (const auto axis : options_.axes) {
    series_.push_back(axis_series(axis));
  }
  for (const auto a : model::kAllAssets) {
    series_.push_back(asset_series(a));
  }

  const std::size_t max_args = 1 + (series_.size() * 3);
  command_args_.reserve(max_args);
  command_argv_.reserve(max_args);
  command_argv_len_.reserve(max_args);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }
  if (!ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : series_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::epoch_record& record) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(record)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(record);
}

bool RedisTsSink::publish_impl(const model::epoch_record& record) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto timestamp_ms = record.timestamp_ms;
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "risk:roh", sanitize_value(record.risk));
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "risk:tier",
                  static_cast<double>(model::tier_index(record.tier)));

  for (const auto axis : options_.axes) {
    const auto index = model::channel_index(axis);
    if (!record.monitored[index]) {
      continue;
    }
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, axis_series(axis),
                    static_cast<double>(static_cast<std::uint8_t>(record.severities[index])));
  }
  for (const auto a : model::kAllAssets) {
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, asset_series(a),
                    sanitize_value(static_cast<double>(record.assets.get(a))));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] TS.MADD rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace neuro_guard::sinks
