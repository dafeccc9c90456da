#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace faucet::runtime::config {
class RuntimeConfig;
}

namespace faucet::observability {

/*
  One key=value pair appended to a log line. Values containing spaces, quotes
  or '=' are quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField U64Field(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// "error" field.
LogField ErrorField(std::string_view message);
LogField ErrorField(const std::exception& e);

// Level and pattern come from config, overridden by FAUCET_LOG_LEVEL and FAUCET_LOG_PATTERN.
void InitializeLogging(const faucet::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace faucet::observability

#define FAUCET_LOG_DEBUG(message, ...) ::faucet::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define FAUCET_LOG_INFO(message, ...) ::faucet::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define FAUCET_LOG_WARN(message, ...) ::faucet::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define FAUCET_LOG_ERROR(message, ...) ::faucet::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
