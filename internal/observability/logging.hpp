#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace pgshadow::runtime::config {
class RuntimeConfig;
}

namespace pgshadow::model {
struct TableName;
}

namespace pgshadow::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// value is schema.name, unquoted
LogField TableField(std::string_view key, const model::TableName& table);
LogField ErrorField(const std::exception& error);

void InitializeLogging(const pgshadow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace pgshadow::observability

#define PGSHADOW_LOG_DEBUG(message, ...) ::pgshadow::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define PGSHADOW_LOG_INFO(message, ...) ::pgshadow::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define PGSHADOW_LOG_WARN(message, ...) ::pgshadow::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define PGSHADOW_LOG_ERROR(message, ...) ::pgshadow::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
