#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace scavenger::runtime::config {
class RuntimeConfig;
}

namespace scavenger::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "scavenger" stderr logger as spdlog's default. Level and
// pattern come from SCAVENGER_LOG_LEVEL / SCAVENGER_LOG_PATTERN, then the
// logging section of the config. Throws util::InvalidInput on an unknown level.
void InitializeLogging(const scavenger::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Writes "<message> key=value ..." through the default spdlog logger.
// Values containing spaces, quotes or '=' are quoted.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

} // namespace scavenger::observability

#define SCAVENGER_LOG_DEBUG(message, ...) ::scavenger::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define SCAVENGER_LOG_INFO(message, ...) ::scavenger::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define SCAVENGER_LOG_WARN(message, ...) ::scavenger::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define SCAVENGER_LOG_ERROR(message, ...) ::scavenger::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
