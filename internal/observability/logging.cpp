#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace scavenger::observability {
namespace {

constexpr const char* kLoggerName     = "scavenger";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment beats config file beats built-in default.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && name != "off") {
    throw scavenger::util::InvalidInput("unknown log level '" + name + "'");
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (const char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\n' || c == '\t') return true;
  }
  return false;
}

// Free text (notes, descriptions) is quoted so key=value stays parseable.
void AppendValue(fmt::memory_buffer& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    fmt::format_to(std::back_inserter(out), "{}", value);
    return;
  }
  out.push_back('"');
  for (const char c : value) {
    switch (c) {
      case '"':
        fmt::format_to(std::back_inserter(out), "\\\"");
        break;
      case '\\':
        fmt::format_to(std::back_inserter(out), "\\\\");
        break;
      case '\n':
        fmt::format_to(std::back_inserter(out), "\\n");
        break;
      case '\t':
        fmt::format_to(std::back_inserter(out), "\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

template <typename Fields>
void Emit(spdlog::level::level_enum level, std::string_view message, const Fields& fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) return;

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(line), " {}=", field.key);
    AppendValue(line, field.value);
  }
  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const scavenger::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Resolve("SCAVENGER_LOG_LEVEL", config.logging().level(), kDefaultLevel));
  const auto pattern = Resolve("SCAVENGER_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  // stdout is reserved for CLI results
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Emit(level, message, fields);
}

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields) {
  Emit(level, message, fields);
}

} // namespace scavenger::observability
