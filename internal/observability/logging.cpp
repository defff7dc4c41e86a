#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace registry::observability {
namespace {

constexpr const char* kLoggerName = "address-registry";

std::string ResolveLevel(const registry::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("REGISTRY_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const registry::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("REGISTRY_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

constexpr char kHexDigits[] = "0123456789abcdef";

// Anything a reader could mistake for a separator or a line break.
bool NeedsQuoting(std::string_view value) {
  for (unsigned char c : value) {
    if (c <= ' ' || c == 0x7f || c == '"' || c == '\\' || c == '=') {
      return true;
    }
  }
  return false;
}

void AppendQuoted(std::ostringstream& out, std::string_view value) {
  out << '"';
  for (unsigned char c : value) {
    switch (c) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < ' ' || c == 0x7f) {
          out << "\\x" << kHexDigits[c >> 4] << kHexDigits[c & 0xf];
        } else {
          out << static_cast<char>(c);
        }
    }
  }
  out << '"';
}

} // namespace

// Caller-supplied values are quoted and escaped, so one call is always
// exactly one log line.
std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (NeedsQuoting(field.value)) {
      AppendQuoted(out, field.value);
    } else {
      out << field.value;
    }
  }
  return out.str();
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const registry::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace registry::observability
