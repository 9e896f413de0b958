#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace warden::observability {
namespace {

constexpr std::size_t kBytesPerMb = 1024 * 1024;

std::string ResolveLevel(const warden::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("WARDEN_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const warden::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("WARDEN_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::vector<spdlog::sink_ptr> BuildSinks(const warden::runtime::config::LoggingConfig& logging) {
  const std::string output = logging.output().empty() ? "stdout" : logging.output();

  std::vector<spdlog::sink_ptr> sinks;
  if (output == "stdout" || output == "both") {
    // stderr keeps command output on stdout clean
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (output == "file" || output == "both") {
    const auto max_size  = static_cast<std::size_t>(logging.rotation().max_size_mb()) * kBytesPerMb;
    const auto max_files = static_cast<std::size_t>(logging.rotation().max_files());
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file(), max_size, max_files));
  }
  return sinks;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const warden::runtime::config::RuntimeConfig& config) {
  auto sinks  = BuildSinks(config.logging());
  auto logger = std::make_shared<spdlog::logger>("warden", sinks.begin(), sinks.end());
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

} // namespace warden::observability
