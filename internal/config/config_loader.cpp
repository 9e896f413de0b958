#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace warden::config {

using warden::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultConfigPath = "config.yaml";
constexpr const char* kDefaultSqlitePath = "./data/warden.sqlite";
constexpr const char* kDefaultLogFile    = "./log/warden.log";

constexpr std::array<const char*, 7> kLogLevels  = {"trace", "debug", "info", "warn", "error", "critical", "off"};
constexpr std::array<const char*, 3> kLogOutputs = {"stdout", "file", "both"};
constexpr std::array<const char*, 4> kSyncModes  = {"OFF", "NORMAL", "FULL", "EXTRA"};

template <std::size_t N>
bool OneOf(const std::string& value, const std::array<const char*, N>& allowed) {
  return std::any_of(allowed.begin(), allowed.end(), [&](const char* a) { return value == a; });
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("1.0" stays a version string)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

std::string ConfigLoader::ResolvePath(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  if (const char* env_path = std::getenv("WARDEN_CONFIG_PATH")) {
    if (std::filesystem::exists(env_path)) {
      return env_path;
    }
  }
  return kDefaultConfigPath;
}

RuntimeConfig ConfigLoader::Load(const std::string& explicit_path) {
  const auto path = ResolvePath(explicit_path);

  RuntimeConfig config;
  if (std::filesystem::exists(path)) {
    config = LoadFromYaml(path);
  } else if (!explicit_path.empty()) {
    throw std::runtime_error("Config file not found: " + path);
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* database = config->mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    database->mutable_sqlite()->set_path(kDefaultSqlitePath);
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) sqlite->set_path(kDefaultSqlitePath);
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
    if (sqlite->synchronous().empty()) {
      sqlite->set_synchronous("FULL");
    } else {
      sqlite->set_synchronous(Upper(sqlite->synchronous()));
    }
  }

  auto* logging = config->mutable_logging();
  logging->set_level(logging->level().empty() ? "info" : Lower(logging->level()));
  logging->set_output(logging->output().empty() ? "stdout" : Lower(logging->output()));
  if (logging->file().empty()) logging->set_file(kDefaultLogFile);
  if (!logging->has_rotation()) {
    logging->mutable_rotation()->set_max_size_mb(100);
    logging->mutable_rotation()->set_max_files(7);
  }

  auto* recovery = config->mutable_recovery();
  if (!recovery->has_run_on_startup()) recovery->set_run_on_startup(true);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is empty");
    }
    if (!OneOf(database.sqlite().synchronous(), kSyncModes)) {
      throw std::invalid_argument("invalid database.sqlite.synchronous: " + database.sqlite().synchronous());
    }
  }

  const auto& logging = config.logging();
  if (!OneOf(logging.level(), kLogLevels)) {
    throw std::invalid_argument("invalid logging.level: " + logging.level());
  }
  if (!OneOf(logging.output(), kLogOutputs)) {
    throw std::invalid_argument("invalid logging.output: " + logging.output());
  }
  if (logging.output() != "stdout") {
    if (logging.file().empty()) {
      throw std::invalid_argument("logging.file required when output=file/both");
    }
    if (logging.rotation().max_size_mb() == 0) {
      throw std::invalid_argument("logging.rotation.max_size_mb must be > 0");
    }
    if (logging.rotation().max_files() == 0) {
      throw std::invalid_argument("logging.rotation.max_files must be > 0");
    }
  }
}

} // namespace warden::config
