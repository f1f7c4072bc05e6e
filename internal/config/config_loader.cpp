#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/migration/tag_rebuilder.hpp"
#include "internal/observability/progress.hpp"

namespace relaystore::config {

using relaystore::runtime::config::RuntimeConfig;

namespace {

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

// Plain scalars are typed by their text; quoted ones ("5432") stay strings.
void ToScalar(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*  end    = nullptr;
    double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ToScalar(node, value);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      return;
    }
    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node");
  }
}

void ApplyDefaults(RuntimeConfig& config) {
  auto* migrations = config.mutable_migrations();
  if (migrations->backfill_batch_size() == 0) {
    migrations->set_backfill_batch_size(static_cast<uint32_t>(migration::TagRebuilder::kDefaultBatchSize));
  }
  if (migrations->progress_interval() == 0) {
    migrations->set_progress_interval(static_cast<uint32_t>(observability::LogProgress::kDefaultInterval));
  }
}

void Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  switch (database.backend_case()) {
    case relaystore::runtime::config::DatabaseConfig::kSqlite:
      if (database.sqlite().path().empty()) {
        throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
      }
      if (database.sqlite().path() == ":memory:") {
        throw std::runtime_error("Invalid configuration: database.sqlite.path must name a file");
      }
      return;
    case relaystore::runtime::config::DatabaseConfig::kPostgres:
      if (database.postgres().connection_uri().empty()) {
        throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
      }
      // the backfill holds a reader and a writer at the same time
      if (database.postgres().max_connections() == 1) {
        throw std::runtime_error("Invalid configuration: database.postgres.max_connections must be at least 2");
      }
      return;
    default:
      throw std::runtime_error("Invalid configuration: a database backend (sqlite or postgres) is required");
  }
}

RuntimeConfig FromYaml(const YAML::Node& yaml) {
  google::protobuf::Value root;
  ToValue(yaml, &root);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  ApplyDefaults(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYaml(yaml);
}

} // namespace relaystore::config
