#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace snapmig::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static bool IsIntegerScalar(const std::string& s) {
  std::size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // Integers travel as decimal strings: the JSON parser accepts them for
  // every integer field, and a double would cap them at 2^53.
  if (IsIntegerScalar(scalar_value)) {
    value->set_string_value(scalar_value);
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
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(snapmig::runtime::config::RuntimeConfig& config) {
  auto* migration = config.mutable_migration();
  if (migration->parallelism() == 0) migration->set_parallelism(1);
  if (migration->enumerate_limit() == 0) migration->set_enumerate_limit(std::numeric_limits<uint64_t>::max());
  if (migration->page_size() == 0) migration->set_page_size(1000);
  if (migration->cursor_name().empty()) migration->set_cursor_name("default");
  if (migration->progress_log_interval() == 0) migration->set_progress_log_interval(1000);
  if (migration->queue_capacity() == 0) migration->set_queue_capacity(64);

  auto* codec = config.mutable_codec();
  if (codec->legacy_default_serializer_id() == 0) codec->set_legacy_default_serializer_id(8);
  if (codec->json_serializer_id() == 0) codec->set_json_serializer_id(40);

  auto* source = config.mutable_source_schema();
  if (source->journal_table().empty()) source->set_journal_table("journal");
  if (source->legacy_snapshot_table().empty()) source->set_legacy_snapshot_table("legacy_snapshot");

  auto* target = config.mutable_target_schema();
  if (target->snapshot_table().empty()) target->set_snapshot_table("snapshot");
  if (target->cursor_table().empty()) target->set_cursor_table("snapshot_migration_cursor");

  for (auto* db : {config.mutable_source(), config.mutable_target()}) {
    if (db->has_sqlite() && db->sqlite().busy_timeout_ms() == 0) {
      db->mutable_sqlite()->set_busy_timeout_ms(5000);
    }
    if (db->has_postgres() && db->postgres().pool_size() == 0) {
      db->mutable_postgres()->set_pool_size(4);
    }
  }
}

void ConfigLoader::Validate(const snapmig::runtime::config::RuntimeConfig& config) {
  // latest mode streams ids on one source connection and looks up
  // snapshots on a second
  const auto& source = config.source();
  if (source.has_postgres() && source.postgres().pool_size() == 1) {
    throw std::runtime_error("Invalid configuration: source.postgres.pool_size must be at least 2");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

snapmig::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  snapmig::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace snapmig::config
