#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/codec/base62.hpp"

namespace shortener::config {

namespace {

using shortener::runtime::config::RuntimeConfig;

/*
  Replaces ${NAME} with the value of environment variable NAME, so secrets
  such as database credentials can stay out of the file. An unset variable
  is a configuration error.
*/
std::string ExpandEnvironment(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());

  std::size_t pos = 0;
  while (pos < raw.size()) {
    const auto open = raw.find("${", pos);
    if (open == std::string::npos) {
      out.append(raw, pos, std::string::npos);
      break;
    }
    const auto close = raw.find('}', open + 2);
    if (close == std::string::npos) {
      throw std::runtime_error("Unterminated ${ in config value: " + raw);
    }

    out.append(raw, pos, open - pos);
    const auto  name  = raw.substr(open + 2, close - open - 2);
    const char* value = std::getenv(name.c_str());
    if (!value) {
      throw std::runtime_error("Config references unset environment variable " + name);
    }
    out.append(value);
    pos = close + 1;
  }
  return out;
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const auto scalar = ExpandEnvironment(node.Scalar());

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() != "!") {
    if (scalar == "true" || scalar == "false") {
      value->set_bool_value(scalar == "true");
      return;
    }

    char*        endptr  = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &endptr);
    if (!scalar.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

} // namespace

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

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& shortener = config.shortener();

  // 0 selects the default starting value
  const auto initial_counter = shortener.initial_counter();
  Require(initial_counter == 0 || codec::HasShortCodeLength(initial_counter),
          "shortener.initial_counter must be within [" + std::to_string(codec::kMinSixSymbolValue) + ", " +
              std::to_string(codec::kMaxSixSymbolValue) + "]");

  Require(!shortener.has_link_cache_ttl() || (shortener.link_cache_ttl().seconds() >= 0 && shortener.link_cache_ttl().nanos() >= 0),
          "shortener.link_cache_ttl must not be negative");

  const auto& database = config.database();
  Require(!database.has_sqlite() || !database.sqlite().path().empty(), "database.sqlite.path is required");
  Require(!database.has_postgres() || !database.postgres().connection_uri().empty(), "database.postgres.connection_uri is required");
  Require(!config.cache().has_sqlite() || !config.cache().sqlite().path().empty(), "cache.sqlite.path is required");
}

} // namespace shortener::config
