#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace scavenger::config {

namespace {

using scavenger::runtime::config::RuntimeConfig;

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  if (mark.is_null()) return "config";
  return "config line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1);
}

bool IsPlainNumber(const std::string& text, double* number) {
  if (text.empty()) return false;
  char* end = nullptr;
  *number   = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0' && std::isfinite(*number);
}

void ConvertNode(const YAML::Node& node, google::protobuf::Value* out);

void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const auto& text = node.Scalar();

  // "!" is the non-specific tag yaml-cpp gives quoted scalars; they are
  // always strings, so ids like "1234" or "true" survive unchanged.
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  double number = 0;
  if (IsPlainNumber(text, &number)) {
    out->set_number_value(number);
    return;
  }
  out->set_string_value(text);
}

void ConvertNode(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) {
        ConvertNode(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw scavenger::util::InvalidInput(Where(entry.first) + ": mapping keys must be plain names");
        }
        ConvertNode(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw scavenger::util::InvalidInput(Where(node) + ": unsupported YAML node");
}

RuntimeConfig ToRuntimeConfig(const YAML::Node& root) {
  google::protobuf::Value tree;
  if (root.IsDefined() && !root.IsNull()) {
    ConvertNode(root, &tree);
  } else {
    tree.mutable_struct_value();
  }

  std::string json;
  const auto  printed = google::protobuf::util::MessageToJsonString(tree, &json);
  if (!printed.ok()) {
    throw std::runtime_error("config: cannot render as JSON: " + std::string(printed.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  const auto    parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("config: " + std::string(parsed.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("config: file not found: " + path);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: " + path + ": " + e.what());
  }
  return ToRuntimeConfig(root);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  return ToRuntimeConfig(root);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& settlement = config.settlement();
  if (static_cast<uint64_t>(settlement.collector_percent()) + settlement.owner_percent() > 100) {
    throw scavenger::util::InvalidInput("settlement.collector_percent + settlement.owner_percent must not exceed 100");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw scavenger::util::InvalidInput("database.sqlite.path is required");
  }

  std::unordered_set<std::string> seen;
  for (const auto& participant : config.participants()) {
    if (participant.id().empty()) {
      throw scavenger::util::InvalidInput("participants[].id is required");
    }
    if (participant.role() != "recycler" && participant.role() != "collector" && participant.role() != "manufacturer") {
      throw scavenger::util::InvalidInput("participant '" + participant.id() + "' has unknown role '" + participant.role() + "'");
    }
    if (!seen.insert(participant.id()).second) {
      throw scavenger::util::InvalidInput("participant '" + participant.id() + "' is listed twice");
    }
  }
}

} // namespace scavenger::config
