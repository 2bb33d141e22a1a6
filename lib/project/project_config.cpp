// iapi/project/project_config.cpp - Project configuration implementation
//
#include "iapi/project/project_config.hpp"

#include <utility>

#include <yaml-cpp/yaml.h>

namespace iapi
{

namespace
{

/// Parse the 'validator' section
std::optional<std::string> parse_validator(const YAML::Node & node, ValidatorConfig & out)
{
  if (!node.IsMap()) {
    return std::string("validator must be a map");
  }

  if (node["documents"]) {
    if (!node["documents"].IsSequence()) {
      return std::string("validator.documents must be a list");
    }
    for (const auto & doc : node["documents"]) {
      if (!doc.IsScalar()) {
        return std::string("validator.documents entries must be paths");
      }
      out.documents.emplace_back(doc.as<std::string>());
    }
  }

  if (node["warnings_as_errors"]) {
    try {
      out.warnings_as_errors = node["warnings_as_errors"].as<bool>();
    } catch (const YAML::Exception &) {
      return std::string("validator.warnings_as_errors must be a boolean");
    }
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'validator' section
    if (root["validator"]) {
      if (auto error = parse_validator(root["validator"], config.validator)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace iapi
