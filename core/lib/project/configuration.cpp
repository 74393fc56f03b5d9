// pks/project/configuration.cpp - Project configuration implementation
//
#include "pks/project/configuration.hpp"

#include <yaml-cpp/yaml.h>

namespace pks
{

namespace
{

/// Read an optional list-of-strings key; leaves `out` untouched when absent
bool read_string_list(
  const YAML::Node & root, const char * key, std::vector<std::string> & out, std::string & error)
{
  const YAML::Node node = root[key];
  if (!node || node.IsNull()) return true;

  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }

  out.clear();
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

}  // namespace

ConfigLoadResult load_configuration(const std::filesystem::path & project_root)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(project_root, ec)) {
    return ConfigLoadResult::fail("project root is not a directory: " + project_root.string());
  }

  Configuration config;
  config.root = fs::weakly_canonical(fs::absolute(project_root), ec);
  if (ec) {
    config.root = fs::absolute(project_root).lexically_normal();
  }

  const fs::path config_path = config.root / k_configuration_file_name;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::ok(std::move(config));
  }
  config.config_file = config_path;

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      std::string(k_configuration_file_name) + ": failed to parse YAML: " + e.what());
  }

  // An empty file is valid
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail(
      std::string(k_configuration_file_name) + ": top level must be a map");
  }

  try {
    std::string error;
    if (
      !read_string_list(root, "include", config.include, error) ||
      !read_string_list(root, "exclude", config.exclude, error) ||
      !read_string_list(root, "package_paths", config.package_paths, error)) {
      return ConfigLoadResult::fail(std::string(k_configuration_file_name) + ": " + error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(std::string(k_configuration_file_name) + ": " + e.what());
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace pks
