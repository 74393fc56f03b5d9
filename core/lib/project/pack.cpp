// pks/project/pack.cpp - Packs (package.yml + package_todo.yml)
#include "pks/project/pack.hpp"

#include <yaml-cpp/yaml.h>

#include "pks/project/walk_directory.hpp"

namespace pks
{

namespace
{

/// `true`, `false` or the string "strict"
bool parse_enforcement(const YAML::Node & node)
{
  if (!node || node.IsNull()) return false;
  const std::string value = node.as<std::string>();
  return value == "true" || value == "strict";
}

std::string parse_todo(const std::filesystem::path & todo_path, Pack & pack)
{
  YAML::Node root = YAML::LoadFile(todo_path.string());
  if (!root || root.IsNull()) return {};
  if (!root.IsMap()) return "top level must be a map";

  for (const auto & by_pack : root) {
    const std::string defining_pack = by_pack.first.as<std::string>();
    if (!by_pack.second.IsMap()) return "entries of `" + defining_pack + "` must be a map";

    for (const auto & by_constant : by_pack.second) {
      const std::string constant = by_constant.first.as<std::string>();
      const YAML::Node & entry = by_constant.second;
      if (!entry.IsMap()) return "entry for `" + constant + "` must be a map";

      const YAML::Node violations = entry["violations"];
      const YAML::Node files = entry["files"];
      if (!violations.IsSequence() || !files.IsSequence()) {
        return "entry for `" + constant + "` needs `violations` and `files` lists";
      }

      for (const auto & type : violations) {
        for (const auto & file : files) {
          pack.recorded_violations.insert(ViolationIdentifier{
            type.as<std::string>(), file.as<std::string>(), constant, pack.name, defining_pack});
        }
      }
    }
  }
  return {};
}

}  // namespace

PackLoadResult load_pack(
  const std::filesystem::path & package_yml, const std::filesystem::path & project_root)
{
  namespace fs = std::filesystem;

  Pack pack;
  pack.yml = package_yml;
  pack.name = relative_to_root(package_yml.parent_path(), project_root);

  const std::string display = relative_to_root(package_yml, project_root);

  try {
    const YAML::Node root = YAML::LoadFile(package_yml.string());
    if (root && !root.IsNull()) {
      if (!root.IsMap()) return PackLoadResult::fail(display + ": top level must be a map");

      pack.enforce_dependencies = parse_enforcement(root["enforce_dependencies"]);
      pack.enforce_privacy = parse_enforcement(root["enforce_privacy"]);

      const YAML::Node deps = root["dependencies"];
      if (deps && !deps.IsNull()) {
        if (!deps.IsSequence()) return PackLoadResult::fail(display + ": dependencies must be a list");
        for (const auto & dep : deps) {
          pack.dependencies.insert(dep.as<std::string>());
        }
      }

      const YAML::Node public_path = root["public_path"];
      if (public_path && !public_path.IsNull()) {
        pack.public_path = public_path.as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return PackLoadResult::fail(display + ": failed to parse YAML: " + e.what());
  }

  // Normalize "app/public/" and "app/public"
  while (!pack.public_path.empty() && pack.public_path.back() == '/') {
    pack.public_path.pop_back();
  }

  const fs::path todo = package_yml.parent_path() / k_package_todo_file_name;
  std::error_code ec;
  if (fs::is_regular_file(todo, ec)) {
    const std::string todo_display = relative_to_root(todo, project_root);
    try {
      const std::string error = parse_todo(todo, pack);
      if (!error.empty()) return PackLoadResult::fail(todo_display + ": " + error);
    } catch (const YAML::Exception & e) {
      return PackLoadResult::fail(todo_display + ": failed to parse YAML: " + e.what());
    }
  }

  return PackLoadResult::ok(std::move(pack));
}

}  // namespace pks
