// pks/project/walk_directory.cpp - Project tree enumeration
#include "pks/project/walk_directory.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "pks/project/glob.hpp"

namespace pks
{

std::string relative_to_root(const std::filesystem::path & path, const std::filesystem::path & root)
{
  const std::string rel = path.lexically_relative(root).generic_string();
  return rel.empty() ? "." : rel;
}

namespace
{

std::optional<std::filesystem::path> nearest_package_yml(
  const std::filesystem::path & file, const std::set<std::filesystem::path> & pack_dirs,
  const std::filesystem::path & root)
{
  for (std::filesystem::path dir = file.parent_path();; dir = dir.parent_path()) {
    if (pack_dirs.count(dir) > 0) return dir / k_package_file_name;
    if (dir == root || dir == dir.parent_path()) return std::nullopt;
  }
}

}  // namespace

WalkResult walk_directory(const Configuration & config)
{
  namespace fs = std::filesystem;

  ProjectLayout layout;
  std::set<fs::path> pack_dirs;

  try {
    const fs::path root_yml = config.root / k_package_file_name;
    if (fs::is_regular_file(root_yml)) {
      layout.package_ymls.push_back(root_yml);
      pack_dirs.insert(config.root);
    }

    fs::recursive_directory_iterator it(
      config.root, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
      const fs::directory_entry & entry = *it;

      if (entry.is_directory()) {
        if (
          entry.path().filename() == ".git" ||
          glob_covers_directory_any(config.exclude, relative_to_root(entry.path(), config.root))) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!entry.is_regular_file()) continue;

      const std::string rel = relative_to_root(entry.path(), config.root);
      if (glob_match_any(config.exclude, rel)) continue;

      if (entry.path().filename() == k_package_file_name) {
        const fs::path dir = entry.path().parent_path();
        if (dir == config.root) continue;
        if (glob_match_any(config.package_paths, relative_to_root(dir, config.root))) {
          layout.package_ymls.push_back(entry.path());
          pack_dirs.insert(dir);
        }
        continue;
      }

      if (glob_match_any(config.include, rel)) {
        layout.included_files.push_back(entry.path());
      }
    }
  } catch (const fs::filesystem_error & e) {
    return WalkResult::fail(std::string("failed to enumerate project files: ") + e.what());
  }

  std::sort(layout.included_files.begin(), layout.included_files.end());
  std::sort(layout.package_ymls.begin(), layout.package_ymls.end());

  for (const auto & file : layout.included_files) {
    if (auto yml = nearest_package_yml(file, pack_dirs, config.root)) {
      layout.owning_package_yml_for_file.emplace(file, std::move(*yml));
    }
  }

  return WalkResult::ok(std::move(layout));
}

bool add_included_file(
  ProjectLayout & layout, const Configuration & config, const std::filesystem::path & file)
{
  namespace fs = std::filesystem;

  const std::string rel = relative_to_root(file, config.root);
  if (rel == "." || rel == ".." || rel.rfind("../", 0) == 0) return false;
  if (glob_match_any(config.exclude, rel) || !glob_match_any(config.include, rel)) return false;

  const auto pos =
    std::lower_bound(layout.included_files.begin(), layout.included_files.end(), file);
  if (pos != layout.included_files.end() && *pos == file) return true;
  layout.included_files.insert(pos, file);

  std::set<fs::path> pack_dirs;
  for (const auto & yml : layout.package_ymls) {
    pack_dirs.insert(yml.parent_path());
  }
  if (auto yml = nearest_package_yml(file, pack_dirs, config.root)) {
    layout.owning_package_yml_for_file.emplace(file, std::move(*yml));
  }
  return true;
}

}  // namespace pks
