// pks/project/walk_directory.hpp - Project tree enumeration
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "pks/project/configuration.hpp"

namespace pks
{

/// package.yml file name marking a pack directory
inline constexpr const char * k_package_file_name = "package.yml";

/**
 * Files discovered under the project root. All paths are absolute.
 */
struct ProjectLayout
{
  /// Ruby files selected by include/exclude, sorted
  std::vector<std::filesystem::path> included_files;

  /// package.yml files of the packs selected by package_paths, sorted
  std::vector<std::filesystem::path> package_ymls;

  /// Included file -> package.yml of its nearest enclosing pack
  std::map<std::filesystem::path, std::filesystem::path> owning_package_yml_for_file;
};

struct WalkResult
{
  ProjectLayout layout;
  bool success = false;
  std::string error;

  static WalkResult ok(ProjectLayout l)
  {
    WalkResult r;
    r.layout = std::move(l);
    r.success = true;
    return r;
  }

  static WalkResult fail(std::string msg)
  {
    WalkResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Recursively enumerate `config.root`.
 *
 * `.git` and directories covered by an exclude pattern are never entered.
 * Paths are matched against the globs relative to the root with '/'
 * separators. Symlinked directories are not followed.
 */
[[nodiscard]] WalkResult walk_directory(const Configuration & config);

/**
 * Add `file` (absolute, possibly not on disk yet) to an enumerated layout and
 * record its owning package.yml.
 *
 * @return false if the file is outside the root or not selected by include/exclude
 */
[[nodiscard]] bool add_included_file(
  ProjectLayout & layout, const Configuration & config, const std::filesystem::path & file);

/// Root-relative '/'-separated form of `path` ("." for the root itself)
[[nodiscard]] std::string relative_to_root(
  const std::filesystem::path & path, const std::filesystem::path & root);

}  // namespace pks
