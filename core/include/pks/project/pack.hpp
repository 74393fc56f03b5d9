// pks/project/pack.hpp - Packs (package.yml + package_todo.yml)
#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>

namespace pks
{

/// Name of the pack at the project root
inline constexpr const char * k_root_pack_name = ".";

/// Recorded-violations file kept beside package.yml
inline constexpr const char * k_package_todo_file_name = "package_todo.yml";

// ============================================================================
// Violation identity
// ============================================================================

/**
 * Identity of a violation, as recorded in package_todo.yml.
 */
struct ViolationIdentifier
{
  std::string violation_type;         ///< "dependency" | "privacy"
  std::string file;                   ///< root-relative path of the referencing file
  std::string constant_name;          ///< fully-qualified, "::"-prefixed
  std::string referencing_pack_name;
  std::string defining_pack_name;

  [[nodiscard]] bool operator==(const ViolationIdentifier & other) const
  {
    return violation_type == other.violation_type && file == other.file &&
           constant_name == other.constant_name &&
           referencing_pack_name == other.referencing_pack_name &&
           defining_pack_name == other.defining_pack_name;
  }
};

struct ViolationIdentifierHash
{
  size_t operator()(const ViolationIdentifier & v) const noexcept
  {
    size_t seed = 0;
    for (const std::string * part :
         {&v.violation_type, &v.file, &v.constant_name, &v.referencing_pack_name,
          &v.defining_pack_name}) {
      seed ^= std::hash<std::string>{}(*part) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

using ViolationSet = std::unordered_set<ViolationIdentifier, ViolationIdentifierHash>;

// ============================================================================
// Pack
// ============================================================================

/**
 * A directory-scoped unit of ownership declared by a package.yml.
 */
struct Pack
{
  /// Root-relative directory ("." for the root pack)
  std::string name;

  /// Absolute path of package.yml
  std::filesystem::path yml;

  bool enforce_dependencies = false;
  bool enforce_privacy = false;

  /// Names of the packs this pack may reference
  std::set<std::string> dependencies;

  /// Directory (relative to the pack) holding the public API
  std::string public_path = "app/public";

  /// Violations listed in package_todo.yml
  ViolationSet recorded_violations;

  [[nodiscard]] std::filesystem::path directory() const { return yml.parent_path(); }

  [[nodiscard]] bool is_root() const noexcept { return name == k_root_pack_name; }

  [[nodiscard]] bool depends_on(std::string_view pack_name) const
  {
    return dependencies.count(std::string(pack_name)) > 0;
  }

  /// package.yml path as shown to users ("package.yml" for the root pack)
  [[nodiscard]] std::string yml_display_path() const
  {
    return is_root() ? std::string("package.yml") : name + "/package.yml";
  }
};

// ============================================================================
// Loading
// ============================================================================

struct PackLoadResult
{
  Pack pack;
  bool success = false;
  std::string error;

  static PackLoadResult ok(Pack p)
  {
    PackLoadResult r;
    r.pack = std::move(p);
    r.success = true;
    return r;
  }

  static PackLoadResult fail(std::string msg)
  {
    PackLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Load a pack from its package.yml and, when present, the package_todo.yml
 * beside it.
 *
 * @param package_yml Absolute path of package.yml
 * @param project_root Absolute project root (determines the pack name)
 */
[[nodiscard]] PackLoadResult load_pack(
  const std::filesystem::path & package_yml, const std::filesystem::path & project_root);

}  // namespace pks
