// pks/project/pack_set.hpp - Pack ownership index
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/project/pack.hpp"

namespace pks
{

class PackSet;

/**
 * Result of looking a pack up by name. Not finding one is an ordinary outcome.
 */
struct PackLookupResult
{
  const Pack * pack = nullptr;
  std::string error;

  [[nodiscard]] bool found() const noexcept { return pack != nullptr; }

  static PackLookupResult found_pack(const Pack & p)
  {
    PackLookupResult r;
    r.pack = &p;
    return r;
  }

  static PackLookupResult not_found()
  {
    PackLookupResult r;
    r.error = "No pack found.";
    return r;
  }
};

/**
 * Result of looking up the pack owning a file.
 *
 * `pack == nullptr` without `fatal` means the file has no owner.
 */
struct OwnerLookupResult
{
  const Pack * pack = nullptr;
  std::optional<FatalError> fatal;

  [[nodiscard]] bool has_owner() const noexcept { return pack != nullptr; }
};

struct PackSetBuildResult;

/**
 * Immutable index over every pack of a project.
 *
 * Built once, single-threaded, then shared read-only.
 */
class PackSet
{
public:
  /**
   * Build the index.
   *
   * Packs are ordered by name length (longest first), then by name. A file
   * whose package.yml is not among `packs` stays unowned.
   *
   * @param packs Every pack of the project; must include the root pack "."
   * @param owning_package_yml_for_file Absolute file path -> absolute package.yml
   * @return The index, or a fatal error when no root pack exists
   */
  [[nodiscard]] static PackSetBuildResult build(
    std::vector<Pack> packs,
    const std::map<std::filesystem::path, std::filesystem::path> & owning_package_yml_for_file);

  /// Pack owning `absolute_file_path`
  [[nodiscard]] OwnerLookupResult for_file(const std::filesystem::path & absolute_file_path) const;

  /// Pack named `pack_name`; one trailing '/' is ignored
  [[nodiscard]] PackLookupResult for_pack(std::string_view pack_name) const;

  /// The "." pack
  [[nodiscard]] const Pack & root_pack() const { return packs_[root_index_]; }

  [[nodiscard]] const std::vector<Pack> & packs() const noexcept { return packs_; }

  /// Union of every pack's recorded violations
  [[nodiscard]] const ViolationSet & all_violations() const noexcept { return all_violations_; }

private:
  PackSet() = default;

  std::vector<Pack> packs_;
  std::unordered_map<std::string, size_t> index_by_name_;
  std::map<std::filesystem::path, std::string> owning_pack_name_for_file_;
  ViolationSet all_violations_;
  size_t root_index_ = 0;
};

struct PackSetBuildResult
{
  std::optional<PackSet> pack_set;
  std::optional<FatalError> fatal;

  [[nodiscard]] bool success() const noexcept { return pack_set.has_value(); }

  static PackSetBuildResult ok(PackSet set)
  {
    PackSetBuildResult r;
    r.pack_set = std::move(set);
    return r;
  }

  static PackSetBuildResult fail(FatalError error)
  {
    PackSetBuildResult r;
    r.fatal = std::move(error);
    return r;
  }
};

}  // namespace pks
