// pks/check/checker.hpp - Dependency and privacy rules over scanned references
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/project/pack.hpp"
#include "pks/project/pack_set.hpp"
#include "pks/scan/file_scanner.hpp"

namespace pks
{

/**
 * A reference that crosses a pack boundary it is not allowed to cross.
 */
struct Violation
{
  ViolationIdentifier identifier;

  /// One-line, user-facing description
  std::string message;

  uint32_t line = 0;
  uint32_t column = 0;
};

/**
 * Fully-qualified constant -> files defining it.
 *
 * Keys carry a leading "::" (e.g. "::Foo::BAR"); files are sorted and unique.
 */
class ConstantIndex
{
public:
  explicit ConstantIndex(const std::vector<ScannedDefinition> & definitions);

  /// Files defining `fully_qualified_name`, or nullptr
  [[nodiscard]] const std::vector<std::filesystem::path> * find(
    const std::string & fully_qualified_name) const;

  /**
   * Resolve a reference the way Ruby's lexical lookup does: innermost nesting
   * first, then the top level. A "::"-prefixed name only resolves to itself.
   *
   * @return The first candidate that has a definition
   */
  [[nodiscard]] std::optional<std::string> resolve(const Reference & reference) const;

  [[nodiscard]] const std::map<std::string, std::vector<std::filesystem::path>> & constants()
    const noexcept
  {
    return constants_;
  }

private:
  std::map<std::string, std::vector<std::filesystem::path>> constants_;
};

struct CheckOptions
{
  /// Report violations even when package_todo.yml records them
  bool ignore_recorded_violations = false;

  /// When non-empty, only references from these absolute paths are checked
  std::vector<std::filesystem::path> only_files;
};

struct CheckResult
{
  /// Reported violations, sorted by (file, line, column, type)
  std::vector<Violation> violations;

  /// Violations dropped because package_todo.yml records them
  size_t recorded_count = 0;

  std::optional<FatalError> fatal;

  [[nodiscard]] bool success() const noexcept { return !fatal.has_value(); }
};

/**
 * Evaluates every scanned reference against the pack rules.
 */
class Checker
{
public:
  Checker(const PackSet & packs, std::filesystem::path project_root);

  [[nodiscard]] CheckResult check(
    const std::vector<ScannedReference> & references, const ConstantIndex & constants,
    const CheckOptions & options = {}) const;

private:
  [[nodiscard]] std::optional<FatalError> check_reference(
    const ScannedReference & ref, const ConstantIndex & constants,
    std::vector<Violation> & out) const;

  [[nodiscard]] bool is_public(const Pack & pack, const std::filesystem::path & file) const;

  const PackSet & packs_;
  std::filesystem::path root_;
};

}  // namespace pks
