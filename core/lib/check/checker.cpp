// pks/check/checker.cpp - Dependency and privacy rules over scanned references
#include "pks/check/checker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <set>
#include <tuple>

#include "pks/project/walk_directory.hpp"

namespace pks
{

// ============================================================================
// ConstantIndex
// ============================================================================

ConstantIndex::ConstantIndex(const std::vector<ScannedDefinition> & definitions)
{
  for (const auto & def : definitions) {
    constants_["::" + def.definition.fully_qualified_name].push_back(def.file);
  }
  for (auto & [name, files] : constants_) {
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
  }
}

const std::vector<std::filesystem::path> * ConstantIndex::find(
  const std::string & fully_qualified_name) const
{
  const auto it = constants_.find(fully_qualified_name);
  return it == constants_.end() ? nullptr : &it->second;
}

std::optional<std::string> ConstantIndex::resolve(const Reference & reference) const
{
  if (reference.name.rfind("::", 0) == 0) {
    if (find(reference.name) != nullptr) return reference.name;
    return std::nullopt;
  }

  for (const auto & level : reference.module_nesting) {
    std::string candidate = "::" + level + "::" + reference.name;
    if (find(candidate) != nullptr) return candidate;
  }

  std::string top_level = "::" + reference.name;
  if (find(top_level) != nullptr) return top_level;
  return std::nullopt;
}

// ============================================================================
// Checker
// ============================================================================

Checker::Checker(const PackSet & packs, std::filesystem::path project_root)
: packs_(packs), root_(std::move(project_root))
{
}

CheckResult Checker::check(
  const std::vector<ScannedReference> & references, const ConstantIndex & constants,
  const CheckOptions & options) const
{
  CheckResult result;
  const std::set<std::filesystem::path> only(options.only_files.begin(), options.only_files.end());

  std::vector<Violation> found;
  for (const auto & ref : references) {
    if (!only.empty() && only.count(ref.file) == 0) continue;
    if (auto fatal = check_reference(ref, constants, found)) {
      result.fatal = std::move(fatal);
      return result;
    }
  }

  const ViolationSet & recorded = packs_.all_violations();
  for (auto & v : found) {
    if (!options.ignore_recorded_violations && recorded.count(v.identifier) > 0) {
      ++result.recorded_count;
      continue;
    }
    result.violations.push_back(std::move(v));
  }

  std::sort(
    result.violations.begin(), result.violations.end(),
    [](const Violation & a, const Violation & b) {
      return std::tie(a.identifier.file, a.line, a.column, a.identifier.violation_type) <
             std::tie(b.identifier.file, b.line, b.column, b.identifier.violation_type);
    });
  return result;
}

std::optional<FatalError> Checker::check_reference(
  const ScannedReference & ref, const ConstantIndex & constants,
  std::vector<Violation> & out) const
{
  const OwnerLookupResult referencing = packs_.for_file(ref.file);
  if (referencing.fatal) return referencing.fatal;
  if (!referencing.has_owner()) return std::nullopt;

  const std::optional<std::string> constant = constants.resolve(ref.reference);
  if (!constant) return std::nullopt;

  // A constant reopened inside the referencing pack is local to it.
  const Pack * defining = nullptr;
  std::filesystem::path defining_file;
  for (const auto & file : *constants.find(*constant)) {
    const OwnerLookupResult owner = packs_.for_file(file);
    if (owner.fatal) return owner.fatal;
    if (!owner.has_owner()) continue;
    if (owner.pack == referencing.pack) return std::nullopt;
    if (defining == nullptr) {
      defining = owner.pack;
      defining_file = file;
    }
  }
  if (defining == nullptr) return std::nullopt;

  const Pack & from = *referencing.pack;
  const std::string file = relative_to_root(ref.file, root_);
  const uint32_t line = ref.reference.location.start_line;
  const uint32_t column = ref.reference.location.start_column;

  if (from.enforce_dependencies && !from.depends_on(defining->name)) {
    Violation v;
    v.identifier = ViolationIdentifier{"dependency", file, *constant, from.name, defining->name};
    v.message = fmt::format(
      "dependency: {}:{} references {} from {} without an explicit dependency in {}", file, line,
      *constant, defining->name, from.yml_display_path());
    v.line = line;
    v.column = column;
    out.push_back(std::move(v));
  }

  if (defining->enforce_privacy && !is_public(*defining, defining_file)) {
    Violation v;
    v.identifier = ViolationIdentifier{"privacy", file, *constant, from.name, defining->name};
    v.message = fmt::format(
      "privacy: {}:{} references private constant {} from {}", file, line, *constant,
      defining->name);
    v.line = line;
    v.column = column;
    out.push_back(std::move(v));
  }

  return std::nullopt;
}

bool Checker::is_public(const Pack & pack, const std::filesystem::path & file) const
{
  const std::filesystem::path public_dir = pack.directory() / pack.public_path;
  const std::filesystem::path rel = file.lexically_relative(public_dir);
  return !rel.empty() && *rel.begin() != "..";
}

}  // namespace pks
