// pks/project/pack_validator.hpp - Pack configuration validation
//
// Checks the dependency graph declared by the package.yml files:
//   P001  dependency on a pack that does not exist
//   P002  pack depending on itself
//   P003  dependency cycle
//
#pragma once

#include <cstddef>
#include <filesystem>

#include "pks/basic/diagnostic.hpp"
#include "pks/project/pack_set.hpp"

namespace pks
{

/**
 * Validate the declared dependencies of every pack.
 *
 * Every problem is reported as an error into the bag, attributed to the
 * root-relative package.yml that declares the offending dependency.
 */
class PackValidator
{
public:
  PackValidator(const PackSet & packs, std::filesystem::path root, DiagnosticBag * diags)
  : packs_(packs), root_(std::move(root)), diags_(diags)
  {
  }

  /// Run every check; true when nothing was reported
  bool validate();

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void check_dependencies_exist();
  void check_cycles();

  void report_error(const Pack & pack, std::string code, std::string message, std::string help);

  const PackSet & packs_;
  std::filesystem::path root_;
  DiagnosticBag * diags_ = nullptr;
  size_t error_count_ = 0;
};

}  // namespace pks
