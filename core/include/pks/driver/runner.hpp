// pks/driver/runner.hpp - Command driver
//
// Single entry point for the CLI commands. Loads the project once per
// command and writes results to the given streams.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/check/checker.hpp"
#include "pks/project/configuration.hpp"
#include "pks/project/pack_set.hpp"
#include "pks/project/walk_directory.hpp"
#include "pks/scan/file_scanner.hpp"

namespace pks
{

// ============================================================================
// Run Options
// ============================================================================

struct RunOptions
{
  /// Project root (may be relative to the working directory)
  std::filesystem::path project_root = ".";

  /// Worker threads for scanning; 0 selects the hardware thread count
  size_t jobs = 0;

  /// Progress and timing on the error stream
  bool verbose = false;

  /// Terminal colors
  bool use_color = false;
};

// ============================================================================
// Loaded project
// ============================================================================

/**
 * Everything known about a project before any file is parsed.
 */
struct Project
{
  Configuration config;
  ProjectLayout layout;
  PackSet packs;

  /// Non-fatal problems found while loading (unknown dependencies, ...)
  DiagnosticBag diagnostics;
};

struct ProjectLoadResult
{
  std::optional<Project> project;
  std::optional<FatalError> fatal;

  [[nodiscard]] bool success() const noexcept { return project.has_value(); }

  static ProjectLoadResult fail(FatalError error)
  {
    ProjectLoadResult r;
    r.fatal = std::move(error);
    return r;
  }
};

/**
 * Load configuration, enumerate files and build the pack index.
 *
 * @param options Project root and verbosity
 * @param contents_file File (root-relative or absolute) added to the included
 *        files even when it does not exist on disk, as long as include/exclude
 *        select it
 */
[[nodiscard]] ProjectLoadResult load_project(
  const RunOptions & options,
  const std::optional<std::filesystem::path> & contents_file = std::nullopt);

// ============================================================================
// Runner
// ============================================================================

/**
 * Executes one CLI command. Every command returns the process exit status:
 * 0 on success, 1 on a fatal error, when `check` reports violations or
 * when `validate` finds errors.
 */
class Runner
{
public:
  /**
   * @param options Global options
   * @param out Normal output (violations, listings)
   * @param err Errors, warnings and verbose output
   */
  Runner(RunOptions options, std::ostream & out, std::ostream & err);

  /**
   * Check every reference against the pack rules.
   *
   * @param check_options Recorded-violation handling
   * @param files Restrict to references from these files (root-relative or absolute)
   */
  int check(CheckOptions check_options, const std::vector<std::string> & files = {});

  /**
   * Check one file whose contents are given instead of read from disk.
   * Definitions still come from every other included file.
   *
   * @param file Path of the file (root-relative or absolute)
   * @param contents Current contents of the file
   */
  int check_contents(CheckOptions check_options, const std::string & file, std::string contents);

  /// Validate the declared pack dependencies; 1 when any error is found
  int validate();

  /// "<name> (<package.yml>)" per pack
  int list_packs();

  /// Root-relative path of every included file
  int list_included_files();

  /// "<constant> is defined at <file>"; only multiply-defined constants when `ambiguous`
  int list_definitions(bool ambiguous);

  /// Every extracted reference, as text or as a JSON array
  int list_references(bool as_json);

private:
  [[nodiscard]] std::optional<Project> load(
    const std::optional<std::filesystem::path> & contents_file = std::nullopt);
  [[nodiscard]] std::optional<ScanResult> scan(
    const Project & project, std::optional<ContentsOverride> contents_override = std::nullopt);

  int run_check(const Project & project, const ScanResult & scanned, const CheckOptions & options);

  int report_fatal(const FatalError & error);

  RunOptions options_;
  std::ostream & out_;
  std::ostream & err_;
};

}  // namespace pks
