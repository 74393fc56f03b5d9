// pks/driver/runner.cpp - Command driver implementation
//
#include "pks/driver/runner.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <iostream>
#include <map>
#include <ostream>

#include "pks/check/violation_printer.hpp"
#include "pks/extract/reference_json.hpp"
#include "pks/project/pack.hpp"
#include "pks/project/pack_validator.hpp"
#include "pks/scan/file_scanner.hpp"

namespace pks
{

namespace fs = std::filesystem;

namespace
{

fs::path resolve_in_project(const fs::path & root, const fs::path & file)
{
  return (file.is_absolute() ? file : root / file).lexically_normal();
}

}  // namespace

// ============================================================================
// Project loading
// ============================================================================

ProjectLoadResult load_project(
  const RunOptions & options, const std::optional<fs::path> & contents_file)
{
  auto config_result = load_configuration(options.project_root);
  if (!config_result.success) {
    return ProjectLoadResult::fail(FatalError::make(config_result.error));
  }
  Configuration & config = config_result.config;

  if (options.verbose) {
    if (config.config_file) {
      fmt::print(std::cerr, "Using configuration {}\n", config.config_file->string());
    } else {
      fmt::print(std::cerr, "No {} found, using defaults\n", k_configuration_file_name);
    }
  }

  WalkResult walk = walk_directory(config);
  if (!walk.success) {
    return ProjectLoadResult::fail(FatalError::make(walk.error));
  }
  if (contents_file) {
    const fs::path file = resolve_in_project(config.root, *contents_file);
    if (!add_included_file(walk.layout, config, file) && options.verbose) {
      fmt::print(std::cerr, "{} is not an included file\n", file.string());
    }
  }

  std::vector<Pack> packs;
  packs.reserve(walk.layout.package_ymls.size());
  for (const auto & yml : walk.layout.package_ymls) {
    PackLoadResult loaded = load_pack(yml, config.root);
    if (!loaded.success) {
      return ProjectLoadResult::fail(FatalError::make(loaded.error));
    }
    packs.push_back(std::move(loaded.pack));
  }

  PackSetBuildResult built =
    PackSet::build(std::move(packs), walk.layout.owning_package_yml_for_file);
  if (!built.success()) {
    return ProjectLoadResult::fail(std::move(*built.fatal));
  }

  if (options.verbose) {
    fmt::print(
      std::cerr, "Found {} packs and {} included files\n", built.pack_set->packs().size(),
      walk.layout.included_files.size());
  }

  ProjectLoadResult result;
  result.project.emplace(Project{
    std::move(config), std::move(walk.layout), std::move(*built.pack_set), DiagnosticBag{}});

  Project & project = *result.project;
  for (const auto & pack : project.packs.packs()) {
    for (const auto & dep : pack.dependencies) {
      if (!project.packs.for_pack(dep).found()) {
        project.diagnostics
          .report_warning(
            relative_to_root(pack.yml, project.config.root),
            fmt::format("dependency `{}` is not a known pack", dep))
          .with_code("P001")
          .with_help("check the pack name or the `package_paths` setting in packwerk.yml");
      }
    }
  }

  return result;
}

// ============================================================================
// Runner
// ============================================================================

Runner::Runner(RunOptions options, std::ostream & out, std::ostream & err)
: options_(std::move(options)), out_(out), err_(err)
{
}

std::optional<Project> Runner::load(const std::optional<fs::path> & contents_file)
{
  ProjectLoadResult loaded = load_project(options_, contents_file);
  if (!loaded.success()) {
    report_fatal(*loaded.fatal);
    return std::nullopt;
  }

  if (!loaded.project->diagnostics.empty()) {
    ViolationPrinter printer(err_, options_.use_color);
    printer.print_all(loaded.project->diagnostics);
  }
  return std::move(loaded.project);
}

std::optional<ScanResult> Runner::scan(
  const Project & project, std::optional<ContentsOverride> contents_override)
{
  ScanOptions scan_options;
  scan_options.jobs = options_.jobs;
  scan_options.verbose = options_.verbose;
  scan_options.contents_override = std::move(contents_override);

  ScanResult result = scan_files(project.layout.included_files, scan_options);
  if (!result.success()) {
    report_fatal(*result.fatal);
    return std::nullopt;
  }
  return result;
}

int Runner::report_fatal(const FatalError & error)
{
  ViolationPrinter printer(err_, options_.use_color);
  printer.print_fatal(error);
  return 1;
}

int Runner::check(CheckOptions check_options, const std::vector<std::string> & files)
{
  auto project = load();
  if (!project) return 1;

  for (const auto & file : files) {
    check_options.only_files.push_back(resolve_in_project(project->config.root, file));
  }

  auto scanned = scan(*project);
  if (!scanned) return 1;

  return run_check(*project, *scanned, check_options);
}

int Runner::check_contents(
  CheckOptions check_options, const std::string & file, std::string contents)
{
  auto project = load(fs::path(file));
  if (!project) return 1;

  const fs::path absolute = resolve_in_project(project->config.root, file);
  check_options.only_files = {absolute};

  auto scanned = scan(*project, ContentsOverride{absolute, std::move(contents)});
  if (!scanned) return 1;

  return run_check(*project, *scanned, check_options);
}

int Runner::run_check(
  const Project & project, const ScanResult & scanned, const CheckOptions & options)
{
  const ConstantIndex constants(scanned.definitions);
  const Checker checker(project.packs, project.config.root);
  const CheckResult result = checker.check(scanned.references, constants, options);
  if (!result.success()) {
    return report_fatal(*result.fatal);
  }

  if (options_.verbose && result.recorded_count > 0) {
    fmt::print(err_, "{} recorded violation(s) ignored\n", result.recorded_count);
  }

  ViolationPrinter printer(out_, options_.use_color);
  printer.print_summary(result.violations);
  return result.violations.empty() ? 0 : 1;
}

int Runner::validate()
{
  // Unknown dependencies are reported below as errors, not as load warnings.
  ProjectLoadResult loaded = load_project(options_);
  if (!loaded.success()) {
    return report_fatal(*loaded.fatal);
  }
  const Project & project = *loaded.project;

  DiagnosticBag diags;
  PackValidator validator(project.packs, project.config.root, &diags);
  validator.validate();

  ViolationPrinter printer(out_, options_.use_color);
  printer.print_validation(diags);
  return diags.has_errors() ? 1 : 0;
}

int Runner::list_packs()
{
  auto project = load();
  if (!project) return 1;

  for (const auto & pack : project->packs.packs()) {
    fmt::print(out_, "{} ({})\n", pack.name, relative_to_root(pack.yml, project->config.root));
  }
  return 0;
}

int Runner::list_included_files()
{
  auto project = load();
  if (!project) return 1;

  for (const auto & file : project->layout.included_files) {
    fmt::print(out_, "{}\n", relative_to_root(file, project->config.root));
  }
  return 0;
}

int Runner::list_definitions(bool ambiguous)
{
  auto project = load();
  if (!project) return 1;

  auto scanned = scan(*project);
  if (!scanned) return 1;

  const ConstantIndex constants(scanned->definitions);
  for (const auto & [name, defining_files] : constants.constants()) {
    if (ambiguous && defining_files.size() < 2) continue;
    for (const auto & file : defining_files) {
      fmt::print(out_, "{} is defined at {}\n", name, relative_to_root(file, project->config.root));
    }
  }
  return 0;
}

int Runner::list_references(bool as_json)
{
  auto project = load();
  if (!project) return 1;

  auto scanned = scan(*project);
  if (!scanned) return 1;

  // References are merged in included-file order.
  if (as_json) {
    fmt::print(out_, "{}\n", references_to_json(scanned->references, project->config.root).dump(2));
    return 0;
  }

  for (const auto & ref : scanned->references) {
    const Reference & r = ref.reference;
    std::string nesting;
    for (size_t i = 0; i < r.module_nesting.size(); ++i) {
      if (i > 0) nesting += ", ";
      nesting += r.module_nesting[i];
    }
    fmt::print(
      out_, "{}:{}:{} {} [{}]\n", relative_to_root(ref.file, project->config.root),
      r.location.start_line, r.location.start_column, r.name, nesting);
  }
  return 0;
}

}  // namespace pks
