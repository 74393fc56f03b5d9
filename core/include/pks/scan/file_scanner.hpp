// pks/scan/file_scanner.hpp - Parallel extraction over the project's files
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/extract/reference.hpp"
#include "pks/scan/task_queue.hpp"

namespace pks
{

struct Configuration;

/// A Reference tagged with the absolute path of the file it was found in.
struct ScannedReference
{
  std::filesystem::path file;
  Reference reference;
};

/// A Definition tagged with the absolute path of the file declaring it.
struct ScannedDefinition
{
  std::filesystem::path file;
  Definition definition;
};

/// In-memory contents standing in for one file (e.g. an unsaved editor buffer).
struct ContentsOverride
{
  std::filesystem::path file;
  std::string contents;
};

struct ScanOptions
{
  /// Worker threads; 0 selects the hardware thread count
  size_t jobs = 0;

  /// Report skipped files and timing to stderr
  bool verbose = false;

  /// Worker thread factory; empty uses std::thread
  TaskQueue::Spawner spawner;

  /// Extract this file from `contents` instead of reading it from disk
  std::optional<ContentsOverride> contents_override;
};

/**
 * Concatenated extraction results of a batch of files.
 */
struct ScanResult
{
  std::vector<ScannedReference> references;
  std::vector<ScannedDefinition> definitions;

  /// Files skipped because they did not parse
  std::vector<std::filesystem::path> parse_failed_files;

  std::optional<FatalError> fatal;

  [[nodiscard]] bool success() const noexcept { return !fatal.has_value(); }

  static ScanResult fail(FatalError error)
  {
    ScanResult r;
    r.fatal = std::move(error);
    return r;
  }
};

/**
 * Read and extract every file in parallel.
 *
 * Larger files are scheduled first. Results are merged after all tasks
 * finished; if any task failed, the first failure in `files` order is
 * returned and nothing else. Failing to start any worker thread is fatal.
 *
 * @param files Absolute paths of Ruby files
 * @param options Job count and verbosity
 */
[[nodiscard]] ScanResult scan_files(
  const std::vector<std::filesystem::path> & files, const ScanOptions & options = {});

/**
 * Enumerate the included files of a project (see walk_directory) and scan them.
 */
[[nodiscard]] ScanResult scan_project(
  const Configuration & config, const ScanOptions & options = {});

}  // namespace pks
