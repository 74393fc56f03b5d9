// pks/scan/file_scanner.cpp - Parallel extraction over the project's files
#include "pks/scan/file_scanner.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <system_error>

#include "pks/extract/extractor.hpp"
#include "pks/project/configuration.hpp"
#include "pks/project/walk_directory.hpp"

namespace pks
{

namespace
{

struct FileOutcome
{
  ExtractResult result;
  std::optional<FatalError> read_error;
};

void extract_file(
  FileOutcome & out, const std::filesystem::path & path, const std::string & contents)
{
  out.result = extract_from_contents(contents);
  if (out.result.fatal) {
    out.result.fatal->message = fmt::format("{}: {}", path.string(), out.result.fatal->message);
  }
}

FileOutcome process_contents(const std::filesystem::path & path, const std::string & contents)
{
  FileOutcome out;
  extract_file(out, path, contents);
  return out;
}

FileOutcome process_file(const std::filesystem::path & path)
{
  FileOutcome out;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    out.read_error = FatalError::make(fmt::format("{}: failed to read file", path.string()));
    return out;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    out.read_error = FatalError::make(fmt::format("{}: failed to read file", path.string()));
    return out;
  }

  extract_file(out, path, ss.str());
  return out;
}

uint64_t file_priority(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

}  // namespace

ScanResult scan_files(const std::vector<std::filesystem::path> & files, const ScanOptions & options)
{
  const auto start = std::chrono::steady_clock::now();
  const size_t jobs = options.jobs > 0 ? options.jobs : TaskQueue::default_jobs();

  std::vector<std::future<FileOutcome>> futures;
  futures.reserve(files.size());
  try {
    TaskQueue queue(jobs, options.spawner);
    for (const auto & file : files) {
      if (options.contents_override && options.contents_override->file == file) {
        const std::string & contents = options.contents_override->contents;
        futures.push_back(queue.add_task<FileOutcome>(
          [file, &contents]() { return process_contents(file, contents); }, contents.size()));
        continue;
      }
      futures.push_back(queue.add_task<FileOutcome>(
        [file]() { return process_file(file); }, file_priority(file)));
    }
    queue.run_and_wait();
  } catch (const std::system_error & e) {
    return ScanResult::fail(FatalError::make(
      fmt::format("failed to start scanner threads: {}", e.what()),
      std::string("retry with fewer jobs (-j)")));
  }

  ScanResult merged;
  for (size_t i = 0; i < futures.size(); ++i) {
    FileOutcome outcome;
    try {
      outcome = futures[i].get();
    } catch (const std::exception & e) {
      return ScanResult::fail(FatalError::make(fmt::format("{}: {}", files[i].string(), e.what())));
    }

    if (outcome.read_error) return ScanResult::fail(std::move(*outcome.read_error));
    if (outcome.result.fatal) return ScanResult::fail(std::move(*outcome.result.fatal));

    Extraction & ex = outcome.result.extraction;
    if (ex.parse_failed) {
      merged.parse_failed_files.push_back(files[i]);
      if (options.verbose) {
        fmt::print(std::cerr, "Skipping {}: syntax error\n", files[i].string());
      }
      continue;
    }
    for (auto & ref : ex.references) {
      merged.references.push_back(ScannedReference{files[i], std::move(ref)});
    }
    for (auto & def : ex.definitions) {
      merged.definitions.push_back(ScannedDefinition{files[i], std::move(def)});
    }
  }

  if (options.verbose) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    fmt::print(
      std::cerr, "Scanned {} files with {} jobs in {} ms ({} references, {} definitions)\n",
      files.size(), jobs, elapsed.count(), merged.references.size(), merged.definitions.size());
  }

  return merged;
}

ScanResult scan_project(const Configuration & config, const ScanOptions & options)
{
  WalkResult walk = walk_directory(config);
  if (!walk.success) {
    return ScanResult::fail(FatalError::make(walk.error));
  }
  return scan_files(walk.layout.included_files, options);
}

}  // namespace pks
