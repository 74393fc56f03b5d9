// pks/test_support/temp_project.hpp - helpers for unit/integration tests
//
// A throwaway project directory populated file by file, and the location of
// the checked-in fixture projects.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace pks::test_support
{

struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::string_view prefix)
  {
    static std::atomic<unsigned> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path);
    path = std::filesystem::canonical(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `content` to `relative`, creating parent directories
  std::filesystem::path write(const std::string & relative, const std::string & content) const
  {
    const std::filesystem::path p = path / relative;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }
};

/// core/tests/fixtures, computed from this header's location
inline std::filesystem::path fixtures_dir()
{
  const std::filesystem::path this_file = std::filesystem::absolute(__FILE__);
  // include/pks/test_support -> include/pks -> include -> core
  return this_file.parent_path().parent_path().parent_path().parent_path() / "tests" / "fixtures";
}

}  // namespace pks::test_support
