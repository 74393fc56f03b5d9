// pks/project/configuration.hpp - Project configuration (packwerk.yml)
//
// Loads the optional packwerk.yml at the project root. Every key has a
// default, so a project without the file is still a valid project.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pks
{

/// Configuration file name looked up at the project root
inline constexpr const char * k_configuration_file_name = "packwerk.yml";

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (packwerk.yml).
 */
struct Configuration
{
  /// Absolute project root; all globs are relative to it
  std::filesystem::path root;

  /// Globs selecting the Ruby files to scan
  std::vector<std::string> include = {"**/*.rb", "**/*.rake"};

  /// Globs removed from the included files
  std::vector<std::string> exclude = {"{bin,node_modules,script,tmp,vendor}/**/*"};

  /// Globs selecting pack directories (the root pack is always included)
  std::vector<std::string> package_paths = {"**"};

  /// packwerk.yml that was read, if one exists
  std::optional<std::filesystem::path> config_file;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  Configuration config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(Configuration cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load the configuration of the project rooted at `project_root`.
 *
 * Reads `<project_root>/packwerk.yml` when present; defaults apply otherwise.
 *
 * @param project_root Project root directory
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_configuration(const std::filesystem::path & project_root);

}  // namespace pks
