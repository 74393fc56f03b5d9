// pks/project/glob.hpp - Path glob matching for packwerk.yml patterns
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pks
{

/**
 * Expand `{a,b}` alternatives into plain patterns.
 *
 * Groups may nest; a pattern without braces expands to itself.
 * Example: "{app,lib}/**\/*.rb" -> {"app/**\/*.rb", "lib/**\/*.rb"}
 */
[[nodiscard]] std::vector<std::string> expand_braces(std::string_view pattern);

/**
 * Match a root-relative, '/'-separated path against a glob.
 *
 * - `*`  any run of characters except '/'
 * - `?`  one character except '/'
 * - `**` any number of path segments; `**\/` also matches zero segments
 * - `{a,b}` alternatives
 */
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view path);

/// True if any pattern matches
[[nodiscard]] bool glob_match_any(const std::vector<std::string> & patterns, std::string_view path);

/**
 * True when `pattern` matches every path below `directory`, so the walk can
 * skip the directory. Only patterns ending in `/**` or `/**\/*` qualify.
 *
 * Example: "{bin,vendor}/**\/*" covers "vendor" and "bin", not "app".
 */
[[nodiscard]] bool glob_covers_directory(std::string_view pattern, std::string_view directory);

/// True if any pattern covers `directory`
[[nodiscard]] bool glob_covers_directory_any(
  const std::vector<std::string> & patterns, std::string_view directory);

}  // namespace pks
