// pks/extract/reference_json.hpp - JSON serialization for references
//
// Produces the document printed by `pks list-references --json`.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

#include "pks/extract/reference.hpp"
#include "pks/scan/file_scanner.hpp"

namespace pks
{

/**
 * Serialize one reference.
 *
 * @return {"name", "module_nesting", "location": {start_row, start_col, end_row, end_col}}
 */
[[nodiscard]] nlohmann::json to_json(const Reference & reference);

/**
 * Serialize scanned references as an array, each entry carrying its
 * root-relative "file".
 *
 * @param references References tagged with absolute file paths
 * @param project_root Root the file paths are made relative to
 */
[[nodiscard]] nlohmann::json references_to_json(
  const std::vector<ScannedReference> & references, const std::filesystem::path & project_root);

}  // namespace pks
