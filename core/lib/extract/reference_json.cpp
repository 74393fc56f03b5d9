// pks/extract/reference_json.cpp - JSON serialization for references
//
#include "pks/extract/reference_json.hpp"

#include "pks/project/walk_directory.hpp"

namespace pks
{

using nlohmann::json;

namespace
{

json j_location(const FullSourceRange & r)
{
  return json{
    {"start_row", r.start_line},
    {"start_col", r.start_column},
    {"end_row", r.end_line},
    {"end_col", r.end_column}};
}

}  // namespace

json to_json(const Reference & reference)
{
  return json{
    {"name", reference.name},
    {"module_nesting", reference.module_nesting},
    {"location", j_location(reference.location)}};
}

json references_to_json(
  const std::vector<ScannedReference> & references, const std::filesystem::path & project_root)
{
  json out = json::array();
  for (const auto & ref : references) {
    json j = to_json(ref.reference);
    j["file"] = relative_to_root(ref.file, project_root);
    out.push_back(std::move(j));
  }
  return out;
}

}  // namespace pks
