// pks/project/pack_set.cpp - Pack ownership index
#include "pks/project/pack_set.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace pks
{

PackSetBuildResult PackSet::build(
  std::vector<Pack> packs,
  const std::map<std::filesystem::path, std::filesystem::path> & owning_package_yml_for_file)
{
  std::stable_sort(packs.begin(), packs.end(), [](const Pack & a, const Pack & b) {
    if (a.name.size() != b.name.size()) return a.name.size() > b.name.size();
    return a.name < b.name;
  });

  PackSet set;
  set.packs_ = std::move(packs);

  std::map<std::filesystem::path, std::string> name_for_yml;
  for (size_t i = 0; i < set.packs_.size(); ++i) {
    const Pack & pack = set.packs_[i];
    set.index_by_name_.emplace(pack.name, i);
    name_for_yml.emplace(pack.yml, pack.name);
    set.all_violations_.insert(pack.recorded_violations.begin(), pack.recorded_violations.end());
  }

  const auto root = set.index_by_name_.find(k_root_pack_name);
  if (root == set.index_by_name_.end()) {
    return PackSetBuildResult::fail(FatalError::make(
      "No root pack found. First double check a root pack exists (a package.yml file in the "
      "application root). Secondly, double check your packwerk.yml `package_paths` includes the "
      "root pack by using command pks list-packs."));
  }
  set.root_index_ = root->second;

  for (const auto & [file, yml] : owning_package_yml_for_file) {
    const auto owner = name_for_yml.find(yml);
    if (owner != name_for_yml.end()) {
      set.owning_pack_name_for_file_.emplace(file, owner->second);
    }
  }

  return PackSetBuildResult::ok(std::move(set));
}

OwnerLookupResult PackSet::for_file(const std::filesystem::path & absolute_file_path) const
{
  OwnerLookupResult result;

  const auto owner = owning_pack_name_for_file_.find(absolute_file_path);
  if (owner == owning_pack_name_for_file_.end()) return result;

  const auto pack = index_by_name_.find(owner->second);
  if (pack == index_by_name_.end()) {
    result.fatal = FatalError::make(fmt::format(
      "pack `{}` owning {} is missing from the pack index", owner->second,
      absolute_file_path.string()));
    return result;
  }

  result.pack = &packs_[pack->second];
  return result;
}

PackLookupResult PackSet::for_pack(std::string_view pack_name) const
{
  if (pack_name.size() > 1 && pack_name.back() == '/') {
    pack_name.remove_suffix(1);
  }

  const auto it = index_by_name_.find(std::string(pack_name));
  if (it == index_by_name_.end()) return PackLookupResult::not_found();
  return PackLookupResult::found_pack(packs_[it->second]);
}

}  // namespace pks
