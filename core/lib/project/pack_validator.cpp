// pks/project/pack_validator.cpp - Pack configuration validation
#include "pks/project/pack_validator.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pks/project/walk_directory.hpp"

namespace pks
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

std::string cycle_message(const std::vector<const Pack *> & stack, const Pack * target)
{
  size_t start = 0;
  while (start < stack.size() && stack[start] != target) ++start;

  std::string msg = "dependency cycle: ";
  for (size_t i = start; i < stack.size(); ++i) {
    msg += stack[i]->name;
    msg += " -> ";
  }
  msg += target->name;
  return msg;
}

}  // namespace

bool PackValidator::validate()
{
  const size_t before = error_count_;
  check_dependencies_exist();
  check_cycles();
  return error_count_ == before;
}

void PackValidator::check_dependencies_exist()
{
  for (const auto & pack : packs_.packs()) {
    for (const auto & dep : pack.dependencies) {
      const PackLookupResult target = packs_.for_pack(dep);
      if (!target.found()) {
        report_error(
          pack, "P001", fmt::format("dependency `{}` is not a known pack", dep),
          "check the pack name or the `package_paths` setting in packwerk.yml");
      } else if (target.pack == &pack) {
        report_error(
          pack, "P002", fmt::format("pack `{}` depends on itself", pack.name),
          "remove the entry from `dependencies`");
      }
    }
  }
}

void PackValidator::check_cycles()
{
  std::unordered_map<const Pack *, Color> color;
  for (const auto & pack : packs_.packs()) {
    color.emplace(&pack, Color::White);
  }

  std::vector<const Pack *> stack;

  std::function<void(const Pack *)> dfs;
  dfs = [&](const Pack * u) {
    color[u] = Color::Gray;
    stack.push_back(u);

    for (const auto & dep : u->dependencies) {
      const PackLookupResult target = packs_.for_pack(dep);
      if (!target.found()) continue;
      const Pack * v = target.pack;
      if (v == u) continue;

      if (color[v] == Color::Gray) {
        report_error(
          *u, "P003", cycle_message(stack, v),
          "packs must form a directed acyclic graph; remove one of the dependencies");
      } else if (color[v] == Color::White) {
        dfs(v);
      }
    }

    stack.pop_back();
    color[u] = Color::Black;
  };

  for (const auto & pack : packs_.packs()) {
    if (color[&pack] == Color::White) dfs(&pack);
  }
}

void PackValidator::report_error(
  const Pack & pack, std::string code, std::string message, std::string help)
{
  ++error_count_;
  if (!diags_) return;
  diags_->report_error(relative_to_root(pack.yml, root_), std::move(message))
    .with_code(std::move(code))
    .with_help(std::move(help));
}

}  // namespace pks
