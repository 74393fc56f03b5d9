// pks/extract/constant_name.cpp - Static resolution of constant paths
#include "pks/extract/constant_name.hpp"

namespace pks
{

bool is_constant_path(ts_ll::Node node) noexcept
{
  if (node.is_null()) return false;
  const std::string_view k = node.kind();
  return k == "constant" || k == "scope_resolution";
}

ConstantName resolve_constant_name(ts_ll::Node node, const SourceFile & file)
{
  if (node.is_null()) {
    return ConstantName::dynamic();
  }

  const std::string_view kind = node.kind();

  if (kind == "constant") {
    return ConstantName::resolved(std::string(node.text(file)));
  }

  if (kind != "scope_resolution") {
    return ConstantName::dynamic();
  }

  // `Foo::bar` style method calls share the node kind; only a constant
  // segment makes this a constant path.
  const ts_ll::Node name = node.child_by_field("name");
  if (name.is_null() || name.kind() != "constant") {
    return ConstantName::dynamic();
  }

  const ts_ll::Node scope = node.child_by_field("scope");
  std::string parent;
  if (!scope.is_null()) {
    ConstantName resolved_scope = resolve_constant_name(scope, file);
    if (resolved_scope.is_dynamic()) {
      return resolved_scope;
    }
    parent = resolved_scope.name();
  }

  return ConstantName::resolved(parent + "::" + std::string(name.text(file)));
}

}  // namespace pks
