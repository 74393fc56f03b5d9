// pks/extract/reference_collector.cpp - CST visitor collecting constants
#include "pks/extract/reference_collector.hpp"

#include <fmt/core.h>

#include "pks/extract/constant_name.hpp"
#include "pks/extract/extractor.hpp"

namespace pks
{

namespace
{

std::string join_namespaces(const std::vector<std::string> & namespaces, const std::string & last)
{
  std::string out;
  for (const auto & ns : namespaces) {
    out += ns;
    out += "::";
  }
  out += last;
  return out;
}

bool is_scope_header_field(std::string_view field)
{
  return field == "name" || field == "superclass";
}

// True when a class/module node has anything besides its header and comments.
bool has_statements(ts_ll::Node node)
{
  ts_ll::Cursor cursor(node);
  if (!cursor.goto_first_child()) return false;
  do {
    const ts_ll::Node child = cursor.current_node();
    if (!child.is_named() || is_scope_header_field(cursor.current_field_name())) continue;
    if (child.kind() == "comment") continue;
    if (child.kind() == "body_statement") {
      if (has_statements(child)) return true;
      continue;
    }
    return true;
  } while (cursor.goto_next_sibling());
  return false;
}

}  // namespace

std::optional<FatalError> ReferenceCollector::collect(ts_ll::Node root)
{
  visit(root);
  return fatal_;
}

// ============================================================================
// Dispatch
// ============================================================================

void ReferenceCollector::visit(ts_ll::Node node)
{
  if (node.is_null() || stopped()) return;

  const std::string_view kind = node.kind();
  if (kind == "class") {
    on_class(node);
  } else if (kind == "module") {
    on_module(node);
  } else if (kind == "assignment" || kind == "operator_assignment") {
    on_assignment(node);
  } else if (kind == "constant" || kind == "scope_resolution") {
    on_constant(node);
  } else {
    visit_children(node);
  }
}

void ReferenceCollector::visit_children(ts_ll::Node node)
{
  ts_ll::Cursor cursor(node);
  if (!cursor.goto_first_child()) return;

  const std::string_view parent_kind = node.kind();
  do {
    const ts_ll::Node child = cursor.current_node();
    if (!child.is_named()) continue;

    // `def Foo` and `Integer("1")` name methods, not constants.
    const std::string_view field = cursor.current_field_name();
    if (field == "name" && (parent_kind == "method" || parent_kind == "singleton_method")) {
      continue;
    }
    if (field == "method" && parent_kind == "call") continue;

    visit(child);
  } while (!stopped() && cursor.goto_next_sibling());
}

void ReferenceCollector::visit_scope_body(ts_ll::Node scope_node)
{
  ts_ll::Cursor cursor(scope_node);
  if (!cursor.goto_first_child()) return;
  do {
    const ts_ll::Node child = cursor.current_node();
    if (!child.is_named() || is_scope_header_field(cursor.current_field_name())) continue;
    visit(child);
  } while (!stopped() && cursor.goto_next_sibling());
}

// ============================================================================
// Scopes
// ============================================================================

void ReferenceCollector::on_class(ts_ll::Node node)
{
  const ts_ll::Node name_node = node.child_by_field("name");
  const ConstantName name = resolve_constant_name(name_node, file_);
  if (name.is_dynamic()) {
    // Metaprogrammed class: nothing inside it can be attributed to a namespace.
    return;
  }

  if (!has_statements(node)) {
    record_reference(name.name(), name_node.range());
  }

  // The superclass is looked up in the enclosing scope.
  visit(node.child_by_field("superclass"));

  record_definition(name.name(), node.range());

  current_namespaces_.push_back(name.name());
  visit_scope_body(node);
  current_namespaces_.pop_back();
}

void ReferenceCollector::on_module(ts_ll::Node node)
{
  const ts_ll::Node name_node = node.child_by_field("name");
  const ConstantName name = resolve_constant_name(name_node, file_);
  if (name.is_dynamic()) {
    const LineColumn at = file_.get_line_column(node.start_byte());
    fatal_ = FatalError::make(
      fmt::format(
        "cannot statically resolve module name `{}` at {}:{}", name_node.text(file_), at.line,
        at.column),
      "module names must be constant paths such as `Foo` or `Foo::Bar`");
    return;
  }

  current_namespaces_.push_back(name.name());
  visit_scope_body(node);
  current_namespaces_.pop_back();
}

// ============================================================================
// Constants
// ============================================================================

void ReferenceCollector::on_assignment(ts_ll::Node node)
{
  on_assignment_target(node.child_by_field("left"), node);
  visit(node.child_by_field("right"));
}

void ReferenceCollector::on_assignment_target(ts_ll::Node target, ts_ll::Node statement)
{
  if (target.is_null() || stopped()) return;

  if (is_constant_path(target)) {
    const ConstantName name = resolve_constant_name(target, file_);
    if (name.is_resolved()) {
      record_definition(name.name(), statement.range());
    }
    return;
  }

  const std::string_view kind = target.kind();
  if (
    kind == "left_assignment_list" || kind == "destructured_left_assignment" ||
    kind == "rest_assignment") {
    for (uint32_t i = 0; i < target.named_child_count(); ++i) {
      on_assignment_target(target.named_child(i), statement);
    }
    return;
  }

  // `foo.bar = 1`, `Foo[1] = 2`: the receiver may reference constants.
  visit(target);
}

void ReferenceCollector::on_constant(ts_ll::Node node)
{
  if (node.kind() == "scope_resolution") {
    const ts_ll::Node name = node.child_by_field("name");
    if (name.is_null() || name.kind() != "constant") {
      visit_children(node);
      return;
    }
  }

  ConstantName name = resolve_constant_name(node, file_);
  if (name.is_resolved()) {
    record_reference(name.name(), node.range());
  }
}

void ReferenceCollector::record_reference(std::string name, SourceRange location)
{
  ParsedReference ref;
  ref.name = std::move(name);
  ref.module_nesting = calculate_module_nesting(current_namespaces_);
  ref.location = location;
  references_.push_back(std::move(ref));
}

void ReferenceCollector::record_definition(const std::string & name, SourceRange location)
{
  definitions_.push_back(Definition{join_namespaces(current_namespaces_, name), location});
}

}  // namespace pks
