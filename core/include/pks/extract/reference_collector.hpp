// pks/extract/reference_collector.hpp - CST visitor collecting constants
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/basic/source_manager.hpp"
#include "pks/extract/reference.hpp"
#include "pks/syntax/ts_ll.hpp"

namespace pks
{

/// A reference before its byte range is mapped to rows/columns.
struct ParsedReference
{
  std::string name;
  std::vector<std::string> module_nesting;
  SourceRange location;
};

/**
 * Walks a Ruby syntax tree depth-first, tracking the class/module namespace
 * stack, and records constant references and definitions.
 *
 * - class:    resolves its name (a dynamic name hides the whole class), visits
 *             the superclass in the enclosing scope, records a Definition and
 *             visits the body with the name pushed. A class without a body
 *             also records its name as a Reference.
 * - module:   pushes its name for the body; no Definition. A dynamic module
 *             name is fatal.
 * - NAME = v: records a Definition in the current namespace.
 * - Foo::Bar: records a Reference; dynamic paths are dropped unvisited.
 */
class ReferenceCollector
{
public:
  explicit ReferenceCollector(const SourceFile & file) : file_(file) {}

  ReferenceCollector(const ReferenceCollector &) = delete;
  ReferenceCollector & operator=(const ReferenceCollector &) = delete;

  /// Walk the tree rooted at `root`. Stops at the first fatal condition.
  [[nodiscard]] std::optional<FatalError> collect(ts_ll::Node root);

  [[nodiscard]] const std::vector<ParsedReference> & references() const noexcept
  {
    return references_;
  }
  [[nodiscard]] const std::vector<Definition> & definitions() const noexcept
  {
    return definitions_;
  }

  [[nodiscard]] std::vector<ParsedReference> take_references() { return std::move(references_); }
  [[nodiscard]] std::vector<Definition> take_definitions() { return std::move(definitions_); }

private:
  void visit(ts_ll::Node node);
  void visit_children(ts_ll::Node node);
  void visit_scope_body(ts_ll::Node scope_node);

  void on_class(ts_ll::Node node);
  void on_module(ts_ll::Node node);
  void on_assignment(ts_ll::Node node);
  void on_assignment_target(ts_ll::Node target, ts_ll::Node statement);
  void on_constant(ts_ll::Node node);

  void record_reference(std::string name, SourceRange location);
  void record_definition(const std::string & name, SourceRange location);

  [[nodiscard]] bool stopped() const noexcept { return fatal_.has_value(); }

  const SourceFile & file_;

  // Traversal context
  std::vector<std::string> current_namespaces_;  ///< outer -> inner
  std::vector<ParsedReference> references_;
  std::vector<Definition> definitions_;
  std::optional<FatalError> fatal_;
};

}  // namespace pks
