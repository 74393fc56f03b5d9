// pks/extract/reference.hpp - Constant references and definitions
#pragma once

#include <string>
#include <vector>

#include "pks/basic/source_manager.hpp"

namespace pks
{

/**
 * A use of a constant at a specific source location.
 */
struct Reference
{
  /// Constant path as written (`Foo`, `Foo::Bar`, `::Foo`)
  std::string name;

  /// Enclosing fully-qualified namespaces, innermost first (Module.nesting)
  std::vector<std::string> module_nesting;

  /// 1-based rows and byte columns; the end is one past the last byte
  FullSourceRange location;

  /// "<nesting>::<name>" for every nesting level, innermost first
  [[nodiscard]] std::vector<std::string> possible_fully_qualified_constants() const
  {
    std::vector<std::string> out;
    out.reserve(module_nesting.size());
    for (const auto & nesting : module_nesting) {
      out.push_back(nesting + "::" + name);
    }
    return out;
  }

  [[nodiscard]] bool operator==(const Reference & other) const
  {
    return name == other.name && module_nesting == other.module_nesting &&
           location == other.location;
  }
  [[nodiscard]] bool operator!=(const Reference & other) const { return !(*this == other); }
};

/**
 * A point where a constant is declared (class statement or constant assignment).
 */
struct Definition
{
  /// Path from the root namespace without a leading "::" (e.g. "Foo::BAR")
  std::string fully_qualified_name;

  /// Byte range of the declaring statement
  SourceRange location;

  [[nodiscard]] bool operator==(const Definition & other) const
  {
    return fully_qualified_name == other.fully_qualified_name && location == other.location;
  }
};

}  // namespace pks
