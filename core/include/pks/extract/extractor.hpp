// pks/extract/extractor.hpp - Per-file reference & definition extraction
//
// Pipeline for one file:
// source -> tree-sitter Ruby CST -> ReferenceCollector -> local-definition
// filter -> byte offsets mapped to rows/columns.
//
#pragma once

#include <gsl/span>

#include <optional>
#include <string>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/extract/reference.hpp"

namespace pks
{

/**
 * Everything extracted from one file.
 */
struct Extraction
{
  /// References left after same-file definitions were filtered out
  std::vector<Reference> references;

  /// Every constant the file defines, in traversal order
  std::vector<Definition> definitions;

  /// The file could not be parsed (syntax errors or no tree); nothing was extracted
  bool parse_failed = false;
};

/**
 * Result of extracting from one file.
 */
struct ExtractResult
{
  Extraction extraction;

  /// Set when extraction hit an unrecoverable condition
  std::optional<FatalError> fatal;

  [[nodiscard]] bool success() const noexcept { return !fatal.has_value(); }

  static ExtractResult ok(Extraction e)
  {
    ExtractResult r;
    r.extraction = std::move(e);
    return r;
  }

  static ExtractResult fail(FatalError error)
  {
    ExtractResult r;
    r.fatal = std::move(error);
    return r;
  }
};

/**
 * Extract constant references and definitions from Ruby source text.
 *
 * Parse failures and empty files yield an empty Extraction. The only fatal
 * condition is a `module` whose name cannot be resolved statically.
 *
 * @param contents Full file content
 * @return ExtractResult with the extraction or the fatal error
 */
[[nodiscard]] ExtractResult extract_from_contents(std::string contents);

/**
 * Compute the value of `Module.nesting` for a namespace stack.
 *
 * Example: {"Foo", "Bar", "Baz"} -> {"Foo::Bar::Baz", "Foo::Bar", "Foo"}
 *
 * @param namespaces Enclosing class/module names, outermost first
 * @return Cumulative fully-qualified names, innermost first
 */
[[nodiscard]] std::vector<std::string> calculate_module_nesting(
  gsl::span<const std::string> namespaces);

}  // namespace pks
