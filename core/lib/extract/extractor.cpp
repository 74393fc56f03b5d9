// pks/extract/extractor.cpp - Per-file reference & definition extraction
#include "pks/extract/extractor.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>

#include "pks/extract/reference_collector.hpp"
#include "pks/syntax/ts_ll.hpp"

namespace pks
{

std::vector<std::string> calculate_module_nesting(gsl::span<const std::string> namespaces)
{
  std::vector<std::string> nesting;
  nesting.reserve(namespaces.size());

  std::string previous;
  for (const auto & ns : namespaces) {
    previous = previous.empty() ? ns : previous + "::" + ns;
    nesting.push_back(previous);
  }

  std::reverse(nesting.begin(), nesting.end());
  return nesting;
}

ExtractResult extract_from_contents(std::string contents)
{
  const SourceFile file(std::move(contents));
  Extraction out;

  const ts_ll::Parser parser;
  if (!parser.is_ready()) {
    return ExtractResult::fail(FatalError::make(
      "failed to load the tree-sitter Ruby grammar",
      "the installed tree-sitter-ruby grammar does not match the tree-sitter runtime ABI"));
  }

  const ts_ll::Tree tree(parser.parse_string(file.content()));
  if (tree.is_null()) {
    out.parse_failed = true;
    return ExtractResult::ok(std::move(out));
  }

  const ts_ll::Node root = tree.root_node();

  // Recovered trees (ERROR/MISSING nodes) count as parse failures.
  if (root.has_error()) {
    out.parse_failed = true;
    return ExtractResult::ok(std::move(out));
  }

  if (root.named_child_count() == 0) {
    return ExtractResult::ok(std::move(out));
  }

  ReferenceCollector collector(file);
  if (auto fatal = collector.collect(root)) {
    return ExtractResult::fail(std::move(*fatal));
  }

  std::vector<Definition> definitions = collector.take_definitions();

  std::unordered_set<std::string_view> defined;
  defined.reserve(definitions.size());
  for (const auto & d : definitions) {
    defined.insert(d.fully_qualified_name);
  }

  for (auto & parsed : collector.take_references()) {
    Reference ref;
    ref.name = std::move(parsed.name);
    ref.module_nesting = std::move(parsed.module_nesting);
    ref.location = file.get_full_range(parsed.location);

    const auto candidates = ref.possible_fully_qualified_constants();
    const bool defined_locally =
      std::any_of(candidates.begin(), candidates.end(), [&defined](const std::string & c) {
        return defined.count(c) > 0;
      });
    if (defined_locally) continue;

    out.references.push_back(std::move(ref));
  }

  out.definitions = std::move(definitions);
  return ExtractResult::ok(std::move(out));
}

}  // namespace pks
