// pks/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "pks/syntax/ts_ll.hpp"

namespace pks::ts_ll
{

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (!parser_) return;

  const TSLanguage * lang = tree_sitter_ruby();
  // ts_parser_set_language() rejects grammars generated for another ABI version.
  ready_ = lang != nullptr && ts_parser_set_language(parser_, lang);
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  if (!ready_) return nullptr;
  // Tree-sitter consumes bytes; all node offsets are byte offsets.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace pks::ts_ll
