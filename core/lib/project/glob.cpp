// pks/project/glob.cpp - Path glob matching for packwerk.yml patterns
#include "pks/project/glob.hpp"

namespace pks
{

namespace
{

// Index of the '}' closing the '{' at `open`, or npos.
size_t find_closing_brace(std::string_view pattern, size_t open)
{
  int depth = 0;
  for (size_t i = open; i < pattern.size(); ++i) {
    if (pattern[i] == '{') {
      ++depth;
    } else if (pattern[i] == '}') {
      if (--depth == 0) return i;
    }
  }
  return std::string_view::npos;
}

// Split the inside of a brace group on top-level commas.
std::vector<std::string_view> split_alternatives(std::string_view body)
{
  std::vector<std::string_view> out;
  int depth = 0;
  size_t begin = 0;
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '{') {
      ++depth;
    } else if (body[i] == '}') {
      --depth;
    } else if (body[i] == ',' && depth == 0) {
      out.push_back(body.substr(begin, i - begin));
      begin = i + 1;
    }
  }
  out.push_back(body.substr(begin));
  return out;
}

// "**/**" matches exactly what "**" matches; repeated segments only add backtracking.
std::string collapse_double_stars(std::string p)
{
  size_t pos = 0;
  while ((pos = p.find("**/**", pos)) != std::string::npos) {
    const bool starts_segment = pos == 0 || p[pos - 1] == '/';
    const bool ends_segment = pos + 5 == p.size() || p[pos + 5] == '/';
    if (starts_segment && ends_segment) {
      p.erase(pos, 3);
    } else {
      ++pos;
    }
  }
  return p;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool match_plain(std::string_view p, std::string_view s)
{
  while (!p.empty()) {
    if (p.substr(0, 2) == "**") {
      std::string_view rest = p.substr(2);
      if (!rest.empty() && rest.front() == '/') {
        rest.remove_prefix(1);
        if (match_plain(rest, s)) return true;
        for (size_t i = 0; i < s.size(); ++i) {
          if (s[i] == '/' && match_plain(rest, s.substr(i + 1))) return true;
        }
        return false;
      }
      for (size_t i = 0; i <= s.size(); ++i) {
        if (match_plain(rest, s.substr(i))) return true;
      }
      return false;
    }

    if (p.front() == '*') {
      const std::string_view rest = p.substr(1);
      for (size_t i = 0; i <= s.size(); ++i) {
        if (match_plain(rest, s.substr(i))) return true;
        if (i < s.size() && s[i] == '/') break;
      }
      return false;
    }

    if (s.empty()) return false;
    if (p.front() == '?') {
      if (s.front() == '/') return false;
    } else if (p.front() != s.front()) {
      return false;
    }
    p.remove_prefix(1);
    s.remove_prefix(1);
  }
  return s.empty();
}

}  // namespace

std::vector<std::string> expand_braces(std::string_view pattern)
{
  const size_t open = pattern.find('{');
  if (open == std::string_view::npos) return {std::string(pattern)};

  const size_t close = find_closing_brace(pattern, open);
  if (close == std::string_view::npos) return {std::string(pattern)};

  const std::string_view prefix = pattern.substr(0, open);
  const std::string_view suffix = pattern.substr(close + 1);

  std::vector<std::string> out;
  for (const auto alt : split_alternatives(pattern.substr(open + 1, close - open - 1))) {
    std::string combined(prefix);
    combined += alt;
    combined += suffix;
    for (auto & expanded : expand_braces(combined)) {
      out.push_back(std::move(expanded));
    }
  }
  return out;
}

bool glob_match(std::string_view pattern, std::string_view path)
{
  for (const auto & alt : expand_braces(pattern)) {
    if (match_plain(collapse_double_stars(alt), path)) return true;
  }
  return false;
}

bool glob_covers_directory(std::string_view pattern, std::string_view directory)
{
  for (const auto & expanded : expand_braces(pattern)) {
    const std::string alt = collapse_double_stars(expanded);
    if (alt == "**" || alt == "**/*") return true;

    std::string_view prefix = alt;
    if (ends_with(prefix, "/**/*")) {
      prefix.remove_suffix(5);
    } else if (ends_with(prefix, "/**")) {
      prefix.remove_suffix(3);
    } else {
      continue;
    }
    if (match_plain(prefix, directory)) return true;
  }
  return false;
}

bool glob_match_any(const std::vector<std::string> & patterns, std::string_view path)
{
  for (const auto & p : patterns) {
    if (glob_match(p, path)) return true;
  }
  return false;
}

bool glob_covers_directory_any(
  const std::vector<std::string> & patterns, std::string_view directory)
{
  for (const auto & p : patterns) {
    if (glob_covers_directory(p, directory)) return true;
  }
  return false;
}

}  // namespace pks
