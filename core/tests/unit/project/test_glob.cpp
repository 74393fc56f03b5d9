// test_glob.cpp - Unit tests for packwerk.yml glob matching
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pks/project/glob.hpp"

namespace pks
{

TEST(GlobTest, StarStaysWithinSegment)
{
  EXPECT_TRUE(glob_match("*.rb", "foo.rb"));
  EXPECT_FALSE(glob_match("*.rb", "app/foo.rb"));
  EXPECT_TRUE(glob_match("packs/*", "packs/foo"));
  EXPECT_FALSE(glob_match("packs/*", "packs/foo/bar"));
}

TEST(GlobTest, QuestionMark)
{
  EXPECT_TRUE(glob_match("a?c", "abc"));
  EXPECT_FALSE(glob_match("a?c", "a/c"));
  EXPECT_FALSE(glob_match("a?c", "ac"));
}

TEST(GlobTest, DoubleStarMatchesZeroOrMoreSegments)
{
  EXPECT_TRUE(glob_match("**/*.rb", "foo.rb"));
  EXPECT_TRUE(glob_match("**/*.rb", "app/models/foo.rb"));
  EXPECT_FALSE(glob_match("**/*.rb", "app/models/foo.rake"));
  EXPECT_TRUE(glob_match("app/**/*.rb", "app/foo.rb"));
  EXPECT_TRUE(glob_match("app/**/*.rb", "app/a/b/foo.rb"));
  EXPECT_FALSE(glob_match("app/**/*.rb", "lib/foo.rb"));
}

TEST(GlobTest, BareDoubleStarMatchesAnything)
{
  EXPECT_TRUE(glob_match("**", "packs"));
  EXPECT_TRUE(glob_match("**", "packs/foo/bar"));
  EXPECT_TRUE(glob_match("packs/**", "packs/foo/bar"));
}

TEST(GlobTest, BraceAlternatives)
{
  const std::string exclude = "{bin,node_modules,script,tmp,vendor}/**/*";
  EXPECT_TRUE(glob_match(exclude, "vendor/gems/foo.rb"));
  EXPECT_TRUE(glob_match(exclude, "bin/setup.rb"));
  EXPECT_TRUE(glob_match(exclude, "tmp/cache/a/b.rb"));
  EXPECT_FALSE(glob_match(exclude, "app/vendor/foo.rb"));
  EXPECT_FALSE(glob_match(exclude, "packs/foo/app/services/foo.rb"));
}

TEST(GlobTest, ExpandBraces)
{
  const std::vector<std::string> expected = {"app/a.rb", "lib/a.rb"};
  EXPECT_EQ(expand_braces("{app,lib}/a.rb"), expected);

  const std::vector<std::string> nested = {"a/x", "a/y", "b"};
  EXPECT_EQ(expand_braces("{a/{x,y},b}"), nested);

  const std::vector<std::string> plain = {"no/braces"};
  EXPECT_EQ(expand_braces("no/braces"), plain);
}

TEST(GlobTest, RepeatedDoubleStarSegments)
{
  std::string deep;
  for (int i = 0; i < 22; ++i) deep += "d" + std::to_string(i) + "/";

  const std::string pattern = "**/**/**/**/**/**/**/*.x";
  EXPECT_TRUE(glob_match(pattern, deep + "f.x"));
  EXPECT_FALSE(glob_match(pattern, deep + "f.y"));
  EXPECT_TRUE(glob_match(pattern, "f.x"));

  EXPECT_TRUE(glob_match("a/**/**", "a/b/c"));
  EXPECT_TRUE(glob_match("a/**/**/b", "a/b"));
  EXPECT_FALSE(glob_match("a/**/**/b", "a/c"));
  EXPECT_FALSE(glob_match("x**/**y", "x/y/z"));
}

TEST(GlobTest, CoversDirectory)
{
  const std::string exclude = "{bin,node_modules,script,tmp,vendor}/**/*";
  EXPECT_TRUE(glob_covers_directory(exclude, "vendor"));
  EXPECT_TRUE(glob_covers_directory(exclude, "node_modules"));
  EXPECT_FALSE(glob_covers_directory(exclude, "app"));
  EXPECT_FALSE(glob_covers_directory(exclude, "app/vendor"));

  EXPECT_TRUE(glob_covers_directory("**/generated/**", "a/b/generated"));
  EXPECT_TRUE(glob_covers_directory("**", "anything"));

  // Only direct children match, so deeper files must still be visited.
  EXPECT_FALSE(glob_covers_directory("app/*", "app"));
  EXPECT_FALSE(glob_covers_directory("app/**/*.rb", "app"));

  EXPECT_TRUE(glob_covers_directory_any({"app/*", "tmp/**"}, "tmp"));
  EXPECT_FALSE(glob_covers_directory_any({}, "tmp"));
}

TEST(GlobTest, MatchAny)
{
  const std::vector<std::string> patterns = {"**/*.rb", "**/*.rake"};
  EXPECT_TRUE(glob_match_any(patterns, "lib/tasks/foo.rake"));
  EXPECT_FALSE(glob_match_any(patterns, "README.md"));
  EXPECT_FALSE(glob_match_any({}, "foo.rb"));
}

}  // namespace pks
