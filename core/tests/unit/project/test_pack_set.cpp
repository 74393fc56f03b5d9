// test_pack_set.cpp - Unit tests for pack loading and the pack ownership index
//
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "pks/project/pack.hpp"
#include "pks/project/pack_set.hpp"
#include "pks/test_support/temp_project.hpp"

namespace pks
{

using test_support::TempDir;

namespace
{

Pack make_pack(const std::string & name, const std::filesystem::path & root)
{
  Pack pack;
  pack.name = name;
  pack.yml = (name == "." ? root : root / name) / "package.yml";
  return pack;
}

const std::filesystem::path k_root = "/app";

}  // namespace

// ============================================================================
// load_pack
// ============================================================================

TEST(LoadPackTest, ReadsPackageYml)
{
  const TempDir dir("pks_load_pack");
  const auto yml = dir.write(
    "packs/foo/package.yml",
    "enforce_dependencies: true\nenforce_privacy: true\ndependencies:\n  - packs/baz\n"
    "public_path: app/api/\n");

  const PackLoadResult result = load_pack(yml, dir.path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.pack.name, "packs/foo");
  EXPECT_TRUE(result.pack.enforce_dependencies);
  EXPECT_TRUE(result.pack.enforce_privacy);
  EXPECT_TRUE(result.pack.depends_on("packs/baz"));
  EXPECT_FALSE(result.pack.depends_on("packs/bar"));
  EXPECT_EQ(result.pack.public_path, "app/api");
  EXPECT_EQ(result.pack.directory(), dir.path / "packs/foo");
  EXPECT_EQ(result.pack.yml_display_path(), "packs/foo/package.yml");
}

TEST(LoadPackTest, DefaultsAndStrictEnforcement)
{
  const TempDir dir("pks_load_pack_defaults");
  const auto root_yml = dir.write("package.yml", "enforce_dependencies: strict\n");

  const PackLoadResult result = load_pack(root_yml, dir.path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.pack.name, ".");
  EXPECT_TRUE(result.pack.is_root());
  EXPECT_TRUE(result.pack.enforce_dependencies);
  EXPECT_FALSE(result.pack.enforce_privacy);
  EXPECT_TRUE(result.pack.dependencies.empty());
  EXPECT_EQ(result.pack.public_path, "app/public");
  EXPECT_EQ(result.pack.yml_display_path(), "package.yml");
}

TEST(LoadPackTest, ReadsPackageTodo)
{
  const TempDir dir("pks_load_pack_todo");
  const auto yml = dir.write("packs/foo/package.yml", "enforce_dependencies: true\n");
  dir.write(
    "packs/foo/package_todo.yml",
    "---\n"
    "packs/bar:\n"
    "  \"::Bar\":\n"
    "    violations:\n"
    "    - dependency\n"
    "    - privacy\n"
    "    files:\n"
    "    - packs/foo/app/services/foo.rb\n");

  const PackLoadResult result = load_pack(yml, dir.path);
  ASSERT_TRUE(result.success) << result.error;
  const ViolationSet & recorded = result.pack.recorded_violations;
  EXPECT_EQ(recorded.size(), 2u);
  EXPECT_EQ(
    recorded.count(ViolationIdentifier{
      "dependency", "packs/foo/app/services/foo.rb", "::Bar", "packs/foo", "packs/bar"}),
    1u);
  EXPECT_EQ(
    recorded.count(ViolationIdentifier{
      "privacy", "packs/foo/app/services/foo.rb", "::Bar", "packs/foo", "packs/bar"}),
    1u);
}

TEST(LoadPackTest, MalformedFilesAreErrors)
{
  const TempDir dir("pks_load_pack_bad");
  const auto yml = dir.write("packs/foo/package.yml", "dependencies: packs/bar\n");
  const PackLoadResult bad_deps = load_pack(yml, dir.path);
  ASSERT_FALSE(bad_deps.success);
  EXPECT_NE(bad_deps.error.find("packs/foo/package.yml"), std::string::npos);

  const auto yml2 = dir.write("packs/bar/package.yml", "");
  dir.write("packs/bar/package_todo.yml", "packs/foo: [1, 2]\n");
  const PackLoadResult bad_todo = load_pack(yml2, dir.path);
  ASSERT_FALSE(bad_todo.success);
  EXPECT_NE(bad_todo.error.find("package_todo.yml"), std::string::npos);
}

// ============================================================================
// PackSet::build
// ============================================================================

TEST(PackSetTest, MissingRootPackIsFatal)
{
  std::vector<Pack> packs = {make_pack("packs/foo", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_FALSE(result.success());
  EXPECT_NE(result.fatal->message.find("No root pack found."), std::string::npos);
  EXPECT_NE(result.fatal->message.find("package_paths"), std::string::npos);
}

TEST(PackSetTest, RootPack)
{
  std::vector<Pack> packs = {make_pack("packs/foo", k_root), make_pack(".", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.pack_set->root_pack().name, ".");
  EXPECT_EQ(result.pack_set->packs().size(), 2u);
}

TEST(PackSetTest, PacksOrderedByNameLengthThenName)
{
  std::vector<Pack> packs = {
    make_pack(".", k_root), make_pack("packs/b", k_root), make_pack("packs/foo", k_root),
    make_pack("packs/a", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_TRUE(result.success());

  std::vector<std::string> names;
  for (const auto & p : result.pack_set->packs()) names.push_back(p.name);
  EXPECT_EQ(names, (std::vector<std::string>{"packs/foo", "packs/a", "packs/b", "."}));
}

TEST(PackSetTest, ForPackTrimsOneTrailingSlash)
{
  std::vector<Pack> packs = {make_pack(".", k_root), make_pack("packs/foo", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_TRUE(result.success());
  const PackSet & set = *result.pack_set;

  const PackLookupResult plain = set.for_pack("packs/foo");
  const PackLookupResult slashed = set.for_pack("packs/foo/");
  ASSERT_TRUE(plain.found());
  ASSERT_TRUE(slashed.found());
  EXPECT_EQ(plain.pack, slashed.pack);

  EXPECT_FALSE(set.for_pack("packs/foo//").found());
}

TEST(PackSetTest, ForPackNotFound)
{
  std::vector<Pack> packs = {make_pack(".", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_TRUE(result.success());

  const PackLookupResult missing = result.pack_set->for_pack("packs/nope");
  EXPECT_FALSE(missing.found());
  EXPECT_EQ(missing.error, "No pack found.");
}

TEST(PackSetTest, ForFileUsesRecordedOwner)
{
  const std::filesystem::path file = k_root / "packs/a/b/app/x.rb";
  const std::map<std::filesystem::path, std::filesystem::path> owners = {
    {file, k_root / "packs/a/b/package.yml"}};

  // Same outcome whichever pack comes first.
  for (const bool nested_first : {true, false}) {
    std::vector<Pack> packs = {make_pack(".", k_root)};
    if (nested_first) {
      packs.push_back(make_pack("packs/a/b", k_root));
      packs.push_back(make_pack("packs/a", k_root));
    } else {
      packs.push_back(make_pack("packs/a", k_root));
      packs.push_back(make_pack("packs/a/b", k_root));
    }

    const PackSetBuildResult result = PackSet::build(std::move(packs), owners);
    ASSERT_TRUE(result.success());
    const OwnerLookupResult owner = result.pack_set->for_file(file);
    ASSERT_FALSE(owner.fatal.has_value());
    ASSERT_TRUE(owner.has_owner());
    EXPECT_EQ(owner.pack->name, "packs/a/b");
  }
}

TEST(PackSetTest, ForFileWithoutOwner)
{
  const std::map<std::filesystem::path, std::filesystem::path> owners = {
    {k_root / "gems/x.rb", k_root / "gems/package.yml"}};
  std::vector<Pack> packs = {make_pack(".", k_root)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), owners);
  ASSERT_TRUE(result.success());

  // The yml is not a known pack, so the file stays unowned.
  const OwnerLookupResult owner = result.pack_set->for_file(k_root / "gems/x.rb");
  EXPECT_FALSE(owner.has_owner());
  EXPECT_FALSE(owner.fatal.has_value());
  EXPECT_FALSE(result.pack_set->for_file(k_root / "other.rb").has_owner());
}

TEST(PackSetTest, AllViolationsAggregatesEveryPack)
{
  Pack root = make_pack(".", k_root);
  root.recorded_violations.insert(ViolationIdentifier{"privacy", "a.rb", "::A", ".", "packs/a"});
  Pack foo = make_pack("packs/foo", k_root);
  foo.recorded_violations.insert(
    ViolationIdentifier{"dependency", "packs/foo/b.rb", "::B", "packs/foo", "packs/b"});
  foo.recorded_violations.insert(ViolationIdentifier{"privacy", "a.rb", "::A", ".", "packs/a"});

  std::vector<Pack> packs = {std::move(root), std::move(foo)};
  const PackSetBuildResult result = PackSet::build(std::move(packs), {});
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.pack_set->all_violations().size(), 2u);
}

}  // namespace pks
