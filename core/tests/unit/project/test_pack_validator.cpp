// test_pack_validator.cpp - Unit tests for pack dependency validation
//
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "pks/project/pack_set.hpp"
#include "pks/project/pack_validator.hpp"

namespace pks
{

namespace
{

const std::filesystem::path k_root = "/app";

Pack make_pack(const std::string & name, std::set<std::string> dependencies = {})
{
  Pack pack;
  pack.name = name;
  pack.yml = (name == "." ? k_root : k_root / name) / "package.yml";
  pack.dependencies = std::move(dependencies);
  return pack;
}

PackSet build(std::vector<Pack> packs)
{
  PackSetBuildResult result = PackSet::build(std::move(packs), {});
  EXPECT_TRUE(result.success());
  return std::move(*result.pack_set);
}

std::vector<std::string> codes(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) out.push_back(d.code);
  return out;
}

}  // namespace

TEST(PackValidatorTest, AcyclicKnownDependenciesAreValid)
{
  const PackSet packs = build(
    {make_pack("."), make_pack("packs/foo", {"packs/bar", "packs/baz/"}),
     make_pack("packs/bar", {"packs/baz"}), make_pack("packs/baz")});

  DiagnosticBag diags;
  PackValidator validator(packs, k_root, &diags);
  EXPECT_TRUE(validator.validate());
  EXPECT_EQ(validator.error_count(), 0u);
  EXPECT_TRUE(diags.empty());
}

TEST(PackValidatorTest, UnknownDependencyIsAnError)
{
  const PackSet packs = build({make_pack("."), make_pack("packs/foo", {"packs/missing"})});

  DiagnosticBag diags;
  PackValidator validator(packs, k_root, &diags);
  EXPECT_FALSE(validator.validate());
  ASSERT_EQ(diags.size(), 1u);

  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "P001");
  EXPECT_EQ(d.file, "packs/foo/package.yml");
  EXPECT_EQ(d.message, "dependency `packs/missing` is not a known pack");
  EXPECT_TRUE(diags.has_errors());
}

TEST(PackValidatorTest, SelfDependencyIsAnError)
{
  const PackSet packs = build({make_pack("."), make_pack("packs/foo", {"packs/foo"})});

  DiagnosticBag diags;
  PackValidator validator(packs, k_root, &diags);
  EXPECT_FALSE(validator.validate());
  EXPECT_EQ(codes(diags), std::vector<std::string>{"P002"});
}

TEST(PackValidatorTest, CycleIsReportedOnce)
{
  const PackSet packs = build(
    {make_pack("."), make_pack("packs/a", {"packs/b"}), make_pack("packs/b", {"packs/c"}),
     make_pack("packs/c", {"packs/a"})});

  DiagnosticBag diags;
  PackValidator validator(packs, k_root, &diags);
  EXPECT_FALSE(validator.validate());
  ASSERT_EQ(codes(diags), std::vector<std::string>{"P003"});

  // DFS starts at packs/a (equal name lengths sort by name).
  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.message, "dependency cycle: packs/a -> packs/b -> packs/c -> packs/a");
  EXPECT_EQ(d.file, "packs/c/package.yml");
}

TEST(PackValidatorTest, CountsWithoutABag)
{
  const PackSet packs = build(
    {make_pack("."), make_pack("packs/a", {"packs/b", "packs/x"}),
     make_pack("packs/b", {"packs/a"})});

  PackValidator validator(packs, k_root, nullptr);
  EXPECT_FALSE(validator.validate());
  EXPECT_EQ(validator.error_count(), 2u);
}

}  // namespace pks
