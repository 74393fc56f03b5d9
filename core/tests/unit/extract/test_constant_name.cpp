// test_constant_name.cpp - Unit tests for static constant path resolution
//
#include <gtest/gtest.h>

#include <string>

#include "pks/basic/source_manager.hpp"
#include "pks/extract/constant_name.hpp"
#include "pks/syntax/ts_ll.hpp"

namespace pks
{

class ConstantNameTest : public ::testing::Test
{
protected:
  /// Parse `source` (a single expression statement) and resolve its node.
  ConstantName resolve(const std::string & source)
  {
    file_ = SourceFile(source);
    tree_ = ts_ll::Tree(parser_.parse_string(file_.content()));
    EXPECT_FALSE(tree_.is_null());
    const ts_ll::Node root = tree_.root_node();
    EXPECT_EQ(root.named_child_count(), 1u);
    return resolve_constant_name(root.named_child(0), file_);
  }

  ts_ll::Parser parser_;
  SourceFile file_;
  ts_ll::Tree tree_;
};

TEST_F(ConstantNameTest, ParserIsReady) { EXPECT_TRUE(parser_.is_ready()); }

TEST_F(ConstantNameTest, SimpleConstant)
{
  const ConstantName name = resolve("Foo");
  ASSERT_TRUE(name.is_resolved());
  EXPECT_EQ(name.name(), "Foo");
}

TEST_F(ConstantNameTest, ScopedConstant)
{
  const ConstantName name = resolve("Foo::Bar::Baz");
  ASSERT_TRUE(name.is_resolved());
  EXPECT_EQ(name.name(), "Foo::Bar::Baz");
}

TEST_F(ConstantNameTest, TopLevelConstant)
{
  const ConstantName name = resolve("::Foo");
  ASSERT_TRUE(name.is_resolved());
  EXPECT_EQ(name.name(), "::Foo");
}

TEST_F(ConstantNameTest, TopLevelScopedConstant)
{
  const ConstantName name = resolve("::Foo::Bar");
  ASSERT_TRUE(name.is_resolved());
  EXPECT_EQ(name.name(), "::Foo::Bar");
}

TEST_F(ConstantNameTest, DynamicScopes)
{
  EXPECT_TRUE(resolve("self::Foo").is_dynamic());
  EXPECT_TRUE(resolve("described_class::Foo").is_dynamic());
  EXPECT_TRUE(resolve("@klass::Foo").is_dynamic());
  EXPECT_TRUE(resolve("Foo::bar::Baz").is_dynamic());
}

TEST_F(ConstantNameTest, NonConstantNodes)
{
  EXPECT_TRUE(resolve("foo").is_dynamic());
  EXPECT_TRUE(resolve("1").is_dynamic());
  EXPECT_TRUE(resolve_constant_name(ts_ll::Node(), file_).is_dynamic());
}

TEST(ConstantNameValueTest, DynamicHasNoName)
{
  const ConstantName name = ConstantName::dynamic();
  EXPECT_EQ(name.kind(), ConstantName::Kind::Dynamic);
  EXPECT_TRUE(name.name().empty());
}

}  // namespace pks
