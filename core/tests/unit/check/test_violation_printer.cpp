// test_violation_printer.cpp - Unit tests for check output and reference JSON
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "pks/check/violation_printer.hpp"
#include "pks/extract/reference_json.hpp"

namespace pks
{

using nlohmann::json;

TEST(ViolationPrinterTest, NoViolations)
{
  std::ostringstream os;
  ViolationPrinter printer(os, false);
  printer.print_summary({});
  EXPECT_EQ(os.str(), "No violations detected!\n");
}

TEST(ViolationPrinterTest, CountThenMessages)
{
  Violation a;
  a.message = "dependency: a.rb:1 references ::A from packs/a without an explicit dependency in "
              "package.yml";
  Violation b;
  b.message = "privacy: b.rb:2 references private constant ::B from packs/b";

  std::ostringstream os;
  ViolationPrinter printer(os, false);
  printer.print_summary({a, b});
  EXPECT_EQ(os.str(), "2 violation(s) detected:\n" + a.message + "\n" + b.message + "\n");
}

TEST(ViolationPrinterTest, FatalWithHelp)
{
  std::ostringstream os;
  ViolationPrinter printer(os, false);
  printer.print_fatal(FatalError::make("No root pack found.", "add a package.yml"));
  EXPECT_EQ(os.str(), "error: No root pack found.\n   = help: add a package.yml\n");
}

TEST(ViolationPrinterTest, DiagnosticWithCodeAndFile)
{
  DiagnosticBag diags;
  diags.report_warning("packs/foo/package.yml", "dependency `packs/nope` is not a known pack")
    .with_code("P001");

  std::ostringstream os;
  ViolationPrinter printer(os, false);
  printer.print_all(diags);
  EXPECT_EQ(
    os.str(),
    "warning[P001]: packs/foo/package.yml: dependency `packs/nope` is not a known pack\n");
}

// ============================================================================
// JSON
// ============================================================================

TEST(ReferenceJsonTest, SerializesReferences)
{
  Reference r;
  r.name = "Bar";
  r.module_nesting = {"Foo::Service", "Foo"};
  r.location.start_line = 3;
  r.location.start_column = 5;
  r.location.end_line = 3;
  r.location.end_column = 8;

  const std::vector<ScannedReference> refs = {ScannedReference{"/app/packs/foo/foo.rb", r}};
  const json j = references_to_json(refs, "/app");

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["file"], "packs/foo/foo.rb");
  EXPECT_EQ(j[0]["name"], "Bar");
  EXPECT_EQ(j[0]["module_nesting"], json::array({"Foo::Service", "Foo"}));
  EXPECT_EQ(j[0]["location"]["start_row"], 3);
  EXPECT_EQ(j[0]["location"]["start_col"], 5);
  EXPECT_EQ(j[0]["location"]["end_row"], 3);
  EXPECT_EQ(j[0]["location"]["end_col"], 8);
}

TEST(ReferenceJsonTest, EmptyIsArray)
{
  const json j = references_to_json({}, "/app");
  EXPECT_TRUE(j.is_array());
  EXPECT_TRUE(j.empty());
}

}  // namespace pks
