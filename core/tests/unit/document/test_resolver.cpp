#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "neko_ui/document/document.hpp"
#include "neko_ui/document/resolver.hpp"
#include "neko_ui/document/widget_registry.hpp"
#include "neko_ui/test_support/parse_helpers.hpp"

using namespace neko_ui;
using test_support::resolve;

namespace
{

const Diagnostic * find_code(const DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) {
      return &d;
    }
  }
  return nullptr;
}

}  // namespace

TEST(DocumentResolver, ResolvesSingleLayout)
{
  auto unit = resolve(
    "layout div {\n"
    "  width: 50%;\n"
    "  height: 100px;\n"
    "  color: #ab12cd34;\n"
    "}\n");
  ASSERT_NE(unit.document, nullptr) << unit.diags.size() << " diagnostics";
  EXPECT_TRUE(unit.diags.empty());

  const auto & roots = unit.document->roots();
  ASSERT_EQ(roots.size(), 1U);
  const LayoutNode & div = roots[0];
  EXPECT_EQ(div.widget(), "div");
  EXPECT_TRUE(div.children().empty());

  PropertyMap expected;
  expected.set("width", Value::make_percentage(50));
  expected.set("height", Value::make_pixels(100));
  expected.set("color", Value::make_color({171, 18, 205, 52}));
  EXPECT_EQ(div.properties(), expected);
}

TEST(DocumentResolver, EmptyProgramGivesEmptyDocument)
{
  auto unit = resolve("");
  ASSERT_NE(unit.document, nullptr);
  EXPECT_TRUE(unit.document->roots().empty());
  EXPECT_TRUE(unit.document->variables().empty());
  EXPECT_TRUE(unit.document->styles().empty());
}

TEST(DocumentResolver, SubstitutesVariables)
{
  auto unit = resolve(
    "var accent = #336699;\n"
    "var sizes = [$gap, 2px];\n"
    "var gap = 4px;\n"
    "layout div { color: $accent; pad: {top: $gap}; }\n");
  ASSERT_EQ(unit.document, nullptr);

  // `sizes` refers to `gap` before it is declared
  const Diagnostic * err = find_code(unit.diags, "R001");
  ASSERT_NE(err, nullptr);
  EXPECT_NE(err->message.find("$gap"), std::string::npos);
  EXPECT_EQ(err->phase, DiagnosticPhase::Resolve);
}

TEST(DocumentResolver, VariablesInContainers)
{
  auto unit = resolve(
    "var gap = 4px;\n"
    "var accent = #336699;\n"
    "var sizes = [$gap, 2px];\n"
    "layout div { color: $accent; pad: {top: $gap}; sizes: $sizes; }\n");
  ASSERT_NE(unit.document, nullptr);

  const LayoutNode & div = unit.document->roots()[0];
  EXPECT_EQ(*div.property("color"), Value::make_color({0x33, 0x66, 0x99, 255}));

  PropertyMap pad;
  pad.set("top", Value::make_pixels(4));
  EXPECT_EQ(*div.property("pad"), Value::make_dict(pad));
  EXPECT_EQ(
    *div.property("sizes"), Value::make_list({Value::make_pixels(4), Value::make_pixels(2)}));

  // Top-level variables are exported in declaration order, already resolved
  const PropertyMap & vars = unit.document->variables();
  ASSERT_EQ(vars.size(), 3U);
  EXPECT_EQ(vars.begin()->first, "gap");
  EXPECT_FALSE(vars.find("sizes")->contains_variable_ref());
}

TEST(DocumentResolver, UnboundVariableFailsWithoutDocument)
{
  auto unit = resolve("layout div { color: $missing; }");
  EXPECT_EQ(unit.document, nullptr);
  const Diagnostic * err = find_code(unit.diags, "R001");
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(unit.slice(err->primary_range()), "$missing");
}

TEST(DocumentResolver, ReportsEveryUnboundVariable)
{
  auto unit = resolve("layout div { a: $x; b: $y; layout p { c: $z; } }");
  EXPECT_EQ(unit.document, nullptr);
  EXPECT_EQ(unit.diags.error_count(), 3U);
}

TEST(DocumentResolver, NestedScopeShadowsAndRestores)
{
  auto unit = resolve(
    "var size = 1px;\n"
    "layout div {\n"
    "  var size = 2px;\n"
    "  inner: $size;\n"
    "  layout p { deep: $size; }\n"
    "}\n"
    "layout span { outer: $size; }\n");
  ASSERT_NE(unit.document, nullptr);

  const auto & roots = unit.document->roots();
  ASSERT_EQ(roots.size(), 2U);
  EXPECT_EQ(*roots[0].property("inner"), Value::make_pixels(2));
  EXPECT_EQ(*roots[0].children()[0].property("deep"), Value::make_pixels(2));
  EXPECT_EQ(*roots[1].property("outer"), Value::make_pixels(1));

  // Layout-local bindings are not document variables
  EXPECT_EQ(*unit.document->variables().find("size"), Value::make_pixels(1));
}

TEST(DocumentResolver, LayoutVariablesAreNotVisibleToSiblings)
{
  auto unit = resolve(
    "layout div { var local = 1; }\n"
    "layout p { x: $local; }\n");
  EXPECT_EQ(unit.document, nullptr);
  EXPECT_NE(find_code(unit.diags, "R001"), nullptr);
}

TEST(DocumentResolver, RedeclarationWarnsAndLaterWins)
{
  auto unit = resolve("var a = 1;\nvar a = 2;\nlayout div { v: $a; }\n");
  ASSERT_NE(unit.document, nullptr);
  EXPECT_NE(find_code(unit.diags, "R005"), nullptr);
  EXPECT_FALSE(unit.diags.has_errors());
  EXPECT_EQ(*unit.document->roots()[0].property("v"), Value::make_integer(2));
}

TEST(DocumentResolver, ChildrenKeepSourceOrder)
{
  auto unit = resolve(
    "layout div {\n"
    "  layout p;\n"
    "  with span { x: 1; }\n"
    "  layout img;\n"
    "}\n");
  ASSERT_NE(unit.document, nullptr);
  const auto & children = unit.document->roots()[0].children();
  ASSERT_EQ(children.size(), 3U);
  EXPECT_EQ(children[0].widget(), "p");
  EXPECT_EQ(children[1].widget(), "span");
  EXPECT_EQ(children[2].widget(), "img");
}

TEST(DocumentResolver, UndeclaredClassIsError)
{
  auto unit = resolve("layout div { class ghost; }");
  EXPECT_EQ(unit.document, nullptr);
  const Diagnostic * err = find_code(unit.diags, "R002");
  ASSERT_NE(err, nullptr);
  EXPECT_NE(err->message.find("ghost"), std::string::npos);
  EXPECT_TRUE(err->help_message.has_value());
}

TEST(DocumentResolver, UndeclaredClassAllowedByOption)
{
  ResolveOptions options;
  options.allow_undeclared_classes = true;
  auto unit = resolve("layout div { class ghost; class ghost; }", options);
  ASSERT_NE(unit.document, nullptr);
  const auto & classes = unit.document->roots()[0].classes();
  ASSERT_EQ(classes.size(), 1U);
  EXPECT_EQ(classes[0], "ghost");
}

TEST(DocumentResolver, ClassMentionedByExclusionIsDeclared)
{
  auto unit = resolve("style p !muted { color: #000; }\nlayout p { class muted; }\n");
  ASSERT_NE(unit.document, nullptr);
  EXPECT_TRUE(unit.document->roots()[0].has_class("muted"));
}

TEST(DocumentResolver, UnknownWidgetWithRegistry)
{
  const WidgetRegistry widgets = WidgetRegistry::with_native_widgets();
  ResolveOptions options;
  options.widgets = &widgets;

  auto unit = resolve("layout button;\nstyle slider { x: 1; }\n", options);
  EXPECT_EQ(unit.document, nullptr);

  size_t unknown = 0;
  for (const auto & d : unit.diags) {
    if (d.code == "R003") {
      ++unknown;
      ASSERT_TRUE(d.help_message.has_value());
      EXPECT_NE(d.help_message->find("div"), std::string::npos);
    }
  }
  EXPECT_EQ(unknown, 2U);
}

TEST(DocumentResolver, WithoutRegistryAnyWidgetIsAccepted)
{
  auto unit = resolve("layout button;");
  ASSERT_NE(unit.document, nullptr);
  EXPECT_EQ(unit.document->roots()[0].widget(), "button");
}

TEST(DocumentResolver, IdenticalTextGivesEqualDocuments)
{
  const std::string src =
    "var c = #fff;\n"
    "style div +a { color: $c; with p { size: 2px; } }\n"
    "layout div { class a; layout p { text: 'x'; } }\n";

  auto first = resolve(src);
  auto second = resolve(src);
  ASSERT_NE(first.document, nullptr);
  ASSERT_NE(second.document, nullptr);
  EXPECT_NE(first.document, second.document);
  EXPECT_EQ(*first.document, *second.document);
}

TEST(DocumentResolver, ImportsFromModuleSet)
{
  auto theme = resolve(
    "var accent = #f00;\n"
    "var gap = 1px;\n"
    "style p { color: $accent; }\n"
    "layout span;\n");
  ASSERT_NE(theme.document, nullptr);

  ModuleSet modules;
  modules.add("theme", theme.document);
  ResolveOptions options;
  options.modules = &modules;

  auto unit = resolve(
    "import \"theme\";\n"
    "var gap = 2px;\n"
    "layout p { pad: $gap; }\n",
    options);
  ASSERT_NE(unit.document, nullptr) << (unit.diags.empty() ? "" : unit.diags.all()[0].message);

  const auto & roots = unit.document->roots();
  ASSERT_EQ(roots.size(), 2U);
  EXPECT_EQ(roots[0].widget(), "span");
  EXPECT_EQ(roots[1].widget(), "p");

  // Imported style applies; local variable overrides the imported one quietly
  EXPECT_EQ(*roots[1].property("color"), Value::make_color({255, 0, 0, 255}));
  EXPECT_EQ(*roots[1].property("pad"), Value::make_pixels(2));
  EXPECT_FALSE(unit.diags.has_warnings());

  EXPECT_EQ(*unit.document->variables().find("accent"), Value::make_color({255, 0, 0, 255}));
  EXPECT_EQ(*unit.document->variables().find("gap"), Value::make_pixels(2));
}

TEST(DocumentResolver, UnknownModule)
{
  auto unit = resolve("import \"nowhere\";\nlayout div;\n");
  EXPECT_EQ(unit.document, nullptr);
  const Diagnostic * err = find_code(unit.diags, "R004");
  ASSERT_NE(err, nullptr);
  EXPECT_NE(err->message.find("nowhere"), std::string::npos);
}

TEST(DocumentResolver, NullProgram)
{
  DiagnosticBag diags;
  Resolver resolver(diags);
  EXPECT_EQ(resolver.resolve(nullptr), nullptr);
  EXPECT_TRUE(diags.has_errors_in(DiagnosticPhase::Resolve));
}

TEST(DocumentResolver, KeywordValuesResolveToStrings)
{
  auto unit = resolve(
    "var margin = auto;\n"
    "layout p { font-weight: bold; margin: $margin; }\n");
  ASSERT_NE(unit.document, nullptr);

  const PropertyMap & props = unit.document->roots()[0].properties();
  ASSERT_NE(props.find("font-weight"), nullptr);
  EXPECT_EQ(*props.find("font-weight"), Value::make_string("bold"));
  EXPECT_EQ(*props.find("margin"), Value::make_string("auto"));
  EXPECT_EQ(*unit.document->variables().find("margin"), Value::make_string("auto"));
}

TEST(DocumentResolver, ShortColorsEqualTheirLongForms)
{
  auto unit = resolve("layout div { a: #abc; b: #aabbcc; c: #abcd; d: #aabbccdd; }");
  ASSERT_NE(unit.document, nullptr);

  const PropertyMap & props = unit.document->roots()[0].properties();
  EXPECT_EQ(*props.find("a"), *props.find("b"));
  EXPECT_EQ(*props.find("c"), *props.find("d"));
  EXPECT_EQ(*props.find("c"), Value::make_color({0xaa, 0xbb, 0xcc, 0xdd}));
}
