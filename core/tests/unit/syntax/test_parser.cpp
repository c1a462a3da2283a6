#include <gtest/gtest.h>

#include <string>

#include "neko_ui/ast/ast.hpp"
#include "neko_ui/basic/casting.hpp"
#include "neko_ui/syntax/frontend.hpp"
#include "neko_ui/test_support/parse_helpers.hpp"

using namespace neko_ui;
using test_support::parse;

namespace
{

const Expr * first_property_value(const LayoutDecl * layout)
{
  for (const auto * item : layout->body) {
    if (const auto * prop = dyn_cast<PropertyAssign>(item)) {
      return prop->value;
    }
  }
  return nullptr;
}

/// Value of `var x = <src>;`
const Expr * parse_var_value(test_support::TestParseUnit & unit)
{
  if (unit.program == nullptr || unit.program->decls.size() != 1) {
    return nullptr;
  }
  const auto * var = dyn_cast<VarDecl>(unit.program->decls[0]);
  return var != nullptr ? var->value : nullptr;
}

}  // namespace

TEST(SyntaxParser, EmptyProgram)
{
  auto unit = parse("");
  ASSERT_NE(unit.program, nullptr);
  EXPECT_TRUE(unit.success);
  EXPECT_TRUE(unit.program->decls.empty());
}

TEST(SyntaxParser, LayoutWithProperties)
{
  auto unit = parse(
    "layout div {\n"
    "  width: 50%;\n"
    "  height: 100px;\n"
    "  color: #ab12cd34;\n"
    "}\n");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.program->decls.size(), 1U);

  const auto * layout = dyn_cast<LayoutDecl>(unit.program->decls[0]);
  ASSERT_NE(layout, nullptr);
  EXPECT_EQ(layout->widget, "div");
  EXPECT_TRUE(layout->hasBlock);
  ASSERT_EQ(layout->body.size(), 3U);

  const auto * width = cast<PropertyAssign>(layout->body[0]);
  EXPECT_EQ(width->name, "width");
  const auto * pct = dyn_cast<PercentLiteralExpr>(width->value);
  ASSERT_NE(pct, nullptr);
  EXPECT_DOUBLE_EQ(pct->value, 50.0);

  const auto * height = cast<PropertyAssign>(layout->body[1]);
  const auto * px = dyn_cast<PixelLiteralExpr>(height->value);
  ASSERT_NE(px, nullptr);
  EXPECT_DOUBLE_EQ(px->value, 100.0);

  const auto * color = dyn_cast<ColorLiteralExpr>(cast<PropertyAssign>(layout->body[2])->value);
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(color->r, 171);
  EXPECT_EQ(color->g, 18);
  EXPECT_EQ(color->b, 205);
  EXPECT_EQ(color->a, 52);
}

TEST(SyntaxParser, LayoutWithoutBlock)
{
  auto unit = parse("layout img;");
  ASSERT_TRUE(unit.success);
  const auto * layout = cast<LayoutDecl>(unit.program->decls[0]);
  EXPECT_FALSE(layout->hasBlock);
  EXPECT_TRUE(layout->body.empty());
}

TEST(SyntaxParser, ShortColorExpandsNibbles)
{
  auto unit = parse("layout div { a: #abc; b: #abcd; }");
  ASSERT_TRUE(unit.success);
  const auto * layout = cast<LayoutDecl>(unit.program->decls[0]);

  const auto * abc = cast<ColorLiteralExpr>(cast<PropertyAssign>(layout->body[0])->value);
  EXPECT_EQ(abc->r, 0xaa);
  EXPECT_EQ(abc->g, 0xbb);
  EXPECT_EQ(abc->b, 0xcc);
  EXPECT_EQ(abc->a, 255);

  const auto * abcd = cast<ColorLiteralExpr>(cast<PropertyAssign>(layout->body[1])->value);
  EXPECT_EQ(abcd->r, 0xaa);
  EXPECT_EQ(abcd->g, 0xbb);
  EXPECT_EQ(abcd->b, 0xcc);
  EXPECT_EQ(abcd->a, 0xdd);
}

TEST(SyntaxParser, BareIdentifierIsStringValue)
{
  auto unit = parse(
    "var margin = auto;
"
    "layout div { font-weight: bold; align: [start, center]; }
");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.program->decls.size(), 2U);

  const auto * margin = dyn_cast<StringLiteralExpr>(cast<VarDecl>(unit.program->decls[0])->value);
  ASSERT_NE(margin, nullptr);
  EXPECT_EQ(margin->value, "auto");

  const auto * layout = cast<LayoutDecl>(unit.program->decls[1]);
  const auto * weight = dyn_cast<StringLiteralExpr>(first_property_value(layout));
  ASSERT_NE(weight, nullptr);
  EXPECT_EQ(weight->value, "bold");

  const auto * align = cast<ListExpr>(cast<PropertyAssign>(layout->body[1])->value);
  ASSERT_EQ(align->elements.size(), 2U);
  EXPECT_EQ(cast<StringLiteralExpr>(align->elements[1])->value, "center");
}

TEST(SyntaxParser, ScalarLiterals)
{
  auto unit = parse(
    "layout p {\n"
    "  text: 'hi';\n"
    "  count: -12;\n"
    "  ratio: 0.75;\n"
    "  visible: false;\n"
    "  tint: $accent;\n"
    "}\n");
  ASSERT_TRUE(unit.success);
  const auto * layout = cast<LayoutDecl>(unit.program->decls[0]);
  ASSERT_EQ(layout->body.size(), 5U);

  EXPECT_EQ(cast<StringLiteralExpr>(cast<PropertyAssign>(layout->body[0])->value)->value, "hi");
  EXPECT_EQ(cast<IntLiteralExpr>(cast<PropertyAssign>(layout->body[1])->value)->value, -12);
  EXPECT_DOUBLE_EQ(
    cast<FloatLiteralExpr>(cast<PropertyAssign>(layout->body[2])->value)->value, 0.75);
  EXPECT_FALSE(cast<BoolLiteralExpr>(cast<PropertyAssign>(layout->body[3])->value)->value);
  EXPECT_EQ(cast<VarRefExpr>(cast<PropertyAssign>(layout->body[4])->value)->name, "accent");
}

TEST(SyntaxParser, ListTrailingComma)
{
  auto with_comma = parse("var x = [1, 2, 3,];");
  auto without_comma = parse("var x = [1, 2, 3];");
  ASSERT_TRUE(with_comma.success);
  ASSERT_TRUE(without_comma.success);

  const auto * a = dyn_cast<ListExpr>(parse_var_value(with_comma));
  const auto * b = dyn_cast<ListExpr>(parse_var_value(without_comma));
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  ASSERT_EQ(a->elements.size(), 3U);
  ASSERT_EQ(b->elements.size(), 3U);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(
      cast<IntLiteralExpr>(a->elements[i])->value, cast<IntLiteralExpr>(b->elements[i])->value);
  }
}

TEST(SyntaxParser, EmptyListAndDict)
{
  auto unit = parse("var x = [[], {}];");
  ASSERT_TRUE(unit.success);
  const auto * list = cast<ListExpr>(parse_var_value(unit));
  ASSERT_EQ(list->elements.size(), 2U);
  EXPECT_TRUE(cast<ListExpr>(list->elements[0])->elements.empty());
  EXPECT_TRUE(cast<DictExpr>(list->elements[1])->entries.empty());
}

TEST(SyntaxParser, LoneCommaInListIsError)
{
  auto unit = parse("var x = [,];");
  EXPECT_FALSE(unit.success);
  EXPECT_TRUE(unit.diags.has_errors_in(DiagnosticPhase::Parse));
}

TEST(SyntaxParser, NestedDict)
{
  auto unit = parse("var x = {pad: {top: 4px, left: 2px,}, tags: ['a', \"b\"]};");
  ASSERT_TRUE(unit.success);
  const auto * dict = cast<DictExpr>(parse_var_value(unit));
  ASSERT_EQ(dict->entries.size(), 2U);
  EXPECT_EQ(dict->entries[0]->key, "pad");
  EXPECT_EQ(cast<DictExpr>(dict->entries[0]->value)->entries.size(), 2U);
  EXPECT_EQ(dict->entries[1]->key, "tags");
}

TEST(SyntaxParser, DuplicateDictKeyIsError)
{
  // Equal values must not matter
  for (const char * src : {"var x = {a: 1, a: 1};", "var x = {a: 1, a: 'two'};"}) {
    auto unit = parse(src);
    EXPECT_FALSE(unit.success) << src;
    EXPECT_EQ(unit.program, nullptr);
    const Diagnostic * err = unit.diags.first_error();
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->code, "P003");
    EXPECT_EQ(err->phase, DiagnosticPhase::Parse);
    EXPECT_NE(err->message.find("'a'"), std::string::npos);
  }
}

TEST(SyntaxParser, ClassesAndChildren)
{
  auto unit = parse(
    "layout div {\n"
    "  class panel;\n"
    "  var gap = 4px;\n"
    "  layout p { text: 'x'; }\n"
    "  with span;\n"
    "}\n");
  ASSERT_TRUE(unit.success);
  const auto * layout = cast<LayoutDecl>(unit.program->decls[0]);
  ASSERT_EQ(layout->body.size(), 4U);
  EXPECT_EQ(cast<ClassAttr>(layout->body[0])->name, "panel");
  EXPECT_EQ(cast<VarDecl>(layout->body[1])->name, "gap");
  EXPECT_EQ(cast<LayoutDecl>(layout->body[2])->widget, "p");
  EXPECT_EQ(cast<LayoutDecl>(layout->body[3])->widget, "span");
}

TEST(SyntaxParser, StyleSelectorsAndNesting)
{
  auto unit = parse(
    "style div +panel !hidden {\n"
    "  color: #000;\n"
    "  with p !muted {\n"
    "    color: #333;\n"
    "  }\n"
    "}\n");
  ASSERT_TRUE(unit.success);
  const auto * style = cast<StyleDecl>(unit.program->decls[0]);
  EXPECT_EQ(style->step->widget, "div");
  ASSERT_EQ(style->step->required.size(), 1U);
  EXPECT_EQ(style->step->required[0], "panel");
  ASSERT_EQ(style->step->excluded.size(), 1U);
  EXPECT_EQ(style->step->excluded[0], "hidden");

  ASSERT_EQ(style->body.size(), 2U);
  const auto * nested = dyn_cast<NestedStyle>(style->body[1]);
  ASSERT_NE(nested, nullptr);
  EXPECT_EQ(nested->step->widget, "p");
  EXPECT_EQ(nested->step->excluded[0], "muted");
  EXPECT_EQ(nested->body.size(), 1U);
}

TEST(SyntaxParser, ImportDecl)
{
  auto unit = parse("import \"theme.nui\";\nlayout div;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.program->decls.size(), 2U);
  EXPECT_EQ(cast<ImportDecl>(unit.program->decls[0])->path, "theme.nui");
}

TEST(SyntaxParser, MissingSemicolonHasFixit)
{
  auto unit = parse("layout div {\n  width: 50%\n  height: 10px;\n}\n");
  EXPECT_FALSE(unit.success);
  EXPECT_EQ(unit.program, nullptr);

  const Diagnostic * err = unit.diags.first_error();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, "P002");
  EXPECT_EQ(err->expected, "';'");
  EXPECT_EQ(err->found, "'height'");
  ASSERT_EQ(err->fixits.size(), 1U);
  EXPECT_EQ(err->fixits[0].replacement_text, ";");

  // Reported on the line that lacks the semicolon
  const auto range = unit.full_range(err->primary_range());
  EXPECT_EQ(range.start_line, 2U);
}

TEST(SyntaxParser, UnexpectedTokenReportsExpectation)
{
  auto unit = parse("widget div;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * err = unit.diags.first_error();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, "P001");
  EXPECT_EQ(err->found, "'widget'");
  EXPECT_NE(err->expected.find("'layout'"), std::string::npos);
}

TEST(SyntaxParser, DefaultModeStopsAtFirstError)
{
  auto unit = parse("layout div { a: ; }\nlayout p { b: ; }\n");
  EXPECT_EQ(unit.program, nullptr);
  EXPECT_EQ(unit.diags.error_count(), 1U);
}

TEST(SyntaxParser, LexErrorFailsParse)
{
  auto unit = parse("layout div { width: .5; }");
  EXPECT_FALSE(unit.success);
  EXPECT_EQ(unit.program, nullptr);
  EXPECT_TRUE(unit.diags.has_errors_in(DiagnosticPhase::Lex));
  // The parser does not pile a second error on the malformed token
  EXPECT_EQ(unit.diags.error_count(), 1U);
}

TEST(SyntaxParser, DuplicatePropertyIsWarning)
{
  auto unit = parse("layout div { width: 1px; width: 2px; }");
  EXPECT_TRUE(unit.success);
  ASSERT_TRUE(unit.diags.has_warnings());
  EXPECT_EQ(unit.diags.warning_count(), 1U);
  const Diagnostic & warning = unit.diags.all()[0];
  EXPECT_EQ(warning.severity, Severity::Warning);
  EXPECT_EQ(warning.code, "P004");
  EXPECT_EQ(warning.labels.size(), 2U);
}

TEST(SyntaxParser, IntegerOverflow)
{
  auto unit = parse("var big = 99999999999999999999;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * err = unit.diags.first_error();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, "P005");
}

TEST(SyntaxParser, RangesCoverDeclarations)
{
  auto unit = parse("var accent = #fff;");
  ASSERT_TRUE(unit.success);
  const auto * var = cast<VarDecl>(unit.program->decls[0]);
  EXPECT_EQ(unit.slice(var->get_range()), "var accent = #fff;");
  EXPECT_EQ(unit.slice(var->nameRange), "accent");
}

TEST(SyntaxParser, NestingWithinLimitParses)
{
  syntax::ParseOptions options;
  options.max_depth = 8;
  const std::string src = "var x = " + std::string(8, '[') + std::string(8, ']') + ";";
  auto unit = parse(src, options);
  EXPECT_TRUE(unit.success);
}

TEST(SyntaxParser, NestingPastLimitIsError)
{
  syntax::ParseOptions options;
  options.max_depth = 8;
  const std::string src = "var x = " + std::string(9, '[') + std::string(9, ']') + ";";
  auto unit = parse(src, options);
  EXPECT_FALSE(unit.success);
  ASSERT_EQ(unit.diags.error_count(), 1U);
  const Diagnostic * err = unit.diags.first_error();
  EXPECT_EQ(err->code, "P006");
  EXPECT_EQ(err->phase, DiagnosticPhase::Parse);
  // Points at the bracket that opened the ninth level
  EXPECT_EQ(unit.full_range(err->primary_range()).start_column, 17U);
}

TEST(SyntaxParser, DeeplyNestedInputFailsCleanly)
{
  constexpr size_t k_levels = 100000;

  std::string lists = "var x = " + std::string(k_levels, '[') + std::string(k_levels, ']') + ";";
  auto list_unit = parse(lists);
  EXPECT_FALSE(list_unit.success);
  EXPECT_EQ(list_unit.diags.first_error()->code, "P006");

  std::string layouts;
  for (size_t i = 0; i < k_levels; ++i) {
    layouts += "layout div {";
  }
  layouts += std::string(k_levels, '}');
  auto layout_unit = parse(layouts);
  EXPECT_FALSE(layout_unit.success);
  EXPECT_EQ(layout_unit.diags.first_error()->code, "P006");

  std::string dicts = "layout div { d: ";
  for (size_t i = 0; i < k_levels; ++i) {
    dicts += "{k: ";
  }
  dicts += "1" + std::string(k_levels, '}') + "; }";
  auto dict_unit = parse(dicts);
  EXPECT_FALSE(dict_unit.success);
  EXPECT_EQ(dict_unit.diags.first_error()->code, "P006");
}

TEST(SyntaxParser, DeepNestingWithRecoveryStillReturns)
{
  syntax::ParseOptions options;
  options.recover = true;
  options.max_depth = 4;
  auto unit = parse("var x = [[[[[1]]]]];
var y = 2;
", options);
  EXPECT_FALSE(unit.success);
  ASSERT_NE(unit.program, nullptr);
  EXPECT_TRUE(unit.diags.has_errors_in(DiagnosticPhase::Parse));
  EXPECT_EQ(cast<VarDecl>(unit.program->decls.back())->name, "y");
}
