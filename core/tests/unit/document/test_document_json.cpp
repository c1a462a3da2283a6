#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "neko_ui/document/document_json.hpp"
#include "neko_ui/test_support/parse_helpers.hpp"

using namespace neko_ui;
using test_support::resolve;

TEST(DocumentJson, ValueKinds)
{
  EXPECT_EQ(
    to_json(Value::make_pixels(100)), (nlohmann::json{{"kind", "pixels"}, {"value", 100.0}}));
  EXPECT_EQ(to_json(Value::make_integer(-3))["value"], -3);
  EXPECT_EQ(to_json(Value::make_bool(true))["kind"], "boolean");

  // Colors always carry their alpha channel
  EXPECT_EQ(to_json(Value::make_color({255, 0, 0, 255}))["value"], "#ff0000ff");

  const nlohmann::json list =
    to_json(Value::make_list({Value::make_string("a"), Value::make_percentage(5)}));
  EXPECT_EQ(list["kind"], "list");
  ASSERT_EQ(list["value"].size(), 2U);
  EXPECT_EQ(list["value"][1]["kind"], "percentage");
}

TEST(DocumentJson, WholeDocument)
{
  auto unit = resolve(
    "var gap = 2px;\n"
    "style div +box { pad: $gap; }\n"
    "layout div { class box; layout p { text: 'hi'; } }\n");
  ASSERT_NE(unit.document, nullptr);

  const nlohmann::json j = to_json(*unit.document);
  ASSERT_EQ(j["roots"].size(), 1U);

  const auto & div = j["roots"][0];
  EXPECT_EQ(div["widget"], "div");
  EXPECT_EQ(div["classes"], nlohmann::json::array({"box"}));
  EXPECT_EQ(div["properties"]["pad"]["value"], 2.0);
  ASSERT_EQ(div["children"].size(), 1U);
  EXPECT_EQ(div["children"][0]["properties"]["text"]["value"], "hi");

  EXPECT_EQ(j["variables"]["gap"]["kind"], "pixels");
  ASSERT_EQ(j["styles"].size(), 1U);
  EXPECT_EQ(j["styles"][0]["selector"], "div+box");
}
