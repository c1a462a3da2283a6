#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "neko_ui/value/value.hpp"

using namespace neko_ui;

TEST(ValueModel, EqualityRequiresSameKind)
{
  EXPECT_EQ(Value::make_integer(1), Value::make_integer(1));
  EXPECT_NE(Value::make_integer(1), Value::make_float(1.0));
  EXPECT_NE(Value::make_pixels(50), Value::make_percentage(50));
  EXPECT_NE(Value::make_string("x"), Value::make_variable_ref("x"));
  EXPECT_EQ(Value::make_color({1, 2, 3, 4}), Value::make_color({1, 2, 3, 4}));
  EXPECT_NE(Value::make_color({1, 2, 3, 255}), Value::make_color({1, 2, 3, 254}));
}

TEST(ValueModel, DefaultIsEmptyString)
{
  const Value v;
  EXPECT_TRUE(v.is_string());
  EXPECT_EQ(v.as_string(), "");
}

TEST(ValueModel, AccessorsOfOtherKindsAreNeutral)
{
  const Value v = Value::make_bool(true);
  EXPECT_EQ(v.as_integer(), 0);
  EXPECT_TRUE(v.as_list().empty());
  EXPECT_TRUE(v.as_dict().empty());
  EXPECT_EQ(v.as_string(), "");
}

TEST(ValueModel, NestedEquality)
{
  PropertyMap a;
  a.set("x", Value::make_integer(1));
  a.set("y", Value::make_list({Value::make_bool(true), Value::make_string("s")}));

  PropertyMap b;
  b.set("y", Value::make_list({Value::make_bool(true), Value::make_string("s")}));
  b.set("x", Value::make_integer(1));

  // Key order does not matter for equality
  EXPECT_EQ(Value::make_dict(a), Value::make_dict(b));

  b.set("x", Value::make_integer(2));
  EXPECT_NE(Value::make_dict(a), Value::make_dict(b));

  // List order does
  EXPECT_NE(
    Value::make_list({Value::make_integer(1), Value::make_integer(2)}),
    Value::make_list({Value::make_integer(2), Value::make_integer(1)}));
}

TEST(ValueModel, ContainsVariableRef)
{
  PropertyMap inner;
  inner.set("c", Value::make_variable_ref("accent"));
  const Value nested = Value::make_list({Value::make_integer(1), Value::make_dict(inner)});
  EXPECT_TRUE(nested.contains_variable_ref());
  EXPECT_FALSE(Value::make_list({Value::make_integer(1)}).contains_variable_ref());
}

TEST(ValueModel, PropertyMapSetKeepsPosition)
{
  PropertyMap map;
  EXPECT_FALSE(map.set("a", Value::make_integer(1)));
  EXPECT_FALSE(map.set("b", Value::make_integer(2)));
  EXPECT_TRUE(map.set("a", Value::make_integer(3)));

  ASSERT_EQ(map.size(), 2U);
  EXPECT_EQ(map.begin()->first, "a");
  EXPECT_EQ(*map.find("a"), Value::make_integer(3));
}

TEST(ValueModel, PropertyMapInsertRejectsDuplicates)
{
  PropertyMap map;
  EXPECT_TRUE(map.insert("a", Value::make_integer(1)));
  EXPECT_FALSE(map.insert("a", Value::make_integer(2)));
  EXPECT_EQ(*map.find("a"), Value::make_integer(1));
}

TEST(ValueModel, OverlayReplacesAndAppends)
{
  PropertyMap base;
  base.set("color", Value::make_color({0, 0, 0, 255}));
  base.set("width", Value::make_pixels(10));

  PropertyMap layer;
  layer.set("color", Value::make_color({255, 255, 255, 255}));
  layer.set("height", Value::make_pixels(5));

  base.overlay(layer);
  ASSERT_EQ(base.size(), 3U);
  EXPECT_EQ(base.find("color")->as_color(), (Color{255, 255, 255, 255}));
  EXPECT_TRUE(base.contains("width"));
  EXPECT_TRUE(base.contains("height"));
}

TEST(ValueModel, FormatsInSourceSyntax)
{
  EXPECT_EQ(to_string(Value::make_percentage(50)), "50%");
  EXPECT_EQ(to_string(Value::make_pixels(100)), "100px");
  EXPECT_EQ(to_string(Value::make_pixels(1.5)), "1.5px");
  EXPECT_EQ(to_string(Value::make_float(2)), "2.0");
  EXPECT_EQ(to_string(Value::make_integer(-3)), "-3");
  EXPECT_EQ(to_string(Value::make_bool(false)), "false");
  EXPECT_EQ(to_string(Value::make_color({171, 18, 205, 52})), "#ab12cd34");
  EXPECT_EQ(to_string(Value::make_color({255, 0, 0, 255})), "#ff0000");
  EXPECT_EQ(to_string(Value::make_variable_ref("gap")), "$gap");
}

TEST(ValueModel, StringQuotingPicksFreeDelimiter)
{
  EXPECT_EQ(to_string(Value::make_string("plain")), "\"plain\"");
  EXPECT_EQ(to_string(Value::make_string("say \"hi\"")), "'say \"hi\"'");
  EXPECT_EQ(to_string(Value::make_string("it's \"x\"")), "`it's \"x\"`");
}

TEST(ValueModel, FormatsContainers)
{
  PropertyMap dict;
  dict.set("a", Value::make_percentage(50));
  dict.set("b", Value::make_list({Value::make_integer(1), Value::make_integer(2)}));

  EXPECT_EQ(to_string(Value::make_dict(dict)), "{a: 50%, b: [1, 2]}");
  EXPECT_EQ(to_string(Value::make_list({})), "[]");
  EXPECT_EQ(to_string(PropertyMap{}), "{}");

  std::ostringstream os;
  os << Value::make_pixels(4);
  EXPECT_EQ(os.str(), "4px");
}
