// neko_ui/document/document_json.cpp - JSON serialization implementation
#include "neko_ui/document/document_json.hpp"

#include <fmt/core.h>

#include <string>

namespace neko_ui
{
namespace
{

using nlohmann::json;

json j_properties(const PropertyMap & map)
{
  json out = json::object();
  for (const auto & [key, value] : map) {
    out[key] = to_json(value);
  }
  return out;
}

}  // namespace

json to_json(const Value & value)
{
  json j{{"kind", std::string(to_string(value.kind()))}};
  switch (value.kind()) {
    case ValueKind::String:
    case ValueKind::VariableRef:
      j["value"] = value.as_string();
      break;
    case ValueKind::Integer:
      j["value"] = value.as_integer();
      break;
    case ValueKind::Float:
    case ValueKind::Percentage:
    case ValueKind::Pixels:
      j["value"] = value.as_number();
      break;
    case ValueKind::Boolean:
      j["value"] = value.as_bool();
      break;
    case ValueKind::Color: {
      const Color c = value.as_color();
      j["value"] = fmt::format("#{:02x}{:02x}{:02x}{:02x}", c.r, c.g, c.b, c.a);
      break;
    }
    case ValueKind::List: {
      json elems = json::array();
      for (const auto & el : value.as_list()) elems.push_back(to_json(el));
      j["value"] = std::move(elems);
      break;
    }
    case ValueKind::Dict:
      j["value"] = j_properties(value.as_dict());
      break;
  }
  return j;
}

json to_json(const LayoutNode & node)
{
  json children = json::array();
  for (const auto & child : node.children()) children.push_back(to_json(child));

  return json{
    {"widget", node.widget()},
    {"classes", node.classes()},
    {"properties", j_properties(node.properties())},
    {"children", std::move(children)}};
}

json to_json(const Document & document)
{
  json roots = json::array();
  for (const auto & root : document.roots()) roots.push_back(to_json(root));

  json styles = json::array();
  for (const auto & guide : document.styles().guides()) {
    styles.push_back(
      json{
        {"selector", to_string(guide.selector)},
        {"properties", j_properties(guide.properties)}});
  }

  return json{
    {"roots", std::move(roots)},
    {"variables", j_properties(document.variables())},
    {"styles", std::move(styles)}};
}

}  // namespace neko_ui
