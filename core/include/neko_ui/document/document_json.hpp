// neko_ui/document/document_json.hpp - JSON serialization for resolved documents
#pragma once

#include <nlohmann/json.hpp>

#include "neko_ui/document/document.hpp"
#include "neko_ui/value/value.hpp"

namespace neko_ui
{

/// {"kind": "pixels", "value": 100}; lists and dicts nest, colors are "#rrggbbaa"
[[nodiscard]] nlohmann::json to_json(const Value & value);

/// {"widget", "classes", "properties", "children"}
[[nodiscard]] nlohmann::json to_json(const LayoutNode & node);

/**
 * Serialize a whole document: roots, top-level variables and the style
 * sheet in precedence order. Used by `nekoc dump` and external tooling.
 */
[[nodiscard]] nlohmann::json to_json(const Document & document);

}  // namespace neko_ui
