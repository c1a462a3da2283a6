// neko_ui/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for any AST node; used by `nekoc ast` and
// the parser tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "neko_ui/ast/ast.hpp"

namespace neko_ui
{

/**
 * Serialize an AST node to JSON.
 *
 * Every object carries "type" (the node class name) and "range"
 * ({"start", "end"} byte offsets).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a Program node including all its declarations.
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace neko_ui
