// neko_ui/document/widget_registry.hpp - Known widget types and their defaults
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "neko_ui/value/value.hpp"

namespace neko_ui
{

/**
 * Widgets the host can render, each with default properties.
 *
 * When a registry is passed to the resolver, layouts and style selectors
 * naming an unregistered widget are errors, and each node's cascade starts
 * from its widget's defaults.
 */
class WidgetRegistry
{
public:
  WidgetRegistry() = default;

  /// Registry holding the native widgets `div`, `img`, `p` and `span`.
  [[nodiscard]] static WidgetRegistry with_native_widgets();

  /// Register (or replace) a widget. Returns true if it was already known.
  bool register_widget(std::string name, PropertyMap defaults = {});

  [[nodiscard]] bool contains(std::string_view name) const;

  /// Defaults of a registered widget, nullptr if unknown
  [[nodiscard]] const PropertyMap * defaults(std::string_view name) const;

  /// Registered names in registration order
  [[nodiscard]] const std::vector<std::string> & names() const noexcept { return order_; }
  [[nodiscard]] size_t size() const noexcept { return order_.size(); }

private:
  std::unordered_map<std::string, PropertyMap> widgets_;
  std::vector<std::string> order_;
};

}  // namespace neko_ui
