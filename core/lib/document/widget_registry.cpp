// neko_ui/document/widget_registry.cpp - Widget registry implementation
#include "neko_ui/document/widget_registry.hpp"

#include <utility>

namespace neko_ui
{

WidgetRegistry WidgetRegistry::with_native_widgets()
{
  WidgetRegistry registry;
  for (const char * name : {"div", "img", "p", "span"}) {
    registry.register_widget(name);
  }
  return registry;
}

bool WidgetRegistry::register_widget(std::string name, PropertyMap defaults)
{
  if (const auto it = widgets_.find(name); it != widgets_.end()) {
    it->second = std::move(defaults);
    return true;
  }
  order_.push_back(name);
  widgets_.emplace(std::move(name), std::move(defaults));
  return false;
}

bool WidgetRegistry::contains(std::string_view name) const
{
  return widgets_.find(std::string(name)) != widgets_.end();
}

const PropertyMap * WidgetRegistry::defaults(std::string_view name) const
{
  const auto it = widgets_.find(std::string(name));
  return it != widgets_.end() ? &it->second : nullptr;
}

}  // namespace neko_ui
