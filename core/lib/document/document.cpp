// neko_ui/document/document.cpp - Selector matching and document model
#include "neko_ui/document/document.hpp"

#include <algorithm>

namespace neko_ui
{
namespace
{

bool contains(const std::vector<std::string> & list, std::string_view item)
{
  return std::find(list.begin(), list.end(), item) != list.end();
}

}  // namespace

// ============================================================================
// Selector
// ============================================================================

bool Selector::Step::matches(
  std::string_view node_widget, const std::vector<std::string> & node_classes) const
{
  if (widget != node_widget) {
    return false;
  }
  const bool has_required = std::all_of(required.begin(), required.end(), [&](const auto & cls) {
    return contains(node_classes, cls);
  });
  const bool has_excluded = std::any_of(excluded.begin(), excluded.end(), [&](const auto & cls) {
    return contains(node_classes, cls);
  });
  return has_required && !has_excluded;
}

bool Selector::Step::operator==(const Step & other) const
{
  return widget == other.widget && required == other.required && excluded == other.excluded;
}

Selector Selector::descend(Step step) const
{
  Selector out = *this;
  out.steps_.push_back(std::move(step));
  return out;
}

bool Selector::matches(const std::vector<ClassPathEntry> & path) const
{
  if (steps_.empty() || steps_.size() > path.size()) {
    return false;
  }
  const size_t offset = path.size() - steps_.size();
  for (size_t i = 0; i < steps_.size(); ++i) {
    const ClassPathEntry & entry = path[offset + i];
    static const std::vector<std::string> k_no_classes;
    const auto & classes = entry.classes != nullptr ? *entry.classes : k_no_classes;
    if (!steps_[i].matches(entry.widget, classes)) {
      return false;
    }
  }
  return true;
}

bool Selector::mentions_class(std::string_view cls) const
{
  return std::any_of(steps_.begin(), steps_.end(), [&](const Step & step) {
    return contains(step.required, cls) || contains(step.excluded, cls);
  });
}

std::string to_string(const Selector & selector)
{
  std::string out;
  for (const auto & step : selector.steps()) {
    if (!out.empty()) {
      out += ' ';
    }
    out += step.widget;
    for (const auto & cls : step.required) {
      out += '+' + cls;
    }
    for (const auto & cls : step.excluded) {
      out += '!' + cls;
    }
  }
  return out;
}

// ============================================================================
// StyleSheet
// ============================================================================

void StyleSheet::append(const StyleSheet & other)
{
  guides_.insert(guides_.end(), other.guides_.begin(), other.guides_.end());
}

bool StyleSheet::mentions_class(std::string_view cls) const
{
  return std::any_of(guides_.begin(), guides_.end(), [&](const StyleGuide & guide) {
    return guide.selector.mentions_class(cls);
  });
}

void StyleSheet::apply(const std::vector<ClassPathEntry> & path, PropertyMap & out) const
{
  for (const auto & guide : guides_) {
    if (guide.selector.matches(path)) {
      out.overlay(guide.properties);
    }
  }
}

// ============================================================================
// LayoutNode
// ============================================================================

bool LayoutNode::has_class(std::string_view cls) const { return contains(classes_, cls); }

bool LayoutNode::operator==(const LayoutNode & other) const
{
  return widget_ == other.widget_ && classes_ == other.classes_ &&
         properties_ == other.properties_ && children_ == other.children_;
}

}  // namespace neko_ui
