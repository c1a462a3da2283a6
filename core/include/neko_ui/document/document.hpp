// neko_ui/document/document.hpp - Resolved document model
//
// A Document is the output of one parse + resolve pass: a forest of
// LayoutNodes with flattened property maps, the top-level variables and the
// style sheet that was applied. Documents are immutable and shared through
// std::shared_ptr<const Document>.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "neko_ui/value/value.hpp"

namespace neko_ui
{

// ============================================================================
// Selector
// ============================================================================

/// Widget and classes of one node on the path from a root to a node.
struct ClassPathEntry
{
  std::string_view widget;
  const std::vector<std::string> * classes = nullptr;
};

/**
 * Style selector: a hierarchy of steps, outermost first.
 *
 * `style div +panel { with p !muted { ... } }` yields the two-step selector
 * `div+panel p!muted`, which matches a `p` without class `muted` whose
 * direct parent is a `div` with class `panel`.
 */
class Selector
{
public:
  struct Step
  {
    std::string widget;
    std::vector<std::string> required;
    std::vector<std::string> excluded;

    /// Widget equal, every required class present, every excluded class absent
    [[nodiscard]] bool matches(
      std::string_view node_widget, const std::vector<std::string> & node_classes) const;

    [[nodiscard]] bool operator==(const Step & other) const;
    [[nodiscard]] bool operator!=(const Step & other) const { return !(*this == other); }
  };

  Selector() = default;
  explicit Selector(std::vector<Step> steps) : steps_(std::move(steps)) {}

  [[nodiscard]] const std::vector<Step> & steps() const noexcept { return steps_; }
  [[nodiscard]] bool empty() const noexcept { return steps_.empty(); }

  /// Copy of this selector with one more (innermost) step
  [[nodiscard]] Selector descend(Step step) const;

  /// The path must end with the selector's steps, contiguously.
  [[nodiscard]] bool matches(const std::vector<ClassPathEntry> & path) const;

  /// True if any step requires or excludes `cls`
  [[nodiscard]] bool mentions_class(std::string_view cls) const;

  [[nodiscard]] bool operator==(const Selector & other) const { return steps_ == other.steps_; }
  [[nodiscard]] bool operator!=(const Selector & other) const { return !(*this == other); }

private:
  std::vector<Step> steps_;
};

/// Selector in source form, e.g. `div+panel p!muted`
[[nodiscard]] std::string to_string(const Selector & selector);

// ============================================================================
// StyleGuide / StyleSheet
// ============================================================================

struct StyleGuide
{
  Selector selector;
  PropertyMap properties;

  [[nodiscard]] bool operator==(const StyleGuide & other) const
  {
    return selector == other.selector && properties == other.properties;
  }
  [[nodiscard]] bool operator!=(const StyleGuide & other) const { return !(*this == other); }
};

/**
 * Ordered collection of StyleGuides; later guides have higher precedence.
 *
 * Guides with equal selectors are kept separately so precedence follows
 * declaration order exactly.
 */
class StyleSheet
{
public:
  void add(StyleGuide guide) { guides_.push_back(std::move(guide)); }

  /// Append every guide of `other` after the existing ones.
  void append(const StyleSheet & other);

  [[nodiscard]] const std::vector<StyleGuide> & guides() const noexcept { return guides_; }
  [[nodiscard]] size_t size() const noexcept { return guides_.size(); }
  [[nodiscard]] bool empty() const noexcept { return guides_.empty(); }

  [[nodiscard]] bool mentions_class(std::string_view cls) const;

  /// Overlay the properties of every guide matching `path` onto `out`, in order.
  void apply(const std::vector<ClassPathEntry> & path, PropertyMap & out) const;

  [[nodiscard]] bool operator==(const StyleSheet & other) const { return guides_ == other.guides_; }
  [[nodiscard]] bool operator!=(const StyleSheet & other) const { return !(*this == other); }

private:
  std::vector<StyleGuide> guides_;
};

// ============================================================================
// LayoutNode
// ============================================================================

/// One widget instance with its effective (cascaded) properties.
class LayoutNode
{
public:
  LayoutNode(
    std::string widget, std::vector<std::string> classes, PropertyMap properties,
    std::vector<LayoutNode> children)
  : widget_(std::move(widget)),
    classes_(std::move(classes)),
    properties_(std::move(properties)),
    children_(std::move(children))
  {
  }

  [[nodiscard]] const std::string & widget() const noexcept { return widget_; }
  [[nodiscard]] const std::vector<std::string> & classes() const noexcept { return classes_; }
  [[nodiscard]] const PropertyMap & properties() const noexcept { return properties_; }
  [[nodiscard]] const std::vector<LayoutNode> & children() const noexcept { return children_; }

  [[nodiscard]] bool has_class(std::string_view cls) const;
  [[nodiscard]] const Value * property(std::string_view name) const noexcept
  {
    return properties_.find(name);
  }

  /// Structural equality; source positions are not part of a node
  [[nodiscard]] bool operator==(const LayoutNode & other) const;
  [[nodiscard]] bool operator!=(const LayoutNode & other) const { return !(*this == other); }

private:
  std::string widget_;
  std::vector<std::string> classes_;
  PropertyMap properties_;
  std::vector<LayoutNode> children_;
};

// ============================================================================
// Document
// ============================================================================

class Document
{
public:
  Document(std::vector<LayoutNode> roots, PropertyMap variables, StyleSheet styles)
  : roots_(std::move(roots)), variables_(std::move(variables)), styles_(std::move(styles))
  {
  }

  [[nodiscard]] const std::vector<LayoutNode> & roots() const noexcept { return roots_; }
  /// Top-level bindings (imported ones included), already resolved
  [[nodiscard]] const PropertyMap & variables() const noexcept { return variables_; }
  /// Every style guide that was in scope, in precedence order
  [[nodiscard]] const StyleSheet & styles() const noexcept { return styles_; }

  [[nodiscard]] bool operator==(const Document & other) const
  {
    return roots_ == other.roots_ && variables_ == other.variables_ && styles_ == other.styles_;
  }
  [[nodiscard]] bool operator!=(const Document & other) const { return !(*this == other); }

private:
  std::vector<LayoutNode> roots_;
  PropertyMap variables_;
  StyleSheet styles_;
};

using DocumentPtr = std::shared_ptr<const Document>;

}  // namespace neko_ui
