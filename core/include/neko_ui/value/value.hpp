// neko_ui/value/value.hpp - Property values
//
// Values are immutable once built. Lists and dicts share their storage, so
// copying a Value is cheap and documents can hand values out by copy.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace neko_ui
{

class PropertyMap;

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  String,
  Integer,
  Float,
  Percentage,
  Pixels,
  Boolean,
  Color,
  List,
  Dict,
  VariableRef,
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

// ============================================================================
// Color
// ============================================================================

/// 8-bit RGBA color; alpha 255 is opaque.
struct Color
{
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;

  [[nodiscard]] constexpr bool operator==(const Color & o) const noexcept
  {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
  [[nodiscard]] constexpr bool operator!=(const Color & o) const noexcept { return !(*this == o); }
};

// ============================================================================
// Value
// ============================================================================

/**
 * Tagged union over every literal form of the language.
 *
 * Percentage and Pixels carry the number as written (`50%` holds 50.0).
 * VariableRef only appears in unresolved values; a resolved Document never
 * contains one.
 */
class Value
{
public:
  using List = std::vector<Value>;

  /// Default constructor creates an empty string
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_string(std::string text);
  static Value make_integer(int64_t v);
  static Value make_float(double v);
  static Value make_percentage(double v);
  static Value make_pixels(double v);
  static Value make_bool(bool v);
  static Value make_color(Color c);
  static Value make_list(List elements);
  static Value make_dict(PropertyMap entries);
  static Value make_variable_ref(std::string name);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
  [[nodiscard]] bool is_percentage() const noexcept { return kind_ == ValueKind::Percentage; }
  [[nodiscard]] bool is_pixels() const noexcept { return kind_ == ValueKind::Pixels; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Boolean; }
  [[nodiscard]] bool is_color() const noexcept { return kind_ == ValueKind::Color; }
  [[nodiscard]] bool is_list() const noexcept { return kind_ == ValueKind::List; }
  [[nodiscard]] bool is_dict() const noexcept { return kind_ == ValueKind::Dict; }
  [[nodiscard]] bool is_variable_ref() const noexcept { return kind_ == ValueKind::VariableRef; }

  /// True if this value or any nested element is a VariableRef
  [[nodiscard]] bool contains_variable_ref() const;

  // ===========================================================================
  // Value Accessors (only meaningful for the matching kind)
  // ===========================================================================

  /// String contents, or the name of a VariableRef
  [[nodiscard]] const std::string & as_string() const noexcept;
  [[nodiscard]] int64_t as_integer() const noexcept;
  /// Number of a Float, Percentage or Pixels value
  [[nodiscard]] double as_number() const noexcept;
  [[nodiscard]] bool as_bool() const noexcept;
  [[nodiscard]] Color as_color() const noexcept;
  [[nodiscard]] const List & as_list() const noexcept;
  [[nodiscard]] const PropertyMap & as_dict() const noexcept;

  // ===========================================================================
  // Comparison
  // ===========================================================================

  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  using Storage = std::variant<
    std::string, int64_t, double, bool, Color, std::shared_ptr<const List>,
    std::shared_ptr<const PropertyMap>>;

  Value(ValueKind kind, Storage storage) : kind_(kind), storage_(std::move(storage)) {}

  ValueKind kind_ = ValueKind::String;
  Storage storage_;
};

// ============================================================================
// PropertyMap
// ============================================================================

/**
 * Mapping from property name to Value with unique keys.
 *
 * Iteration follows insertion order; equality ignores it. Overwriting an
 * existing key keeps the key's original position.
 */
class PropertyMap
{
public:
  using Entry = std::pair<std::string, Value>;
  using const_iterator = std::vector<Entry>::const_iterator;

  PropertyMap() = default;

  /// Insert or overwrite. Returns true if the key already existed.
  bool set(std::string_view key, Value value);

  /// Insert only if absent. Returns false (and changes nothing) on a duplicate.
  bool insert(std::string_view key, Value value);

  /// Overwrite this map's entries with every entry of `layer`.
  void overlay(const PropertyMap & layer);

  [[nodiscard]] const Value * find(std::string_view key) const noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

  [[nodiscard]] bool operator==(const PropertyMap & other) const;
  [[nodiscard]] bool operator!=(const PropertyMap & other) const { return !(*this == other); }

private:
  std::vector<Entry> entries_;
};

// ============================================================================
// Formatting
// ============================================================================

/// Render a value in source syntax, e.g. `#ab12cd34`, `[1, 2]`, `{a: 50%}`.
[[nodiscard]] std::string to_string(const Value & value);
[[nodiscard]] std::string to_string(const PropertyMap & map);
[[nodiscard]] std::string to_string(Color color);

std::ostream & operator<<(std::ostream & os, const Value & value);
std::ostream & operator<<(std::ostream & os, const PropertyMap & map);

}  // namespace neko_ui
