// neko_ui/value/value.cpp - Value and PropertyMap implementation
#include "neko_ui/value/value.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <ostream>

namespace neko_ui
{

namespace
{

const std::string & empty_string()
{
  static const std::string k_empty;
  return k_empty;
}

const Value::List & empty_list()
{
  static const Value::List k_empty;
  return k_empty;
}

const PropertyMap & empty_map()
{
  static const PropertyMap k_empty;
  return k_empty;
}

/// Shortest round-trip form; Float keeps a decimal point so it re-lexes as Float.
std::string format_number(double v, bool force_point)
{
  std::string s = fmt::format("{}", v);
  if (force_point && s.find_first_of(".eni") == std::string::npos) {
    s += ".0";
  }
  return s;
}

std::string quote(const std::string & text)
{
  for (const char delim : {'"', '\'', '`'}) {
    if (text.find(delim) == std::string::npos) {
      return fmt::format("{}{}{}", delim, text, delim);
    }
  }
  // Unrepresentable as a single literal; quote with '"' for diagnostics
  return fmt::format("\"{}\"", text);
}

}  // namespace

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::String:
      return "string";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::Percentage:
      return "percentage";
    case ValueKind::Pixels:
      return "pixels";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Color:
      return "color";
    case ValueKind::List:
      return "list";
    case ValueKind::Dict:
      return "dict";
    case ValueKind::VariableRef:
      return "variable reference";
  }
  return "";
}

// ============================================================================
// Value
// ============================================================================

Value Value::make_string(std::string text) { return {ValueKind::String, std::move(text)}; }

Value Value::make_integer(int64_t v) { return {ValueKind::Integer, v}; }

Value Value::make_float(double v) { return {ValueKind::Float, v}; }

Value Value::make_percentage(double v) { return {ValueKind::Percentage, v}; }

Value Value::make_pixels(double v) { return {ValueKind::Pixels, v}; }

Value Value::make_bool(bool v) { return {ValueKind::Boolean, v}; }

Value Value::make_color(Color c) { return {ValueKind::Color, c}; }

Value Value::make_list(List elements)
{
  return {ValueKind::List, std::make_shared<const List>(std::move(elements))};
}

Value Value::make_dict(PropertyMap entries)
{
  return {ValueKind::Dict, std::make_shared<const PropertyMap>(std::move(entries))};
}

Value Value::make_variable_ref(std::string name)
{
  return {ValueKind::VariableRef, std::move(name)};
}

bool Value::contains_variable_ref() const
{
  switch (kind_) {
    case ValueKind::VariableRef:
      return true;
    case ValueKind::List: {
      const auto & elems = as_list();
      return std::any_of(
        elems.begin(), elems.end(), [](const Value & v) { return v.contains_variable_ref(); });
    }
    case ValueKind::Dict: {
      const auto & dict = as_dict();
      return std::any_of(dict.begin(), dict.end(), [](const PropertyMap::Entry & e) {
        return e.second.contains_variable_ref();
      });
    }
    default:
      return false;
  }
}

const std::string & Value::as_string() const noexcept
{
  const auto * s = std::get_if<std::string>(&storage_);
  return s ? *s : empty_string();
}

int64_t Value::as_integer() const noexcept
{
  const auto * v = std::get_if<int64_t>(&storage_);
  return v ? *v : 0;
}

double Value::as_number() const noexcept
{
  if (const auto * d = std::get_if<double>(&storage_)) {
    return *d;
  }
  if (const auto * i = std::get_if<int64_t>(&storage_)) {
    return static_cast<double>(*i);
  }
  return 0.0;
}

bool Value::as_bool() const noexcept
{
  const auto * v = std::get_if<bool>(&storage_);
  return v ? *v : false;
}

Color Value::as_color() const noexcept
{
  const auto * c = std::get_if<Color>(&storage_);
  return c ? *c : Color{};
}

const Value::List & Value::as_list() const noexcept
{
  const auto * l = std::get_if<std::shared_ptr<const List>>(&storage_);
  return (l && *l) ? **l : empty_list();
}

const PropertyMap & Value::as_dict() const noexcept
{
  const auto * d = std::get_if<std::shared_ptr<const PropertyMap>>(&storage_);
  return (d && *d) ? **d : empty_map();
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::String:
    case ValueKind::VariableRef:
      return as_string() == other.as_string();
    case ValueKind::Integer:
      return as_integer() == other.as_integer();
    case ValueKind::Float:
    case ValueKind::Percentage:
    case ValueKind::Pixels:
      return as_number() == other.as_number();
    case ValueKind::Boolean:
      return as_bool() == other.as_bool();
    case ValueKind::Color:
      return as_color() == other.as_color();
    case ValueKind::List:
      return as_list() == other.as_list();
    case ValueKind::Dict:
      return as_dict() == other.as_dict();
  }
  return false;
}

// ============================================================================
// PropertyMap
// ============================================================================

bool PropertyMap::set(std::string_view key, Value value)
{
  for (auto & entry : entries_) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return true;
    }
  }
  entries_.emplace_back(std::string(key), std::move(value));
  return false;
}

bool PropertyMap::insert(std::string_view key, Value value)
{
  if (contains(key)) {
    return false;
  }
  entries_.emplace_back(std::string(key), std::move(value));
  return true;
}

void PropertyMap::overlay(const PropertyMap & layer)
{
  for (const auto & [key, value] : layer) {
    set(key, value);
  }
}

const Value * PropertyMap::find(std::string_view key) const noexcept
{
  for (const auto & entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool PropertyMap::operator==(const PropertyMap & other) const
{
  if (entries_.size() != other.entries_.size()) {
    return false;
  }
  return std::all_of(entries_.begin(), entries_.end(), [&other](const Entry & e) {
    const Value * v = other.find(e.first);
    return v != nullptr && *v == e.second;
  });
}

// ============================================================================
// Formatting
// ============================================================================

std::string to_string(Color color)
{
  if (color.a == 255) {
    return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
  }
  return fmt::format("#{:02x}{:02x}{:02x}{:02x}", color.r, color.g, color.b, color.a);
}

std::string to_string(const PropertyMap & map)
{
  if (map.empty()) {
    return "{}";
  }
  std::string out = "{";
  bool first = true;
  for (const auto & [key, value] : map) {
    out += first ? "" : ", ";
    out += fmt::format("{}: {}", key, to_string(value));
    first = false;
  }
  out += "}";
  return out;
}

std::string to_string(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::String:
      return quote(value.as_string());
    case ValueKind::Integer:
      return fmt::format("{}", value.as_integer());
    case ValueKind::Float:
      return format_number(value.as_number(), true);
    case ValueKind::Percentage:
      return format_number(value.as_number(), false) + "%";
    case ValueKind::Pixels:
      return format_number(value.as_number(), false) + "px";
    case ValueKind::Boolean:
      return value.as_bool() ? "true" : "false";
    case ValueKind::Color:
      return to_string(value.as_color());
    case ValueKind::List: {
      std::string out = "[";
      const auto & elems = value.as_list();
      for (size_t i = 0; i < elems.size(); ++i) {
        out += (i == 0 ? "" : ", ") + to_string(elems[i]);
      }
      out += "]";
      return out;
    }
    case ValueKind::Dict:
      return to_string(value.as_dict());
    case ValueKind::VariableRef:
      return "$" + value.as_string();
  }
  return "";
}

std::ostream & operator<<(std::ostream & os, const Value & value)
{
  return os << to_string(value);
}

std::ostream & operator<<(std::ostream & os, const PropertyMap & map)
{
  return os << to_string(map);
}

}  // namespace neko_ui
