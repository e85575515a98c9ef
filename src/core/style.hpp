#pragma once

#include "core/color_math.hpp"
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace braille_map
{

enum class style_kind_e
{
  BACKGROUND,
  FILL,
  LINE,
  SYMBOL
};

// Feature property as seen by style filters. All numeric encodings collapse to double.
using property_value_t = std::variant<std::monostate, bool, double, std::string>;
using property_map_t = std::unordered_map<std::string, property_value_t>;
using style_predicate_t = std::function<bool(const property_map_t &)>;

// One layer of a declarative (Mapbox GL syntax) style sheet
struct style_layer_t
{
  std::string id;
  std::string type; // "fill", "line", "symbol" or "background"
  std::optional<std::string> source_layer;
  nlohmann::json paint = nlohmann::json::object();
  nlohmann::json filter; // null when absent
  std::optional<double> min_zoom;
  std::optional<double> max_zoom;
};

struct style_sheet_t
{
  std::string name;
  std::vector<style_layer_t> layers;
};

struct compiled_style_t
{
  std::string id;
  style_kind_e kind = style_kind_e::LINE;
  std::string source_layer;
  color_t color = 0;
  std::string color_hex;
  int line_width = 1;
  double min_zoom = 0.0;
  double max_zoom = 24.0;
  style_predicate_t applies_to;
};

using compiled_style_ptr_t = std::shared_ptr<const compiled_style_t>;

// Result of compiling a style sheet once at startup. Immutable afterwards.
struct style_set_t
{
  std::map<std::string, compiled_style_ptr_t> by_id;
  // Rules per source layer, in style sheet order (first match wins)
  std::map<std::string, std::vector<compiled_style_ptr_t>> by_layer;

  auto find(const std::string &id) const -> compiled_style_ptr_t;
  auto rules_for_layer(const std::string &source_layer) const -> const std::vector<compiled_style_ptr_t> *;
};

// Lower a filter expression tree into a predicate. A null or empty filter matches everything.
auto compile_filter(const nlohmann::json &filter) -> style_predicate_t;

auto compile_style(const style_sheet_t &sheet) -> style_set_t;

// Source layers in paint order for a zoom level
auto get_draw_order(double zoom) -> const std::vector<std::string> &;

// Throws nlohmann::json exceptions on malformed input
auto parse_style_sheet(const nlohmann::json &j) -> style_sheet_t;

// Throws std::runtime_error when the file cannot be read or parsed
auto load_style_sheet(const std::string &path) -> style_sheet_t;

// Built-in Pip-Boy green palette
auto default_style_sheet() -> style_sheet_t;

} // namespace braille_map
