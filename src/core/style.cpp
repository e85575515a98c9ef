#include "core/style.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace braille_map
{

namespace
{

constexpr const char *FALLBACK_COLOR = "#00cc00";
constexpr int MAX_LINE_WIDTH = 16;

auto to_property_value(const json &v) -> property_value_t
{
  if (v.is_boolean())
    return v.get<bool>();
  if (v.is_number())
    return v.get<double>();
  if (v.is_string())
    return v.get<std::string>();
  return std::monostate{};
}

auto lookup(const property_map_t &props, const std::string &key) -> const property_value_t *
{
  auto it = props.find(key);
  if (it == props.end())
    return nullptr;
  return &it->second;
}

auto compile_children(const json &filter) -> std::vector<style_predicate_t>
{
  std::vector<style_predicate_t> subs;
  for (size_t i = 1; i < filter.size(); ++i)
  {
    subs.push_back(compile_filter(filter[i]));
  }
  return subs;
}

// Ordering comparisons only apply between two numbers or two strings
template <typename Cmp> auto compile_comparison(const std::string &key, const json &operand, Cmp cmp) -> style_predicate_t
{
  property_value_t value = to_property_value(operand);
  return [key, value, cmp](const property_map_t &props)
  {
    const auto *p = lookup(props, key);
    if (!p)
      return false;
    if (std::holds_alternative<double>(*p) && std::holds_alternative<double>(value))
      return cmp(std::get<double>(*p), std::get<double>(value));
    if (std::holds_alternative<std::string>(*p) && std::holds_alternative<std::string>(value))
      return cmp(std::get<std::string>(*p), std::get<std::string>(value));
    return false;
  };
}

auto parse_kind(const std::string &type) -> style_kind_e
{
  if (type == "fill")
    return style_kind_e::FILL;
  if (type == "line")
    return style_kind_e::LINE;
  if (type == "symbol")
    return style_kind_e::SYMBOL;
  if (type == "background")
    return style_kind_e::BACKGROUND;
  throw std::invalid_argument("Unknown style layer type: " + type);
}

} // namespace

auto style_set_t::find(const std::string &id) const -> compiled_style_ptr_t
{
  auto it = by_id.find(id);
  if (it == by_id.end())
    return nullptr;
  return it->second;
}

auto style_set_t::rules_for_layer(const std::string &source_layer) const -> const std::vector<compiled_style_ptr_t> *
{
  auto it = by_layer.find(source_layer);
  if (it == by_layer.end() || it->second.empty())
    return nullptr;
  return &it->second;
}

auto compile_filter(const json &filter) -> style_predicate_t
{
  if (!filter.is_array() || filter.empty() || !filter[0].is_string())
    return [](const property_map_t &) { return true; };

  const std::string op = filter[0].get<std::string>();

  if (op == "all")
  {
    auto subs = compile_children(filter);
    return [subs](const property_map_t &props)
    {
      for (const auto &fn : subs)
      {
        if (!fn(props))
          return false;
      }
      return true;
    };
  }
  if (op == "any")
  {
    auto subs = compile_children(filter);
    return [subs](const property_map_t &props)
    {
      for (const auto &fn : subs)
      {
        if (fn(props))
          return true;
      }
      return false;
    };
  }
  if (op == "none")
  {
    auto subs = compile_children(filter);
    return [subs](const property_map_t &props)
    {
      for (const auto &fn : subs)
      {
        if (fn(props))
          return false;
      }
      return true;
    };
  }

  // Every remaining operator names a property key
  if (filter.size() < 2 || !filter[1].is_string())
    return [](const property_map_t &) { return true; };
  const std::string key = filter[1].get<std::string>();

  if (op == "has")
    return [key](const property_map_t &props) { return props.count(key) > 0; };
  if (op == "!has")
    return [key](const property_map_t &props) { return props.count(key) == 0; };

  if (op == "in" || op == "!in")
  {
    std::vector<property_value_t> values;
    for (size_t i = 2; i < filter.size(); ++i)
    {
      values.push_back(to_property_value(filter[i]));
    }
    bool negate = op == "!in";
    return [key, values, negate](const property_map_t &props)
    {
      const auto *p = lookup(props, key);
      bool found = false;
      if (p)
      {
        for (const auto &v : values)
        {
          if (v == *p)
          {
            found = true;
            break;
          }
        }
      }
      return negate ? !found : found;
    };
  }

  const json operand = filter.size() > 2 ? filter[2] : json();

  if (op == "==" || op == "!=")
  {
    property_value_t value = to_property_value(operand);
    bool negate = op == "!=";
    return [key, value, negate](const property_map_t &props)
    {
      const auto *p = lookup(props, key);
      bool equal = p && *p == value;
      return negate ? !equal : equal;
    };
  }
  if (op == ">")
    return compile_comparison(key, operand, [](const auto &a, const auto &b) { return a > b; });
  if (op == ">=")
    return compile_comparison(key, operand, [](const auto &a, const auto &b) { return a >= b; });
  if (op == "<")
    return compile_comparison(key, operand, [](const auto &a, const auto &b) { return a < b; });
  if (op == "<=")
    return compile_comparison(key, operand, [](const auto &a, const auto &b) { return a <= b; });

  std::cerr << "Style: unsupported filter operator '" << op << "', treating as match-all" << std::endl;
  return [](const property_map_t &) { return true; };
}

auto compile_style(const style_sheet_t &sheet) -> style_set_t
{
  style_set_t result;

  for (const auto &layer : sheet.layers)
  {
    auto compiled = std::make_shared<compiled_style_t>();
    compiled->id = layer.id;
    compiled->kind = parse_kind(layer.type);
    compiled->source_layer = layer.source_layer.value_or("");

    compiled->color_hex = FALLBACK_COLOR;
    for (const char *key : {"line-color", "fill-color", "text-color", "background-color"})
    {
      if (layer.paint.contains(key) && layer.paint[key].is_string())
      {
        compiled->color_hex = layer.paint[key].get<std::string>();
        break;
      }
    }
    compiled->color = color::hex_to_xterm(compiled->color_hex);

    if (layer.paint.contains("line-width") && layer.paint["line-width"].is_number())
    {
      double width = std::clamp(layer.paint["line-width"].get<double>(), 1.0, static_cast<double>(MAX_LINE_WIDTH));
      compiled->line_width = static_cast<int>(std::lround(width));
    }

    compiled->min_zoom = layer.min_zoom.value_or(0.0);
    compiled->max_zoom = layer.max_zoom.value_or(24.0);
    compiled->applies_to = compile_filter(layer.filter);

    result.by_id[compiled->id] = compiled;
    if (layer.source_layer)
    {
      result.by_layer[*layer.source_layer].push_back(compiled);
    }
  }

  return result;
}

auto get_draw_order(double zoom) -> const std::vector<std::string> &
{
  static const std::vector<std::string> low_zoom = {"admin", "water", "country_label", "marine_label"};
  static const std::vector<std::string> full = {"landuse",     "water",       "marine_label",       "building",  "road",       "admin",         "country_label",
                                                "state_label", "water_label", "place_label", "rail_station_label", "poi_label", "road_label", "housenum_label"};
  if (zoom < 2)
    return low_zoom;
  return full;
}

auto parse_style_sheet(const json &j) -> style_sheet_t
{
  style_sheet_t sheet;
  sheet.name = j.value("name", "unnamed");

  for (const auto &item : j.at("layers"))
  {
    style_layer_t layer;
    layer.id = item.at("id").get<std::string>();
    layer.type = item.at("type").get<std::string>();
    if (item.contains("source-layer"))
      layer.source_layer = item["source-layer"].get<std::string>();
    if (item.contains("paint"))
      layer.paint = item["paint"];
    if (item.contains("filter"))
      layer.filter = item["filter"];
    if (item.contains("minzoom"))
      layer.min_zoom = item["minzoom"].get<double>();
    if (item.contains("maxzoom"))
      layer.max_zoom = item["maxzoom"].get<double>();
    sheet.layers.push_back(std::move(layer));
  }

  return sheet;
}

auto load_style_sheet(const std::string &path) -> style_sheet_t
{
  std::ifstream file(path);
  if (!file.is_open())
  {
    throw std::runtime_error("Unable to open style sheet: " + path);
  }

  try
  {
    json j;
    file >> j;
    return parse_style_sheet(j);
  }
  catch (const json::exception &e)
  {
    std::cerr << "Style: JSON error in " << path << ": " << e.what() << std::endl;
    throw std::runtime_error("Malformed style sheet: " + path);
  }
}

} // namespace braille_map
