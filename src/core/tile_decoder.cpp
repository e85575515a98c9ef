#include "core/tile_decoder.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <mapbox/vector_tile.hpp>
#include <stdexcept>
#include <zlib.h>

namespace braille_map
{

namespace
{

constexpr int INDEX_CELLS_PER_TILE = 8;

auto to_property_value(const mapbox::feature::value &v) -> property_value_t
{
  if (v.is<bool>())
    return v.get<bool>();
  if (v.is<uint64_t>())
    return static_cast<double>(v.get<uint64_t>());
  if (v.is<int64_t>())
    return static_cast<double>(v.get<int64_t>());
  if (v.is<double>())
    return v.get<double>();
  if (v.is<std::string>())
    return v.get<std::string>();
  return std::monostate{};
}

auto geometry_type_name(mapbox::vector_tile::GeomType type) -> const char *
{
  switch (type)
  {
  case mapbox::vector_tile::GeomType::POINT:
    return "Point";
  case mapbox::vector_tile::GeomType::LINESTRING:
    return "LineString";
  case mapbox::vector_tile::GeomType::POLYGON:
    return "Polygon";
  default:
    return "";
  }
}

auto string_property(const property_map_t &props, const std::string &key) -> std::optional<std::string>
{
  auto it = props.find(key);
  if (it == props.end() || !std::holds_alternative<std::string>(it->second))
    return std::nullopt;
  const auto &s = std::get<std::string>(it->second);
  if (s.empty())
    return std::nullopt;
  return s;
}

auto nonzero_number(const property_map_t &props, const std::string &key) -> std::optional<double>
{
  auto it = props.find(key);
  if (it == props.end() || !std::holds_alternative<double>(it->second))
    return std::nullopt;
  double v = std::get<double>(it->second);
  if (v == 0.0)
    return std::nullopt;
  return v;
}

// House numbers are often encoded as integers
auto house_number(const property_map_t &props) -> std::optional<std::string>
{
  if (auto s = string_property(props, "house_num"))
    return s;

  auto it = props.find("house_num");
  if (it == props.end() || !std::holds_alternative<double>(it->second))
    return std::nullopt;
  double v = std::get<double>(it->second);
  if (!std::isfinite(v))
    return std::nullopt;
  if (v == std::floor(v) && std::abs(v) < 1e15)
    return std::format("{}", static_cast<long long>(v));
  return std::format("{}", v);
}

auto resolve_label(const property_map_t &props, const std::string &language) -> std::optional<std::string>
{
  for (const auto &key : {"name_" + language, std::string("name_en"), std::string("name")})
  {
    if (auto s = string_property(props, key))
      return s;
  }
  return house_number(props);
}

auto compute_bounds(const std::vector<tile_point_t> &points) -> bbox_t
{
  bbox_t b;
  b.min_x = std::numeric_limits<double>::max();
  b.min_y = std::numeric_limits<double>::max();
  b.max_x = std::numeric_limits<double>::lowest();
  b.max_y = std::numeric_limits<double>::lowest();

  for (const auto &p : points)
  {
    b.min_x = std::min(b.min_x, static_cast<double>(p.x));
    b.max_x = std::max(b.max_x, static_cast<double>(p.x));
    b.min_y = std::min(b.min_y, static_cast<double>(p.y));
    b.max_y = std::max(b.max_y, static_cast<double>(p.y));
  }
  return b;
}

template <typename Part> auto convert_part(const Part &part) -> std::vector<tile_point_t>
{
  std::vector<tile_point_t> points;
  points.reserve(part.size());
  for (const auto &p : part)
  {
    points.push_back({static_cast<int>(p.x), static_cast<int>(p.y)});
  }
  return points;
}

} // namespace

auto is_gzipped(const std::string &data) -> bool
{
  return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1f && static_cast<unsigned char>(data[1]) == 0x8b;
}

auto gunzip(const std::string &data) -> std::string
{
  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));

  // 16 + MAX_WBITS selects the gzip wrapper
  if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK)
  {
    throw std::runtime_error("gzip: inflateInit2 failed");
  }

  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string output;
  char chunk[16384];
  int ret = Z_OK;

  while (ret != Z_STREAM_END)
  {
    stream.next_out = reinterpret_cast<Bytef *>(chunk);
    stream.avail_out = sizeof(chunk);

    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END)
    {
      inflateEnd(&stream);
      throw std::runtime_error(std::string("gzip: inflate failed: ") + (stream.msg ? stream.msg : "unknown error"));
    }

    output.append(chunk, sizeof(chunk) - stream.avail_out);

    // Truncated stream: input exhausted without reaching the end marker
    if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)
    {
      inflateEnd(&stream);
      throw std::runtime_error("gzip: unexpected end of stream");
    }
  }

  inflateEnd(&stream);
  return output;
}

auto decode_tile(const std::string &data, const style_set_t &style, const std::string &language) -> parsed_tile_t
{
  parsed_tile_t tile;
  if (data.empty())
    return tile;

  const std::string raw = is_gzipped(data) ? gunzip(data) : data;

  mapbox::vector_tile::buffer vt(raw);

  for (const auto &lp : vt.getLayers())
  {
    const auto *rules = style.rules_for_layer(lp.first);
    if (!rules)
      continue;

    mapbox::vector_tile::layer layer(lp.second);
    std::vector<tile_feature_t> features;

    for (std::size_t i = 0; i < layer.featureCount(); ++i)
    {
      mapbox::vector_tile::feature feat(layer.getFeature(i), layer);

      property_map_t props;
      for (const auto &kv : feat.getProperties())
      {
        props[kv.first] = to_property_value(kv.second);
      }
      props["$type"] = std::string(geometry_type_name(feat.getType()));

      // First matching rule wins; later rules are fallbacks
      compiled_style_ptr_t matched;
      for (const auto &rule : *rules)
      {
        if (rule->applies_to(props))
        {
          matched = rule;
          break;
        }
      }
      if (!matched)
        continue;

      auto geometries = feat.getGeometries<mapbox::vector_tile::points_arrays_type>(1.0f);
      if (geometries.empty())
        continue;

      std::optional<std::string> label;
      if (matched->kind == style_kind_e::SYMBOL)
        label = resolve_label(props, language);

      double sort_key = 0.0;
      if (auto rank = nonzero_number(props, "localrank"))
        sort_key = *rank;
      else if (auto rank = nonzero_number(props, "scalerank"))
        sort_key = *rank;

      if (matched->kind == style_kind_e::FILL)
      {
        tile_feature_t feature;
        feature.style = matched;
        feature.label = label;
        feature.sort_key = sort_key;
        for (const auto &ring : geometries)
        {
          feature.geometry.push_back(convert_part(ring));
        }
        if (feature.geometry[0].empty())
          continue;
        feature.bounds = compute_bounds(feature.geometry[0]);
        features.push_back(std::move(feature));
      }
      else
      {
        for (const auto &part : geometries)
        {
          if (part.empty())
            continue;
          tile_feature_t feature;
          feature.style = matched;
          feature.label = label;
          feature.sort_key = sort_key;
          feature.geometry.push_back(convert_part(part));
          feature.bounds = compute_bounds(feature.geometry[0]);
          features.push_back(std::move(feature));
        }
      }
    }

    parsed_layer_t parsed;
    parsed.extent = layer.getExtent() > 0 ? layer.getExtent() : 4096;
    parsed.index = spatial_index_t<tile_feature_t>(static_cast<double>(parsed.extent) / INDEX_CELLS_PER_TILE);
    parsed.index.load(std::move(features));
    tile.layers.emplace(lp.first, std::move(parsed));
  }

  return tile;
}

} // namespace braille_map
