#pragma once

#include "core/spatial_index.hpp"
#include "core/style.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace braille_map
{

// Integer coordinate in tile-local extent space
struct tile_point_t
{
  int x;
  int y;
};

struct tile_feature_t
{
  compiled_style_ptr_t style;
  std::optional<std::string> label;
  double sort_key = 0.0;
  // Fills keep every ring (first = outer, rest = holes). Lines and symbols hold one part.
  std::vector<std::vector<tile_point_t>> geometry;
  bbox_t bounds; // of the first ring / part
};

struct parsed_layer_t
{
  std::uint32_t extent = 4096;
  spatial_index_t<tile_feature_t> index;
};

struct parsed_tile_t
{
  std::map<std::string, parsed_layer_t> layers;
};

auto is_gzipped(const std::string &data) -> bool;

// Inflate a gzip stream. Throws std::runtime_error on corrupt input.
auto gunzip(const std::string &data) -> std::string;

// Decode a Mapbox Vector Tile (optionally gzipped) into styled, indexed features.
// Features not matched by any rule of their source layer are dropped.
// Throws on corrupt data; an empty buffer yields an empty tile.
auto decode_tile(const std::string &data, const style_set_t &style, const std::string &language = "en") -> parsed_tile_t;

} // namespace braille_map
