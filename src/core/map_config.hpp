#pragma once

#include <optional>
#include <string>

namespace braille_map
{

struct map_config_t
{
  // "*.mbtiles" path or "http(s)://" tile server base URL
  std::string source = "http://mapscii.me/";
  size_t cache_size = 32;
  std::string language = "en";
  int http_timeout_ms = 5000;

  // Style sheet JSON; the built-in style is used when unset
  std::optional<std::string> style_file;

  struct camera_t
  {
    double lat = 53.3498;
    double lon = -6.2603;
    double zoom = 12.0;
  } camera;

  struct overlay_t
  {
    std::string gps = "#ff0000";
    std::string waypoint = "#ff8800";
    std::string route = "#ff00ff";
    std::string route_start = "#00ff00";
    std::string route_end = "#ff0000";
  } overlay;
};

auto save_map_config(const std::string &filename, const map_config_t &config) -> bool;

// Missing keys keep their current value. Returns false if the file cannot be
// read or is not valid JSON.
auto load_map_config(const std::string &filename, map_config_t &config) -> bool;

} // namespace braille_map
