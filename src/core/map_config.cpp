#include "core/map_config.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace braille_map
{

auto save_map_config(const std::string &filename, const map_config_t &config) -> bool
{
  json j;

  j["source"] = config.source;
  j["cache_size"] = config.cache_size;
  j["language"] = config.language;
  j["http_timeout_ms"] = config.http_timeout_ms;
  if (config.style_file)
  {
    j["style_file"] = *config.style_file;
  }

  j["camera"] = {{"lat", config.camera.lat}, {"lon", config.camera.lon}, {"zoom", config.camera.zoom}};

  j["overlay"] = {{"gps", config.overlay.gps},
                  {"waypoint", config.overlay.waypoint},
                  {"route", config.overlay.route},
                  {"route_start", config.overlay.route_start},
                  {"route_end", config.overlay.route_end}};

  std::ofstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  file << j.dump(4);
  return true;
}

auto load_map_config(const std::string &filename, map_config_t &config) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "MapConfig: JSON parse error in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  if (!j.is_object())
  {
    std::cerr << "MapConfig: expected a JSON object in " << filename << std::endl;
    return false;
  }

  try
  {
    config.source = j.value("source", config.source);
    // Signed read so a negative size is clamped instead of wrapping
    long long cache_size = j.value("cache_size", static_cast<long long>(config.cache_size));
    config.cache_size = static_cast<size_t>(std::max(1LL, cache_size));
    config.language = j.value("language", config.language);
    config.http_timeout_ms = j.value("http_timeout_ms", config.http_timeout_ms);
    if (j.contains("style_file") && j["style_file"].is_string())
    {
      config.style_file = j["style_file"].get<std::string>();
    }

    if (j.contains("camera"))
    {
      config.camera.lat = j["camera"].value("lat", config.camera.lat);
      config.camera.lon = j["camera"].value("lon", config.camera.lon);
      config.camera.zoom = j["camera"].value("zoom", config.camera.zoom);
    }

    if (j.contains("overlay"))
    {
      config.overlay.gps = j["overlay"].value("gps", config.overlay.gps);
      config.overlay.waypoint = j["overlay"].value("waypoint", config.overlay.waypoint);
      config.overlay.route = j["overlay"].value("route", config.overlay.route);
      config.overlay.route_start = j["overlay"].value("route_start", config.overlay.route_start);
      config.overlay.route_end = j["overlay"].value("route_end", config.overlay.route_end);
    }
  }
  catch (const json::type_error &e)
  {
    std::cerr << "MapConfig: wrong value type in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  return true;
}

} // namespace braille_map
