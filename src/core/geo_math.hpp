#pragma once

#include <algorithm>
#include <cmath>
#include <format>
#include <string>

namespace braille_map
{

struct lat_lon_t
{
  double lat = 0.0;
  double lon = 0.0;
};

// Fractional tile coordinates at an integer zoom
struct tile_coord_t
{
  double x = 0.0;
  double y = 0.0;
  int z = 0;
};

namespace geo
{
constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6378137.0;
constexpr double MAX_LATITUDE = 85.0511;
constexpr int TILE_SIZE = 256;

inline auto deg_to_rad(double deg) -> double
{
  return deg * PI / 180.0;
}

inline auto rad_to_deg(double rad) -> double
{
  return rad * 180.0 / PI;
}

// Web Mercator forward projection into fractional tile space
inline auto lon_lat_to_tile(double lon, double lat, int zoom) -> tile_coord_t
{
  double n = std::pow(2.0, zoom);
  double lat_rad = deg_to_rad(lat);

  tile_coord_t out;
  out.x = (lon + 180.0) / 360.0 * n;
  out.y = (1.0 - std::log(std::tan(lat_rad) + 1.0 / std::cos(lat_rad)) / PI) / 2.0 * n;
  out.z = zoom;
  return out;
}

inline auto tile_to_lon_lat(double x, double y, int zoom) -> lat_lon_t
{
  double n_tiles = std::pow(2.0, zoom);
  double n = PI - 2.0 * PI * y / n_tiles;

  lat_lon_t out;
  out.lon = x / n_tiles * 360.0 - 180.0;
  out.lat = rad_to_deg(std::atan(0.5 * (std::exp(n) - std::exp(-n))));
  return out;
}

// Integer zoom used to select tiles. Fractional zoom scales the tile raster instead.
inline auto base_zoom(double zoom, int max_zoom = 14) -> int
{
  return std::clamp(static_cast<int>(std::floor(zoom)), 0, max_zoom);
}

inline auto tile_size_at_zoom(double zoom) -> double
{
  return TILE_SIZE * std::pow(2.0, zoom - base_zoom(zoom));
}

inline auto meters_per_pixel(double zoom, double lat = 0.0) -> double
{
  return std::cos(deg_to_rad(lat)) * 2.0 * PI * EARTH_RADIUS / (TILE_SIZE * std::pow(2.0, zoom));
}

// Wrap longitude into [-180, 180] and clamp latitude to the Mercator limit
inline auto normalize(lat_lon_t ll) -> lat_lon_t
{
  if (ll.lon < -180.0)
    ll.lon += 360.0;
  if (ll.lon > 180.0)
    ll.lon -= 360.0;
  ll.lat = std::clamp(ll.lat, -MAX_LATITUDE, MAX_LATITUDE);
  return ll;
}

// Great circle distance in meters
inline auto haversine(const lat_lon_t &a, const lat_lon_t &b) -> double
{
  double d_lat = deg_to_rad(b.lat - a.lat);
  double d_lon = deg_to_rad(b.lon - a.lon);
  double sin_lat = std::sin(d_lat / 2.0);
  double sin_lon = std::sin(d_lon / 2.0);

  double h = sin_lat * sin_lat + std::cos(deg_to_rad(a.lat)) * std::cos(deg_to_rad(b.lat)) * sin_lon * sin_lon;
  return 2.0 * EARTH_RADIUS * std::asin(std::sqrt(h));
}

// Calculate bearing from point A to point B in degrees (0 = north)
inline auto bearing(const lat_lon_t &a, const lat_lon_t &b) -> double
{
  double lat1_rad = deg_to_rad(a.lat);
  double lat2_rad = deg_to_rad(b.lat);
  double delta_lon_rad = deg_to_rad(b.lon - a.lon);

  double y = std::sin(delta_lon_rad) * std::cos(lat2_rad);
  double x = std::cos(lat1_rad) * std::sin(lat2_rad) - std::sin(lat1_rad) * std::cos(lat2_rad) * std::cos(delta_lon_rad);

  // Convert to degrees and normalize to 0-360
  double bearing_deg = rad_to_deg(std::atan2(y, x));
  if (bearing_deg < 0.0)
    bearing_deg += 360.0;
  return bearing_deg;
}

inline auto format_distance(double meters) -> std::string
{
  if (meters < 1000.0)
    return std::format("{} m", static_cast<long long>(std::llround(meters)));
  return std::format("{:.1f} km", meters / 1000.0);
}

inline auto bearing_to_compass(double deg) -> std::string
{
  static const char *dirs[] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
  int idx = static_cast<int>(std::lround(deg / 45.0)) % 8;
  if (idx < 0)
    idx += 8;
  return dirs[idx];
}

} // namespace geo
} // namespace braille_map
