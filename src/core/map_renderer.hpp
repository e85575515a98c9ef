#pragma once

#include "core/canvas.hpp"
#include "core/geo_math.hpp"
#include "core/map_config.hpp"
#include "core/style.hpp"
#include "core/tile_source.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace braille_map
{

struct map_state_t
{
  lat_lon_t center{53.3498, -6.2603};
  double zoom = 12.0;
};

// One rendered frame in the three export forms plus viewport info
struct render_result_t
{
  std::vector<std::string> lines; // with ANSI 256-colour escapes
  std::vector<std::string> plain_lines;
  std::vector<std::vector<colored_cell_t>> colored_cells;
  lat_lon_t center;
  double zoom = 0.0;
  std::string scale; // length of a 40 pixel scale bar, e.g. "850 m"
  int skipped_polygons = 0;
};

// Overlay colours as xterm-256 indices
struct overlay_colors_t
{
  color_t gps = color::hex_to_xterm("#ff0000");
  color_t waypoint = color::hex_to_xterm("#ff8800");
  color_t route = color::hex_to_xterm("#ff00ff");
  color_t route_start = color::hex_to_xterm("#00ff00");
  color_t route_end = color::hex_to_xterm("#ff0000");
};

/*
 * Renders vector tiles around a lat/lon centre into a braille canvas.
 *
 * Only one draw() builds a frame at a time. A draw() issued while another is
 * in flight returns the last completed frame immediately. Tiles of a frame are
 * fetched in parallel; everything after the fetch runs on the calling thread.
 * Mutators may be called from any thread and take effect on the next frame.
 */
class map_renderer_t
{
public:
  static constexpr double MIN_ZOOM = 0.0;
  static constexpr double MAX_ZOOM = 18.0;
  static constexpr double ZOOM_STEP = 0.5;
  static constexpr int PAN_PIXELS = 32;

  // Builds the style and tile source described by the config.
  // Throws std::invalid_argument for an unsupported source and
  // std::runtime_error for an unreadable archive or style sheet.
  map_renderer_t(int width, int height, const map_config_t &config);

  map_renderer_t(int width, int height, std::unique_ptr<tile_source_t> source, std::shared_ptr<const style_set_t> style, map_state_t initial = {},
                 overlay_colors_t colors = {});
  ~map_renderer_t();

  auto draw() -> render_result_t;

  // Waits for an in-flight draw, then reallocates the canvas
  auto set_size(int width, int height) -> void;

  auto pan(double dx, double dy) -> void;
  auto pan_left() -> void;
  auto pan_right() -> void;
  auto pan_up() -> void;
  auto pan_down() -> void;

  auto zoom_in() -> void;
  auto zoom_out() -> void;

  auto center_on(const lat_lon_t &ll) -> void;
  auto center_on_gps() -> void;

  auto set_gps_position(const lat_lon_t &ll) -> void;
  auto clear_gps_position() -> void;
  auto get_gps_position() const -> std::optional<lat_lon_t>;

  auto set_waypoint(const lat_lon_t &ll) -> void;
  auto clear_waypoint() -> void;
  auto get_waypoint() const -> std::optional<lat_lon_t>;

  auto set_route(std::vector<lat_lon_t> geometry, const lat_lon_t &start, const lat_lon_t &end) -> void;
  auto clear_route() -> void;

  // Centre on the bounding box midpoint and pick a zoom from a fixed
  // span-to-zoom table. padding widens the span (0.2 = 20%).
  auto fit_bounds(const std::vector<lat_lon_t> &points, double padding = 0.0) -> void;

  auto get_state() const -> map_state_t;

  // Screen pixel position of a coordinate, or nullopt if it falls more than
  // 20 pixels outside the viewport
  auto lat_lon_to_screen(const lat_lon_t &ll) const -> std::optional<point_t>;

  auto close() -> void;

private:
  struct impl_t;
  std::unique_ptr<impl_t> m_impl;
};

} // namespace braille_map
