#include "core/map_renderer.hpp"
#include "core/label_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <mutex>
#include <utility>

namespace braille_map
{

namespace
{

constexpr int FEATURE_PADDING = 64;
constexpr int OVERLAY_PADDING = 20;
constexpr int LABEL_MARGIN = 5;
constexpr int SCALE_BAR_PIXELS = 40;
constexpr int WAYPOINT_SIZE = 3;
constexpr int ROUTE_END_SIZE = 4;
constexpr int GPS_MARKER_SIZE = 4;
constexpr const char *POI_MARKER = "◉";

// Largest coordinate span (degrees) shown at each fit_bounds zoom level
constexpr std::pair<double, double> FIT_ZOOM_TABLE[] = {{0.001, 17.0}, {0.005, 16.0}, {0.01, 15.0}, {0.05, 13.0}, {0.1, 12.0},
                                                        {0.5, 10.0},   {1.0, 9.0},    {2.0, 8.0},   {5.0, 7.0},   {10.0, 6.0}};

struct route_t
{
  std::vector<lat_lon_t> geometry;
  lat_lon_t start;
  lat_lon_t end;
};

struct layer_view_t
{
  const std::string *name;
  double scale;
  std::vector<const tile_feature_t *> features;
};

struct visible_tile_t
{
  tile_id_t id;
  double x; // screen position of the tile origin
  double y;
  double size;
  std::shared_ptr<const parsed_tile_t> data;
  std::vector<layer_view_t> layers;
};

struct pending_label_t
{
  const visible_tile_t *tile;
  const tile_feature_t *feature;
  double scale;
};

// Everything a frame reads from the mutable renderer state
struct frame_input_t
{
  map_state_t state;
  std::optional<lat_lon_t> gps;
  std::optional<lat_lon_t> waypoint;
  std::optional<route_t> route;
};

auto project(const map_state_t &state, int width, int height, const lat_lon_t &ll) -> std::optional<point_t>
{
  int z = geo::base_zoom(state.zoom);
  double tile_size = geo::tile_size_at_zoom(state.zoom);
  auto center = geo::lon_lat_to_tile(state.center.lon, state.center.lat, z);
  auto target = geo::lon_lat_to_tile(ll.lon, ll.lat, z);

  int x = static_cast<int>(std::floor(width / 2.0 + (target.x - center.x) * tile_size));
  int y = static_cast<int>(std::floor(height / 2.0 + (target.y - center.y) * tile_size));

  if (x < -OVERLAY_PADDING || x > width + OVERLAY_PADDING || y < -OVERLAY_PADDING || y > height + OVERLAY_PADDING)
    return std::nullopt;

  return point_t{x, y};
}

auto scale_bar(const map_state_t &state) -> std::string
{
  return geo::format_distance(geo::meters_per_pixel(state.zoom, state.center.lat) * SCALE_BAR_PIXELS);
}

} // namespace

struct map_renderer_t::impl_t
{
  // Written under both draw_mutex and state_mutex; either one is enough to read
  int width;
  int height;
  canvas_t canvas;
  label_buffer_t labels{LABEL_MARGIN};

  std::unique_ptr<tile_source_t> source;
  std::shared_ptr<const style_set_t> style;
  overlay_colors_t colors;

  mutable std::mutex state_mutex;
  map_state_t state;
  std::optional<lat_lon_t> gps;
  std::optional<lat_lon_t> waypoint;
  std::optional<route_t> route;

  // Held for the whole of a frame build
  std::mutex draw_mutex;

  std::mutex frame_mutex;
  render_result_t last_frame;

  int skipped_polygons = 0;

  impl_t(int w, int h) : width(w), height(h), canvas(w, h)
  {
  }

  auto snapshot() const -> frame_input_t
  {
    std::lock_guard<std::mutex> lock(state_mutex);
    return {state, gps, waypoint, route};
  }

  auto export_frame(const map_state_t &s) const -> render_result_t
  {
    render_result_t result;
    result.lines = canvas.to_lines();
    result.plain_lines = canvas.to_plain_lines();
    result.colored_cells = canvas.to_colored_cells();
    result.center = s.center;
    result.zoom = s.zoom;
    result.scale = scale_bar(s);
    result.skipped_polygons = skipped_polygons;
    return result;
  }

  auto render(const frame_input_t &input) -> void;
  auto visible_tiles(const map_state_t &s) const -> std::vector<visible_tile_t>;
  auto fetch_tiles(std::vector<visible_tile_t> &tiles) -> void;
  auto extract_features(visible_tile_t &tile) const -> void;
  auto render_tiles(const std::vector<visible_tile_t> &tiles, double zoom) -> void;
  auto draw_feature(const visible_tile_t &tile, const tile_feature_t &feature, double scale, double zoom) -> void;
  auto scale_points(const visible_tile_t &tile, const std::vector<tile_point_t> &points, double scale) const -> std::vector<point_t>;
  auto draw_overlays(const frame_input_t &input) -> void;
};

auto map_renderer_t::impl_t::render(const frame_input_t &input) -> void
{
  labels.clear();
  skipped_polygons = 0;

  if (auto background = style->find("background"))
  {
    canvas.set_background(background->color);
  }
  canvas.clear();

  auto tiles = visible_tiles(input.state);
  fetch_tiles(tiles);

  for (auto &tile : tiles)
  {
    if (tile.data)
      extract_features(tile);
  }

  render_tiles(tiles, input.state.zoom);
  draw_overlays(input);
}

auto map_renderer_t::impl_t::visible_tiles(const map_state_t &s) const -> std::vector<visible_tile_t>
{
  int z = geo::base_zoom(s.zoom);
  double tile_size = geo::tile_size_at_zoom(s.zoom);
  auto center = geo::lon_lat_to_tile(s.center.lon, s.center.lat, z);
  int grid_size = 1 << z;

  std::vector<visible_tile_t> tiles;

  int cx = static_cast<int>(std::floor(center.x));
  int cy = static_cast<int>(std::floor(center.y));

  // 3x3 grid around the centre tile
  for (int ty = cy - 1; ty <= cy + 1; ++ty)
  {
    for (int tx = cx - 1; tx <= cx + 1; ++tx)
    {
      double px = width / 2.0 - (center.x - tx) * tile_size;
      double py = height / 2.0 - (center.y - ty) * tile_size;

      if (ty < 0 || ty >= grid_size)
        continue;
      if (px + tile_size < 0 || py + tile_size < 0 || px > width || py > height)
        continue;

      // Wrap across the antimeridian
      int wrapped_x = ((tx % grid_size) + grid_size) % grid_size;

      visible_tile_t tile;
      tile.id = {z, wrapped_x, ty};
      tile.x = px;
      tile.y = py;
      tile.size = tile_size;
      tiles.push_back(std::move(tile));
    }
  }

  return tiles;
}

auto map_renderer_t::impl_t::fetch_tiles(std::vector<visible_tile_t> &tiles) -> void
{
  std::vector<std::future<std::shared_ptr<const parsed_tile_t>>> futures;
  futures.reserve(tiles.size());

  for (const auto &tile : tiles)
  {
    futures.push_back(std::async(std::launch::async, [this, id = tile.id]() { return source->get_tile(id); }));
  }

  for (size_t i = 0; i < tiles.size(); ++i)
  {
    try
    {
      tiles[i].data = futures[i].get();
    }
    catch (const std::exception &e)
    {
      // A failing tile leaves a hole, the rest of the frame still renders
      std::cerr << "MapRenderer: tile " << tiles[i].id.key() << " failed: " << e.what() << std::endl;
    }
  }
}

auto map_renderer_t::impl_t::extract_features(visible_tile_t &tile) const -> void
{
  for (const auto &layer_name : get_draw_order(tile.id.z))
  {
    auto it = tile.data->layers.find(layer_name);
    if (it == tile.data->layers.end())
      continue;

    const auto &layer = it->second;
    double scale = layer.extent / tile.size;

    // Viewport rectangle in tile-local extent units
    bbox_t view{-tile.x * scale, -tile.y * scale, (width - tile.x) * scale, (height - tile.y) * scale};

    tile.layers.push_back({&layer_name, scale, layer.index.search(view)});
  }
}

auto map_renderer_t::impl_t::render_tiles(const std::vector<visible_tile_t> &tiles, double zoom) -> void
{
  if (tiles.empty())
    return;

  std::vector<pending_label_t> pending;

  for (const auto &layer_name : get_draw_order(tiles.front().id.z))
  {
    for (const auto &tile : tiles)
    {
      for (const auto &view : tile.layers)
      {
        if (*view.name != layer_name)
          continue;

        for (const auto *feature : view.features)
        {
          if (feature->style->kind == style_kind_e::SYMBOL)
            pending.push_back({&tile, feature, view.scale});
          else
            draw_feature(tile, *feature, view.scale, zoom);
        }
      }
    }
  }

  // Labels go on top, most important (lowest sort key) first across all tiles
  std::stable_sort(pending.begin(), pending.end(), [](const pending_label_t &a, const pending_label_t &b) { return a.feature->sort_key < b.feature->sort_key; });

  for (const auto &label : pending)
  {
    draw_feature(*label.tile, *label.feature, label.scale, zoom);
  }
}

auto map_renderer_t::impl_t::draw_feature(const visible_tile_t &tile, const tile_feature_t &feature, double scale, double zoom) -> void
{
  const auto &rule = *feature.style;
  if (zoom < rule.min_zoom || zoom > rule.max_zoom)
    return;

  switch (rule.kind)
  {
  case style_kind_e::LINE:
  {
    auto points = scale_points(tile, feature.geometry.front(), scale);
    if (points.size() >= 2)
      canvas.polyline(points, rule.color, rule.line_width);
    break;
  }
  case style_kind_e::FILL:
  {
    std::vector<std::vector<point_t>> rings;
    rings.reserve(feature.geometry.size());
    for (const auto &ring : feature.geometry)
    {
      rings.push_back(scale_points(tile, ring, scale));
    }
    if (!rings.empty() && rings.front().size() >= 3)
    {
      if (!canvas.polygon(rings, rule.color))
        ++skipped_polygons;
    }
    break;
  }
  case style_kind_e::SYMBOL:
  {
    const std::string text = feature.label.value_or(POI_MARKER);
    int half_width = utf8_length(text);

    // First anchor point with free space wins
    for (const auto &point : scale_points(tile, feature.geometry.front(), scale))
    {
      int label_x = point.x - half_width;
      if (labels.write_if_possible(text, label_x, point.y, LABEL_MARGIN))
      {
        canvas.text(text, {label_x, point.y}, rule.color);
        break;
      }
    }
    break;
  }
  case style_kind_e::BACKGROUND:
    break;
  }
}

auto map_renderer_t::impl_t::scale_points(const visible_tile_t &tile, const std::vector<tile_point_t> &points, double scale) const -> std::vector<point_t>
{
  std::vector<point_t> result;
  result.reserve(points.size());

  int last_x = -1;
  int last_y = -1;
  bool first = true;

  for (const auto &p : points)
  {
    int x = static_cast<int>(std::floor(tile.x + p.x / scale));
    int y = static_cast<int>(std::floor(tile.y + p.y / scale));

    if (!first && x == last_x && y == last_y)
      continue;
    first = false;
    last_x = x;
    last_y = y;

    if (x < -FEATURE_PADDING || x > width + FEATURE_PADDING || y < -FEATURE_PADDING || y > height + FEATURE_PADDING)
      continue;

    result.push_back({x, y});
  }

  return result;
}

auto map_renderer_t::impl_t::draw_overlays(const frame_input_t &input) -> void
{
  if (input.gps)
  {
    if (auto pos = project(input.state, width, height, *input.gps))
      canvas.marker(*pos, colors.gps, GPS_MARKER_SIZE);
  }

  if (input.waypoint)
  {
    if (auto pos = project(input.state, width, height, *input.waypoint))
    {
      canvas.diamond(*pos, colors.waypoint, WAYPOINT_SIZE);
      canvas.text("WPT", {pos->x + WAYPOINT_SIZE + 2, pos->y}, colors.waypoint);
    }
  }

  if (input.route && input.route->geometry.size() >= 2)
  {
    std::vector<point_t> screen_points;
    for (const auto &ll : input.route->geometry)
    {
      if (auto pos = project(input.state, width, height, ll))
        screen_points.push_back(*pos);
    }
    if (screen_points.size() >= 2)
      canvas.polyline(screen_points, colors.route, 2);

    if (auto pos = project(input.state, width, height, input.route->start))
    {
      canvas.diamond(*pos, colors.route_start, ROUTE_END_SIZE);
      canvas.text("A", {pos->x + ROUTE_END_SIZE + 2, pos->y}, colors.route_start);
    }
    if (auto pos = project(input.state, width, height, input.route->end))
    {
      canvas.diamond(*pos, colors.route_end, ROUTE_END_SIZE);
      canvas.text("B", {pos->x + ROUTE_END_SIZE + 2, pos->y}, colors.route_end);
    }
  }
}

// --- map_renderer_t ---------------------------------------------------------

namespace
{

auto overlay_colors_from(const map_config_t::overlay_t &overlay) -> overlay_colors_t
{
  overlay_colors_t colors;
  colors.gps = color::hex_to_xterm(overlay.gps);
  colors.waypoint = color::hex_to_xterm(overlay.waypoint);
  colors.route = color::hex_to_xterm(overlay.route);
  colors.route_start = color::hex_to_xterm(overlay.route_start);
  colors.route_end = color::hex_to_xterm(overlay.route_end);
  return colors;
}

auto style_from(const map_config_t &config) -> std::shared_ptr<const style_set_t>
{
  auto sheet = config.style_file ? load_style_sheet(*config.style_file) : default_style_sheet();
  return std::make_shared<const style_set_t>(compile_style(sheet));
}

} // namespace

map_renderer_t::map_renderer_t(int width, int height, const map_config_t &config)
{
  auto style = style_from(config);

  tile_source_options_t options;
  options.cache_size = config.cache_size;
  options.language = config.language;
  options.http_timeout_ms = config.http_timeout_ms;

  auto source = std::make_unique<tile_source_t>(parse_tile_source(config.source), style, options);

  map_state_t initial;
  initial.center = geo::normalize({config.camera.lat, config.camera.lon});
  initial.zoom = std::clamp(config.camera.zoom, MIN_ZOOM, MAX_ZOOM);

  m_impl = std::make_unique<impl_t>(width, height);
  m_impl->source = std::move(source);
  m_impl->style = std::move(style);
  m_impl->colors = overlay_colors_from(config.overlay);
  m_impl->state = initial;
  m_impl->last_frame = m_impl->export_frame(initial);

  std::cout << "MapRenderer: " << width << "x" << height << " px, source " << config.source << std::endl;
}

map_renderer_t::map_renderer_t(int width, int height, std::unique_ptr<tile_source_t> source, std::shared_ptr<const style_set_t> style, map_state_t initial,
                               overlay_colors_t colors)
    : m_impl(std::make_unique<impl_t>(width, height))
{
  m_impl->source = std::move(source);
  m_impl->style = style ? std::move(style) : std::make_shared<const style_set_t>();
  m_impl->colors = colors;
  m_impl->state = {geo::normalize(initial.center), std::clamp(initial.zoom, MIN_ZOOM, MAX_ZOOM)};
  m_impl->last_frame = m_impl->export_frame(m_impl->state);
}

map_renderer_t::~map_renderer_t() = default;

auto map_renderer_t::draw() -> render_result_t
{
  std::unique_lock<std::mutex> drawing(m_impl->draw_mutex, std::try_to_lock);
  if (!drawing.owns_lock())
  {
    // Another frame is being built: hand back the last finished one
    std::lock_guard<std::mutex> lock(m_impl->frame_mutex);
    return m_impl->last_frame;
  }

  auto input = m_impl->snapshot();
  if (m_impl->source)
  {
    m_impl->render(input);
  }
  else
  {
    m_impl->canvas.clear();
  }

  auto result = m_impl->export_frame(input.state);

  std::lock_guard<std::mutex> lock(m_impl->frame_mutex);
  m_impl->last_frame = result;
  return result;
}

auto map_renderer_t::set_size(int width, int height) -> void
{
  std::lock_guard<std::mutex> drawing(m_impl->draw_mutex);
  m_impl->canvas = canvas_t(width, height);

  // Frame code reads the size under draw_mutex, lat_lon_to_screen under state_mutex
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->width = width;
  m_impl->height = height;
}

auto map_renderer_t::pan(double dx, double dy) -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  auto &state = m_impl->state;

  int z = geo::base_zoom(state.zoom);
  double tile_size = geo::tile_size_at_zoom(state.zoom);
  auto center = geo::lon_lat_to_tile(state.center.lon, state.center.lat, z);

  center.x += dx / tile_size;
  center.y += dy / tile_size;

  state.center = geo::normalize(geo::tile_to_lon_lat(center.x, center.y, z));
}

auto map_renderer_t::pan_left() -> void
{
  pan(-PAN_PIXELS, 0);
}

auto map_renderer_t::pan_right() -> void
{
  pan(PAN_PIXELS, 0);
}

auto map_renderer_t::pan_up() -> void
{
  pan(0, -PAN_PIXELS);
}

auto map_renderer_t::pan_down() -> void
{
  pan(0, PAN_PIXELS);
}

auto map_renderer_t::zoom_in() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->state.zoom = std::min(MAX_ZOOM, m_impl->state.zoom + ZOOM_STEP);
}

auto map_renderer_t::zoom_out() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->state.zoom = std::max(MIN_ZOOM, m_impl->state.zoom - ZOOM_STEP);
}

auto map_renderer_t::center_on(const lat_lon_t &ll) -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->state.center = geo::normalize(ll);
}

auto map_renderer_t::center_on_gps() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  if (m_impl->gps)
    m_impl->state.center = geo::normalize(*m_impl->gps);
}

auto map_renderer_t::set_gps_position(const lat_lon_t &ll) -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->gps = geo::normalize(ll);
}

auto map_renderer_t::clear_gps_position() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->gps.reset();
}

auto map_renderer_t::get_gps_position() const -> std::optional<lat_lon_t>
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  return m_impl->gps;
}

auto map_renderer_t::set_waypoint(const lat_lon_t &ll) -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->waypoint = geo::normalize(ll);
}

auto map_renderer_t::clear_waypoint() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->waypoint.reset();
}

auto map_renderer_t::get_waypoint() const -> std::optional<lat_lon_t>
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  return m_impl->waypoint;
}

auto map_renderer_t::set_route(std::vector<lat_lon_t> geometry, const lat_lon_t &start, const lat_lon_t &end) -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->route = route_t{std::move(geometry), start, end};
}

auto map_renderer_t::clear_route() -> void
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->route.reset();
}

auto map_renderer_t::fit_bounds(const std::vector<lat_lon_t> &points, double padding) -> void
{
  if (points.empty())
    return;

  double min_lat = points.front().lat;
  double max_lat = min_lat;
  double min_lon = points.front().lon;
  double max_lon = min_lon;

  for (const auto &p : points)
  {
    min_lat = std::min(min_lat, p.lat);
    max_lat = std::max(max_lat, p.lat);
    min_lon = std::min(min_lon, p.lon);
    max_lon = std::max(max_lon, p.lon);
  }

  double span = std::max(max_lat - min_lat, max_lon - min_lon) * (1.0 + padding);

  // Sub-millimetre noise from decimal degrees must not flip a bucket
  span = std::round(span * 1e9) / 1e9;

  double zoom = 5.0;
  for (const auto &[max_span, bucket_zoom] : FIT_ZOOM_TABLE)
  {
    if (span <= max_span)
    {
      zoom = bucket_zoom;
      break;
    }
  }

  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  m_impl->state.center = geo::normalize({(min_lat + max_lat) / 2.0, (min_lon + max_lon) / 2.0});
  m_impl->state.zoom = zoom;
}

auto map_renderer_t::get_state() const -> map_state_t
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  return m_impl->state;
}

auto map_renderer_t::lat_lon_to_screen(const lat_lon_t &ll) const -> std::optional<point_t>
{
  std::lock_guard<std::mutex> lock(m_impl->state_mutex);
  return project(m_impl->state, m_impl->width, m_impl->height, ll);
}

auto map_renderer_t::close() -> void
{
  std::lock_guard<std::mutex> drawing(m_impl->draw_mutex);
  if (m_impl->source)
    m_impl->source->close();
}

} // namespace braille_map
