#include "../core/map_renderer.hpp"
#include "test_tiles.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <condition_variable>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace braille_map;
using namespace braille_map::test;

static const std::string BLANK = "\xE2\xA0\x80"; // U+2800
static const std::string FULL = "\xE2\xA3\xBF";  // U+28FF
static const lat_lon_t DUBLIN{53.3498, -6.2603};

// Serves fixed tiles, records requested ids. Unknown tiles are empty.
class recording_fetcher_t : public tile_fetcher_t
{
public:
  struct log_t
  {
    std::mutex mutex;
    std::set<std::string> requested;
    std::vector<tile_id_t> ids;
  };

  recording_fetcher_t(std::map<std::string, std::string> tiles, std::shared_ptr<log_t> log) : m_tiles(std::move(tiles)), m_log(std::move(log))
  {
  }

  auto fetch_tile(const tile_id_t &id) -> std::optional<std::string> override
  {
    {
      std::lock_guard<std::mutex> lock(m_log->mutex);
      m_log->requested.insert(id.key());
      m_log->ids.push_back(id);
    }
    auto it = m_tiles.find(id.key());
    return it == m_tiles.end() ? std::string() : it->second;
  }

  auto get_name() const -> const char * override
  {
    return "Recording";
  }

private:
  std::map<std::string, std::string> m_tiles;
  std::shared_ptr<log_t> m_log;
};

// Holds every fetch until the gate opens. Always reports a transient failure.
class gated_fetcher_t : public tile_fetcher_t
{
public:
  struct gate_t
  {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = true;
    int waiting = 0;
  };

  explicit gated_fetcher_t(std::shared_ptr<gate_t> gate) : m_gate(std::move(gate))
  {
  }

  auto fetch_tile(const tile_id_t &) -> std::optional<std::string> override
  {
    std::unique_lock<std::mutex> lock(m_gate->mutex);
    ++m_gate->waiting;
    m_gate->cv.notify_all();
    m_gate->cv.wait(lock, [this]() { return m_gate->open; });
    --m_gate->waiting;
    return std::nullopt;
  }

  auto get_name() const -> const char * override
  {
    return "Gated";
  }

private:
  std::shared_ptr<gate_t> m_gate;
};

static auto default_style() -> std::shared_ptr<const style_set_t>
{
  return std::make_shared<const style_set_t>(compile_style(default_style_sheet()));
}

static auto make_renderer(int w, int h, std::map<std::string, std::string> tiles, map_state_t state,
                          std::shared_ptr<recording_fetcher_t::log_t> log = std::make_shared<recording_fetcher_t::log_t>())
    -> std::unique_ptr<map_renderer_t>
{
  auto style = default_style();
  auto source = std::make_unique<tile_source_t>(std::make_unique<recording_fetcher_t>(std::move(tiles), std::move(log)), style);
  return std::make_unique<map_renderer_t>(w, h, std::move(source), style, state);
}

static auto glyph_count(const std::string &line) -> int
{
  return utf8_length(line);
}

static auto same_frame(const render_result_t &a, const render_result_t &b) -> bool
{
  return a.lines == b.lines && a.plain_lines == b.plain_lines && a.center.lat == b.center.lat && a.center.lon == b.center.lon && a.zoom == b.zoom &&
         a.scale == b.scale;
}

void test_empty_tiles_over_dublin()
{
  std::cout << "Testing empty tiles over Dublin..." << std::endl;
  auto log = std::make_shared<recording_fetcher_t::log_t>();
  auto renderer = make_renderer(160, 160, {}, {DUBLIN, 12.0}, log);

  auto frame = renderer->draw();
  assert(frame.plain_lines.size() == 40);
  for (const auto &line : frame.plain_lines)
  {
    assert(glyph_count(line) == 80);
    for (const auto &glyph : utf8_glyphs(line))
    {
      assert(glyph == BLANK);
    }
  }
  assert(frame.lines.size() == 40);
  assert(frame.colored_cells.size() == 40 && frame.colored_cells[0].size() == 80);
  assert(frame.center.lat == DUBLIN.lat && frame.center.lon == DUBLIN.lon);
  assert(frame.zoom == 12.0);
  std::cout << "  Scale: " << frame.scale << std::endl;
  assert(frame.scale == geo::format_distance(geo::meters_per_pixel(12.0, DUBLIN.lat) * 40));

  // A 160 px view over 256 px tiles straddles at most a 2x2 block
  assert(!log->requested.empty() && log->requested.size() <= 4);
  for (const auto &id : log->ids)
    assert(id.z == 12);
}

void test_fit_bounds()
{
  std::cout << "Testing fit_bounds..." << std::endl;
  auto renderer = make_renderer(160, 160, {}, {});

  renderer->fit_bounds({{53.30, -6.30}, {53.40, -6.20}});
  auto state = renderer->get_state();
  std::cout << "  Center " << state.center.lat << ", " << state.center.lon << " zoom " << state.zoom << std::endl;
  assert(state.zoom == 12.0);
  assert(std::abs(state.center.lat - 53.35) < 1e-9);
  assert(std::abs(state.center.lon + 6.25) < 1e-9);

  renderer->fit_bounds({{53.30, -6.30}, {53.40, -6.20}}, 0.2);
  assert(renderer->get_state().zoom == 10.0);

  renderer->fit_bounds({{53.3498, -6.2603}});
  assert(renderer->get_state().zoom == 17.0);

  // Bucket bounds are inclusive
  renderer->fit_bounds({{0.0, 0.0}, {0.001, 0.0}});
  assert(renderer->get_state().zoom == 17.0);
  renderer->fit_bounds({{0.0, 0.0}, {0.0011, 0.0}});
  assert(renderer->get_state().zoom == 16.0);

  renderer->fit_bounds({{0.0, 0.0}, {30.0, 40.0}});
  assert(renderer->get_state().zoom == 5.0);

  // No points: view unchanged
  auto before = renderer->get_state();
  renderer->fit_bounds({});
  auto after = renderer->get_state();
  assert(before.zoom == after.zoom && before.center.lat == after.center.lat);
}

void test_navigation()
{
  std::cout << "Testing pan and zoom..." << std::endl;
  auto renderer = make_renderer(160, 160, {}, {DUBLIN, 12.0});

  for (int i = 0; i < 50; ++i)
    renderer->zoom_in();
  assert(renderer->get_state().zoom == map_renderer_t::MAX_ZOOM);
  for (int i = 0; i < 100; ++i)
    renderer->zoom_out();
  assert(renderer->get_state().zoom == map_renderer_t::MIN_ZOOM);

  renderer->center_on(DUBLIN);
  for (int i = 0; i < 24; ++i)
    renderer->zoom_in();
  assert(renderer->get_state().zoom == 12.0);

  renderer->pan_right();
  auto east = renderer->get_state().center;
  // 32 px of a 256 px tile at zoom 12
  assert(std::abs(east.lon - (DUBLIN.lon + 360.0 / 4096.0 / 8.0)) < 1e-9);
  assert(std::abs(east.lat - DUBLIN.lat) < 1e-9);
  renderer->pan_left();
  assert(std::abs(renderer->get_state().center.lon - DUBLIN.lon) < 1e-9);

  renderer->pan_up();
  assert(renderer->get_state().center.lat > DUBLIN.lat);
  renderer->pan_down();
  assert(std::abs(renderer->get_state().center.lat - DUBLIN.lat) < 1e-9);

  // Panning across the antimeridian wraps the longitude
  renderer->center_on({0.0, 179.995});
  renderer->pan(64, 0);
  assert(renderer->get_state().center.lon < -179.0);

  renderer->center_on({89.0, 0.0});
  assert(renderer->get_state().center.lat == geo::MAX_LATITUDE);
}

void test_concurrent_draw_returns_last_frame()
{
  std::cout << "Testing concurrent draw..." << std::endl;
  auto gate = std::make_shared<gated_fetcher_t::gate_t>();
  auto style = default_style();
  auto source = std::make_unique<tile_source_t>(std::make_unique<gated_fetcher_t>(gate), style);
  map_renderer_t renderer(160, 160, std::move(source), style, {DUBLIN, 12.0});

  auto previous = renderer.draw();

  // The next frame differs from the previous one
  renderer.set_waypoint(DUBLIN);

  {
    std::lock_guard<std::mutex> lock(gate->mutex);
    gate->open = false;
  }
  auto in_flight = std::async(std::launch::async, [&renderer]() { return renderer.draw(); });
  {
    std::unique_lock<std::mutex> lock(gate->mutex);
    gate->cv.wait(lock, [&]() { return gate->waiting > 0; });
  }

  auto concurrent = renderer.draw();
  assert(same_frame(concurrent, previous));

  {
    std::lock_guard<std::mutex> lock(gate->mutex);
    gate->open = true;
  }
  gate->cv.notify_all();

  auto fresh = in_flight.get();
  assert(!same_frame(fresh, previous));
  bool has_waypoint = false;
  for (const auto &line : fresh.plain_lines)
  {
    has_waypoint = has_waypoint || line.find("WPT") != std::string::npos;
  }
  assert(has_waypoint);

  // Idle again: a new draw builds a new frame
  auto again = renderer.draw();
  assert(same_frame(again, fresh));
}

void test_overlays()
{
  std::cout << "Testing overlays..." << std::endl;
  auto renderer = make_renderer(160, 160, {}, {DUBLIN, 12.0});

  auto center = renderer->lat_lon_to_screen(DUBLIN);
  assert(center && center->x == 80 && center->y == 80);
  assert(!renderer->lat_lon_to_screen({0.0, 0.0}));

  renderer->set_gps_position(DUBLIN);
  assert(renderer->get_gps_position().has_value());
  auto frame = renderer->draw();
  const auto &cell = frame.colored_cells[20][40];
  assert(cell.glyph != BLANK);
  assert(cell.color_hex == color::xterm_to_hex(color::hex_to_xterm("#ff0000")));

  renderer->clear_gps_position();
  assert(!renderer->get_gps_position());
  frame = renderer->draw();
  assert(frame.colored_cells[20][40].glyph == BLANK);

  renderer->set_waypoint({53.3510, -6.2550});
  assert(renderer->get_waypoint().has_value());
  frame = renderer->draw();
  bool has_waypoint = false;
  for (const auto &line : frame.plain_lines)
    has_waypoint = has_waypoint || line.find("WPT") != std::string::npos;
  assert(has_waypoint);
  renderer->clear_waypoint();
  assert(!renderer->get_waypoint());

  lat_lon_t start{53.3450, -6.2700};
  lat_lon_t end{53.3550, -6.2500};
  renderer->set_route({start, {53.3498, -6.2603}, end}, start, end);
  frame = renderer->draw();
  std::string all;
  for (const auto &line : frame.plain_lines)
    all += line;
  assert(all.find('A') != std::string::npos);
  assert(all.find('B') != std::string::npos);

  // Route points far off screen are skipped without error
  renderer->set_route({{0.0, 0.0}, {1.0, 1.0}}, {0.0, 0.0}, {1.0, 1.0});
  frame = renderer->draw();
  for (const auto &line : frame.plain_lines)
  {
    for (const auto &glyph : utf8_glyphs(line))
      assert(glyph == BLANK);
  }
  renderer->clear_route();

  renderer->set_gps_position({53.40, -6.10});
  renderer->center_on_gps();
  assert(std::abs(renderer->get_state().center.lon + 6.10) < 1e-9);
}

void test_features_and_labels()
{
  std::cout << "Testing feature rendering and label priority..." << std::endl;
  test_layer_t water{"water", 4096, {}};
  water.features.push_back({geom_e::POLYGON, {}, {}, {{{0, 0}, {4096, 0}, {4096, 4096}, {0, 4096}}}});

  test_layer_t countries{"country_label", 4096, {}};
  countries.features.push_back({geom_e::POINT, {{"name", "Second"}}, {{"scalerank", 5}}, {{{2048, 2048}}}});
  countries.features.push_back({geom_e::POINT, {{"name", "First"}}, {{"scalerank", 1}}, {{{2048, 2048}}}});

  // A whole-world view at zoom 0 shows only tile 0/0/0
  auto log = std::make_shared<recording_fetcher_t::log_t>();
  auto renderer = make_renderer(160, 160, {{"0-0-0", encode_tile({water, countries})}}, {{0.0, 0.0}, 0.0}, log);
  auto frame = renderer->draw();

  assert(log->requested.size() == 1 && log->requested.count("0-0-0") == 1);

  // The water fill covers the viewport (cells sampled away from the triangle seams)
  std::string water_hex = color::xterm_to_hex(color::hex_to_xterm("#0a4040"));
  assert(frame.colored_cells[5][60].glyph == FULL);
  assert(frame.colored_cells[5][60].color_hex == water_hex);
  assert(frame.colored_cells[30][10].glyph == FULL);

  // Both labels anchor at the tile centre; the lower sort key wins the spot
  const auto &row = frame.plain_lines[20];
  assert(row.find("First") != std::string::npos);
  for (const auto &line : frame.plain_lines)
    assert(line.find("Second") == std::string::npos);
  assert(frame.colored_cells[20][37].glyph == "F");
  assert(frame.colored_cells[20][37].color_hex == color::xterm_to_hex(color::hex_to_xterm("#ffff00")));
  assert(frame.skipped_polygons == 0);
}

void test_tile_grid_wrapping()
{
  std::cout << "Testing tile grid wrapping..." << std::endl;
  auto log = std::make_shared<recording_fetcher_t::log_t>();
  auto renderer = make_renderer(160, 160, {}, {{0.0, 179.9}, 2.0}, log);
  renderer->draw();

  bool wrapped = false;
  for (const auto &id : log->ids)
  {
    assert(id.z == 2);
    assert(id.x >= 0 && id.x < 4);
    assert(id.y >= 0 && id.y < 4);
    wrapped = wrapped || id.x == 0;
  }
  assert(wrapped);

  auto polar_log = std::make_shared<recording_fetcher_t::log_t>();
  auto polar = make_renderer(160, 160, {}, {{85.0, 0.0}, 1.0}, polar_log);
  polar->draw();
  for (const auto &id : polar_log->ids)
    assert(id.y >= 0);
}

void test_resize_while_projecting()
{
  std::cout << "Testing resize against concurrent projection..." << std::endl;
  auto renderer = make_renderer(160, 160, {}, {DUBLIN, 12.0});

  std::atomic<bool> done{false};
  std::thread resizer(
      [&]()
      {
        for (int i = 0; i < 2000; ++i)
          renderer->set_size(160 + (i % 2) * 40, 160);
        done = true;
      });

  int projections = 0;
  while (!done || projections == 0)
  {
    auto pos = renderer->lat_lon_to_screen(DUBLIN);
    assert(pos);
    assert(pos->x == 80 || pos->x == 100);
    assert(pos->y == 80);
    ++projections;
  }
  resizer.join();

  auto frame = renderer->draw();
  assert(frame.plain_lines.size() == 40);
  assert(glyph_count(frame.plain_lines[0]) == 100);
}

void test_resize_and_close()
{
  std::cout << "Testing resize and close..." << std::endl;
  auto renderer = make_renderer(160, 160, {}, {DUBLIN, 12.0});
  renderer->set_size(81, 42);

  auto frame = renderer->draw();
  assert(frame.plain_lines.size() == 10);
  assert(glyph_count(frame.plain_lines[0]) == 40);
  assert(renderer->lat_lon_to_screen(DUBLIN)->x == 40);

  renderer->close();
  frame = renderer->draw();
  assert(frame.plain_lines.size() == 10);
}

void test_configuration_errors()
{
  std::cout << "Testing configuration errors..." << std::endl;
  map_config_t config;
  config.source = "ftp://tiles.example/";
  bool threw = false;
  try
  {
    map_renderer_t renderer(80, 40, config);
  }
  catch (const std::invalid_argument &e)
  {
    std::cout << "  " << e.what() << std::endl;
    threw = true;
  }
  assert(threw);

  config.source = "/nonexistent/dir/world.mbtiles";
  threw = false;
  try
  {
    map_renderer_t renderer(80, 40, config);
  }
  catch (const std::runtime_error &e)
  {
    std::cout << "  " << e.what() << std::endl;
    threw = true;
  }
  assert(threw);

  config.source = "http://127.0.0.1:9/";
  config.style_file = "/nonexistent/style.json";
  threw = false;
  try
  {
    map_renderer_t renderer(80, 40, config);
  }
  catch (const std::runtime_error &)
  {
    threw = true;
  }
  assert(threw);
}

int main()
{
  test_empty_tiles_over_dublin();
  test_fit_bounds();
  test_navigation();
  test_concurrent_draw_returns_last_frame();
  test_overlays();
  test_features_and_labels();
  test_tile_grid_wrapping();
  test_resize_while_projecting();
  test_resize_and_close();
  test_configuration_errors();
  std::cout << "Map Renderer Verification Passed" << std::endl;
  return 0;
}
