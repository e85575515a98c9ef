#pragma once

#include "core/braille_buffer.hpp"
#include <string>
#include <vector>

namespace braille_map
{

// Screen position in braille pixels
struct point_t
{
  int x;
  int y;

  auto operator==(const point_t &other) const -> bool = default;
};

// Drawing primitives on top of a braille buffer. Colours are xterm-256
// indices resolved ahead of time.
class canvas_t
{
public:
  canvas_t(int width, int height);

  auto get_width() const -> int
  {
    return m_buffer.get_width();
  }
  auto get_height() const -> int
  {
    return m_buffer.get_height();
  }
  auto get_buffer() -> braille_buffer_t &
  {
    return m_buffer;
  }
  auto get_buffer() const -> const braille_buffer_t &
  {
    return m_buffer;
  }

  auto clear() -> void;
  auto set_background(color_t color) -> void;

  auto pixel(point_t p, color_t color) -> void;
  auto line(point_t from, point_t to, color_t color, int width = 1) -> void;
  auto polyline(const std::vector<point_t> &points, color_t color, int width = 1) -> void;

  // Filled polygon, first ring outer, remaining rings holes.
  // Returns false when the outer ring is degenerate or triangulation fails.
  auto polygon(const std::vector<std::vector<point_t>> &rings, color_t color) -> bool;

  // Cross with corner dots
  auto marker(point_t p, color_t color, int size = 3) -> void;
  auto diamond(point_t p, color_t color, int size = 3) -> void;

  auto text(const std::string &text, point_t p, color_t color, bool center = false) -> void;

  auto to_lines() const -> std::vector<std::string>
  {
    return m_buffer.to_lines();
  }
  auto to_plain_lines() const -> std::vector<std::string>
  {
    return m_buffer.to_plain_lines();
  }
  auto to_colored_cells() const -> std::vector<std::vector<colored_cell_t>>
  {
    return m_buffer.to_colored_cells();
  }

private:
  braille_buffer_t m_buffer;

  auto bresenham_line(int x0, int y0, int x1, int y1, color_t color) -> void;
  auto thick_line(int x0, int y0, int x1, int y1, color_t color, int width) -> void;
  auto filled_triangle(point_t a, point_t b, point_t c, color_t color) -> void;
};

// Integer points of a Bresenham segment, endpoints included
auto bresenham_points(point_t from, point_t to) -> std::vector<point_t>;

} // namespace braille_map
