#include "core/canvas.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mapbox/earcut.hpp>

namespace braille_map
{

canvas_t::canvas_t(int width, int height) : m_buffer(width, height)
{
}

auto canvas_t::clear() -> void
{
  m_buffer.clear();
}

auto canvas_t::set_background(color_t color) -> void
{
  m_buffer.set_global_background(color);
}

auto canvas_t::pixel(point_t p, color_t color) -> void
{
  m_buffer.set_pixel(p.x, p.y, color);
}

auto canvas_t::line(point_t from, point_t to, color_t color, int width) -> void
{
  if (width <= 1)
    bresenham_line(from.x, from.y, to.x, to.y, color);
  else
    thick_line(from.x, from.y, to.x, to.y, color, width);
}

auto canvas_t::polyline(const std::vector<point_t> &points, color_t color, int width) -> void
{
  for (size_t i = 1; i < points.size(); ++i)
  {
    line(points[i - 1], points[i], color, width);
  }
}

auto canvas_t::polygon(const std::vector<std::vector<point_t>> &rings, color_t color) -> bool
{
  using earcut_point_t = std::array<double, 2>;

  std::vector<std::vector<earcut_point_t>> poly;
  std::vector<point_t> vertices;

  for (const auto &ring : rings)
  {
    if (ring.size() < 3)
    {
      if (poly.empty())
        return false;
      continue; // degenerate hole
    }

    std::vector<earcut_point_t> converted;
    converted.reserve(ring.size());
    for (const auto &p : ring)
    {
      converted.push_back({static_cast<double>(p.x), static_cast<double>(p.y)});
      vertices.push_back(p);
    }
    poly.push_back(std::move(converted));
  }

  if (poly.empty())
    return false;

  std::vector<std::uint32_t> indices;
  try
  {
    indices = mapbox::earcut<std::uint32_t>(poly);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Canvas: triangulation failed: " << e.what() << std::endl;
    return false;
  }

  for (size_t i = 0; i + 2 < indices.size(); i += 3)
  {
    filled_triangle(vertices[indices[i]], vertices[indices[i + 1]], vertices[indices[i + 2]], color);
  }
  return true;
}

auto canvas_t::marker(point_t p, color_t color, int size) -> void
{
  for (int i = -size; i <= size; ++i)
  {
    m_buffer.set_pixel(p.x + i, p.y, color);
    m_buffer.set_pixel(p.x, p.y + i, color);
  }
  m_buffer.set_pixel(p.x - 1, p.y - 1, color);
  m_buffer.set_pixel(p.x + 1, p.y - 1, color);
  m_buffer.set_pixel(p.x - 1, p.y + 1, color);
  m_buffer.set_pixel(p.x + 1, p.y + 1, color);
}

auto canvas_t::diamond(point_t p, color_t color, int size) -> void
{
  for (int i = 0; i <= size; ++i)
  {
    m_buffer.set_pixel(p.x + i, p.y - size + i, color);
    m_buffer.set_pixel(p.x - i, p.y - size + i, color);
    m_buffer.set_pixel(p.x + i, p.y + size - i, color);
    m_buffer.set_pixel(p.x - i, p.y + size - i, color);
  }
}

auto canvas_t::text(const std::string &text, point_t p, color_t color, bool center) -> void
{
  m_buffer.write_text(text, p.x, p.y, color, center);
}

auto canvas_t::bresenham_line(int x0, int y0, int x1, int y1, color_t color) -> void
{
  int dx = std::abs(x1 - x0);
  int dy = std::abs(y1 - y0);
  int sx = x0 < x1 ? 1 : -1;
  int sy = y0 < y1 ? 1 : -1;
  int err = dx - dy;

  for (;;)
  {
    m_buffer.set_pixel(x0, y0, color);
    if (x0 == x1 && y0 == y1)
      break;
    int e2 = 2 * err;
    if (e2 > -dy)
    {
      err -= dy;
      x0 += sx;
    }
    if (e2 < dx)
    {
      err += dx;
      y0 += sy;
    }
  }
}

// Variable width Bresenham after A. Zingl, "The Beauty of Bresenham's Algorithm".
// The error term tracks distance from the centre line; perpendicular runs stop
// at half the stroke width.
auto canvas_t::thick_line(int x0, int y0, int x1, int y1, color_t color, int width) -> void
{
  int dx = std::abs(x1 - x0);
  int sx = x0 < x1 ? 1 : -1;
  int dy = std::abs(y1 - y0);
  int sy = y0 < y1 ? 1 : -1;
  int err = dx - dy;
  double ed = (dx + dy == 0) ? 1.0 : std::sqrt(static_cast<double>(dx) * dx + static_cast<double>(dy) * dy);
  double wd = (width + 1) / 2.0;
  double limit = ed * wd;

  for (;;)
  {
    m_buffer.set_pixel(x0, y0, color);
    int e2 = err;
    int x2 = x0;

    if (2 * e2 >= -dx)
    {
      e2 += dy;
      int y2 = y0;
      while (e2 < limit && (y1 != y2 || dx > dy))
      {
        y2 += sy;
        m_buffer.set_pixel(x0, y2, color);
        e2 += dx;
      }
      if (x0 == x1)
        break;
      e2 = err;
      err -= dy;
      x0 += sx;
    }
    if (2 * e2 <= dy)
    {
      e2 = dx - e2;
      while (e2 < limit && (x1 != x2 || dx < dy))
      {
        x2 += sx;
        m_buffer.set_pixel(x2, y0, color);
        e2 += dy;
      }
      if (y0 == y1)
        break;
      err += dx;
      y0 += sy;
    }
  }
}

auto canvas_t::filled_triangle(point_t a, point_t b, point_t c, color_t color) -> void
{
  auto edge_a = bresenham_points(b, c);
  auto edge_b = bresenham_points(a, c);
  auto edge_c = bresenham_points(a, b);

  std::vector<point_t> points;
  points.reserve(edge_a.size() + edge_b.size() + edge_c.size());
  int height = get_height();
  for (const auto *edge : {&edge_a, &edge_b, &edge_c})
  {
    for (const auto &p : *edge)
    {
      if (p.y >= 0 && p.y < height)
        points.push_back(p);
    }
  }

  std::sort(points.begin(), points.end(), [](const point_t &l, const point_t &r) { return l.y == r.y ? l.x < r.x : l.y < r.y; });

  // Span between neighbouring boundary points of the same row
  int width = get_width();
  for (size_t i = 0; i < points.size(); ++i)
  {
    const point_t &p = points[i];
    if (i + 1 < points.size() && points[i + 1].y == p.y)
    {
      int left = std::max(0, p.x);
      int right = std::min(width - 1, points[i + 1].x);
      for (int x = left; x <= right; ++x)
      {
        m_buffer.set_pixel(x, p.y, color);
      }
    }
    else
    {
      m_buffer.set_pixel(p.x, p.y, color);
    }
  }
}

auto bresenham_points(point_t from, point_t to) -> std::vector<point_t>
{
  std::vector<point_t> points;
  int dx = std::abs(to.x - from.x);
  int dy = std::abs(to.y - from.y);
  int sx = from.x < to.x ? 1 : -1;
  int sy = from.y < to.y ? 1 : -1;
  int err = dx - dy;
  int x = from.x, y = from.y;

  for (;;)
  {
    points.push_back({x, y});
    if (x == to.x && y == to.y)
      break;
    int e2 = 2 * err;
    if (e2 > -dy)
    {
      err -= dy;
      x += sx;
    }
    if (e2 < dx)
    {
      err += dx;
      y += sy;
    }
  }
  return points;
}

} // namespace braille_map
