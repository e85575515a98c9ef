#include "../core/canvas.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace braille_map;

constexpr color_t GREEN = 46;

static auto count_set(const braille_buffer_t &buffer) -> int
{
  int n = 0;
  for (int y = 0; y < buffer.get_height(); ++y)
  {
    for (int x = 0; x < buffer.get_width(); ++x)
    {
      if (buffer.is_pixel_set(x, y))
        ++n;
    }
  }
  return n;
}

void test_thin_line()
{
  std::cout << "Testing Bresenham line..." << std::endl;
  canvas_t canvas(16, 4);
  canvas.line({0, 0}, {10, 0}, GREEN);

  const auto &buffer = canvas.get_buffer();
  for (int x = 0; x <= 10; ++x)
  {
    assert(buffer.is_pixel_set(x, 0));
  }
  assert(!buffer.is_pixel_set(11, 0));
  assert(count_set(buffer) == 11);

  auto points = bresenham_points({0, 0}, {10, 0});
  assert(points.size() == 11);
  assert(points.front() == (point_t{0, 0}));
  assert(points.back() == (point_t{10, 0}));
}

void test_line_connectivity()
{
  std::cout << "Testing line connectivity..." << std::endl;
  const point_t targets[] = {{13, 5}, {5, 13}, {-9, 7}, {-4, -11}, {12, -12}, {0, 9}};
  for (const auto &t : targets)
  {
    auto points = bresenham_points({0, 0}, t);
    assert(points.back() == t);
    for (size_t i = 1; i < points.size(); ++i)
    {
      assert(std::abs(points[i].x - points[i - 1].x) <= 1);
      assert(std::abs(points[i].y - points[i - 1].y) <= 1);
    }
  }
}

void test_thick_line()
{
  std::cout << "Testing variable width line..." << std::endl;
  for (int width = 2; width <= 4; ++width)
  {
    // Shallow: every column covered
    canvas_t shallow(40, 24);
    shallow.line({0, 4}, {30, 14}, GREEN, width);
    const auto &a = shallow.get_buffer();
    assert(a.is_pixel_set(0, 4));
    for (int x = 0; x <= 30; ++x)
    {
      bool covered = false;
      for (int y = 0; y < a.get_height(); ++y)
        covered = covered || a.is_pixel_set(x, y);
      assert(covered);
    }

    // Steep: every row covered
    canvas_t steep(24, 40);
    steep.line({4, 0}, {14, 30}, GREEN, width);
    const auto &b = steep.get_buffer();
    for (int y = 0; y <= 30; ++y)
    {
      bool covered = false;
      for (int x = 0; x < b.get_width(); ++x)
        covered = covered || b.is_pixel_set(x, y);
      assert(covered);
    }

    // Thicker than a single pixel line
    canvas_t thin(40, 24);
    thin.line({0, 4}, {30, 14}, GREEN, 1);
    assert(count_set(a) > count_set(thin.get_buffer()));
  }

  canvas_t horizontal(24, 16);
  horizontal.line({2, 8}, {20, 8}, GREEN, 3);
  const auto &h = horizontal.get_buffer();
  for (int x = 2; x <= 20; ++x)
  {
    assert(h.is_pixel_set(x, 8));
  }
  assert(h.is_pixel_set(10, 7) || h.is_pixel_set(10, 9));
}

void test_polyline()
{
  std::cout << "Testing polyline..." << std::endl;
  canvas_t canvas(16, 16);
  canvas.polyline({{0, 0}, {10, 0}, {10, 10}}, GREEN);
  const auto &buffer = canvas.get_buffer();
  assert(buffer.is_pixel_set(5, 0));
  assert(buffer.is_pixel_set(10, 5));
  assert(count_set(buffer) == 21);

  canvas_t single(8, 8);
  single.polyline({{1, 1}}, GREEN);
  assert(count_set(single.get_buffer()) == 0);
}

void test_triangle_fill()
{
  std::cout << "Testing triangle fill..." << std::endl;
  canvas_t canvas(8, 8);
  bool ok = canvas.polygon({{{0, 0}, {4, 0}, {0, 4}}}, GREEN);
  assert(ok);

  const auto &buffer = canvas.get_buffer();
  for (int y = 0; y < buffer.get_height(); ++y)
  {
    for (int x = 0; x < buffer.get_width(); ++x)
    {
      if (buffer.is_pixel_set(x, y))
        assert(x + y <= 4);
    }
  }
  assert(buffer.is_pixel_set(0, 0));
  assert(buffer.is_pixel_set(1, 1));
  assert(buffer.is_pixel_set(4, 0));
  assert(buffer.is_pixel_set(0, 4));
}

void test_polygon_with_hole()
{
  std::cout << "Testing polygon with hole..." << std::endl;
  canvas_t canvas(24, 24);
  std::vector<std::vector<point_t>> rings = {{{0, 0}, {20, 0}, {20, 20}, {0, 20}}, {{6, 6}, {14, 6}, {14, 14}, {6, 14}}};
  assert(canvas.polygon(rings, GREEN));

  const auto &buffer = canvas.get_buffer();
  assert(buffer.is_pixel_set(2, 2));
  assert(buffer.is_pixel_set(17, 17));
  assert(!buffer.is_pixel_set(10, 10));
  assert(!buffer.is_pixel_set(22, 22));
}

void test_degenerate_polygons()
{
  std::cout << "Testing degenerate polygons..." << std::endl;
  canvas_t canvas(8, 8);
  assert(!canvas.polygon({}, GREEN));
  assert(!canvas.polygon({{{0, 0}, {4, 4}}}, GREEN));
  assert(count_set(canvas.get_buffer()) == 0);

  // A short hole is ignored, the outer ring still fills
  assert(canvas.polygon({{{0, 0}, {6, 0}, {0, 6}}, {{1, 1}}}, GREEN));
  assert(count_set(canvas.get_buffer()) > 0);
}

void test_markers()
{
  std::cout << "Testing markers..." << std::endl;
  canvas_t canvas(24, 24);
  canvas.marker({10, 10}, GREEN, 3);
  const auto &buffer = canvas.get_buffer();
  assert(buffer.is_pixel_set(7, 10) && buffer.is_pixel_set(13, 10));
  assert(buffer.is_pixel_set(10, 7) && buffer.is_pixel_set(10, 13));
  assert(buffer.is_pixel_set(9, 9) && buffer.is_pixel_set(11, 11));
  assert(!buffer.is_pixel_set(8, 8));

  canvas_t diamond(24, 24);
  diamond.diamond({10, 10}, GREEN, 3);
  const auto &d = diamond.get_buffer();
  assert(d.is_pixel_set(10, 7) && d.is_pixel_set(13, 10) && d.is_pixel_set(10, 13) && d.is_pixel_set(7, 10));
  assert(d.is_pixel_set(11, 8));
  assert(!d.is_pixel_set(10, 10));
}

void test_text_and_clear()
{
  std::cout << "Testing text and clear..." << std::endl;
  canvas_t canvas(12, 4);
  canvas.text("AB", {4, 0}, 226);
  assert(canvas.to_plain_lines()[0].find("AB") != std::string::npos);

  canvas.clear();
  assert(canvas.to_plain_lines()[0].find("AB") == std::string::npos);

  canvas.set_background(16);
  assert(canvas.to_lines()[0].find("48;5;16") != std::string::npos);
}

int main()
{
  test_thin_line();
  test_line_connectivity();
  test_thick_line();
  test_polyline();
  test_triangle_fill();
  test_polygon_with_hole();
  test_degenerate_polygons();
  test_markers();
  test_text_and_clear();
  std::cout << "Canvas Verification Passed" << std::endl;
  return 0;
}
