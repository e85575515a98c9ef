#pragma once

#include "core/color_math.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace braille_map
{

// One exported character cell with its foreground colour
struct colored_cell_t
{
  std::string glyph;
  std::string color_hex;
};

// Split UTF-8 text into one string per code point
auto utf8_glyphs(const std::string &text) -> std::vector<std::string>;
auto utf8_length(const std::string &text) -> int;

/*
 * Pixel buffer backed by Unicode braille cells (U+2800 - U+28FF).
 * Each character cell is a 2x4 dot grid:
 *
 *   0x01 0x08
 *   0x02 0x10
 *   0x04 0x20
 *   0x40 0x80
 *
 * Pixel coordinates are absolute; width and height are rounded down to
 * multiples of 2 and 4.
 */
class braille_buffer_t
{
public:
  braille_buffer_t(int width, int height);

  auto get_width() const -> int
  {
    return m_width;
  }
  auto get_height() const -> int
  {
    return m_height;
  }
  auto get_char_width() const -> int
  {
    return m_char_width;
  }
  auto get_char_height() const -> int
  {
    return m_char_height;
  }

  auto clear() -> void;

  auto set_pixel(int x, int y, color_t color) -> void;
  auto unset_pixel(int x, int y) -> void;
  auto is_pixel_set(int x, int y) const -> bool;

  auto set_background(int x, int y, color_t color) -> void;
  auto set_global_background(color_t color) -> void
  {
    m_global_background = color;
  }

  // Replace the braille glyph of the cell containing (x, y)
  auto set_char(const std::string &glyph, int x, int y, color_t color) -> void;

  // One glyph per 2 pixels, optionally centered horizontally on x
  auto write_text(const std::string &text, int x, int y, color_t color, bool center = true) -> void;

  auto to_lines() const -> std::vector<std::string>;
  auto to_plain_lines() const -> std::vector<std::string>;
  auto to_colored_cells() const -> std::vector<std::vector<colored_cell_t>>;
  auto frame() const -> std::string;

private:
  int m_width;
  int m_height;
  int m_char_width;
  int m_char_height;
  color_t m_global_background = 0;

  std::vector<std::uint8_t> m_pixels;
  std::vector<color_t> m_foreground;
  std::vector<color_t> m_background;
  std::vector<std::optional<std::string>> m_chars;

  auto in_bounds(int x, int y) const -> bool
  {
    return x >= 0 && x < m_width && y >= 0 && y < m_height;
  }
  auto cell_index(int x, int y) const -> size_t
  {
    return static_cast<size_t>((x >> 1) + m_char_width * (y >> 2));
  }
  auto term_color(color_t fg, color_t bg) const -> std::string;

  // Visits the glyph of every visible cell of a row, honouring multi-width overrides
  template <typename Fn> auto for_each_cell(int cy, Fn &&fn) const -> void;
};

} // namespace braille_map
