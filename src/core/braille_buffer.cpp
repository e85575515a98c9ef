#include "core/braille_buffer.hpp"
#include <algorithm>
#include <format>

namespace braille_map
{

namespace
{

// Bit per dot, indexed [y & 3][x & 1]
constexpr std::uint8_t BRAILLE_MAP[4][2] = {{0x01, 0x08}, {0x02, 0x10}, {0x04, 0x20}, {0x40, 0x80}};

constexpr const char *TERM_RESET = "\x1B[39;49m";

// UTF-8 encoding of U+2800 + bits
auto braille_glyph(std::uint8_t bits) -> std::string
{
  std::string s(3, '\0');
  s[0] = static_cast<char>(0xE2);
  s[1] = static_cast<char>(0xA0 | (bits >> 6));
  s[2] = static_cast<char>(0x80 | (bits & 0x3F));
  return s;
}

auto utf8_sequence_length(unsigned char lead) -> size_t
{
  if (lead < 0x80)
    return 1;
  if ((lead >> 5) == 0x06)
    return 2;
  if ((lead >> 4) == 0x0E)
    return 3;
  if ((lead >> 3) == 0x1E)
    return 4;
  return 1; // stray continuation byte
}

} // namespace

auto utf8_glyphs(const std::string &text) -> std::vector<std::string>
{
  std::vector<std::string> glyphs;
  size_t i = 0;
  while (i < text.size())
  {
    size_t len = std::min(utf8_sequence_length(static_cast<unsigned char>(text[i])), text.size() - i);
    glyphs.push_back(text.substr(i, len));
    i += len;
  }
  return glyphs;
}

auto utf8_length(const std::string &text) -> int
{
  return static_cast<int>(utf8_glyphs(text).size());
}

braille_buffer_t::braille_buffer_t(int width, int height)
{
  m_width = std::max(0, width - (width % 2));
  m_height = std::max(0, height - (height % 4));
  m_char_width = m_width >> 1;
  m_char_height = m_height >> 2;

  size_t cells = static_cast<size_t>(m_char_width) * m_char_height;
  m_pixels.assign(cells, 0);
  m_foreground.assign(cells, 0);
  m_background.assign(cells, 0);
  m_chars.assign(cells, std::nullopt);
}

auto braille_buffer_t::clear() -> void
{
  std::fill(m_pixels.begin(), m_pixels.end(), 0);
  std::fill(m_foreground.begin(), m_foreground.end(), 0);
  std::fill(m_background.begin(), m_background.end(), 0);
  std::fill(m_chars.begin(), m_chars.end(), std::nullopt);
}

auto braille_buffer_t::set_pixel(int x, int y, color_t color) -> void
{
  if (!in_bounds(x, y))
    return;
  auto idx = cell_index(x, y);
  m_pixels[idx] |= BRAILLE_MAP[y & 3][x & 1];
  m_foreground[idx] = color;
}

auto braille_buffer_t::unset_pixel(int x, int y) -> void
{
  if (!in_bounds(x, y))
    return;
  m_pixels[cell_index(x, y)] &= static_cast<std::uint8_t>(~BRAILLE_MAP[y & 3][x & 1]);
}

auto braille_buffer_t::is_pixel_set(int x, int y) const -> bool
{
  if (!in_bounds(x, y))
    return false;
  return (m_pixels[cell_index(x, y)] & BRAILLE_MAP[y & 3][x & 1]) != 0;
}

auto braille_buffer_t::set_background(int x, int y, color_t color) -> void
{
  if (!in_bounds(x, y))
    return;
  m_background[cell_index(x, y)] = color;
}

auto braille_buffer_t::set_char(const std::string &glyph, int x, int y, color_t color) -> void
{
  if (!in_bounds(x, y))
    return;
  auto idx = cell_index(x, y);
  m_chars[idx] = glyph;
  m_foreground[idx] = color;
}

auto braille_buffer_t::write_text(const std::string &text, int x, int y, color_t color, bool center) -> void
{
  auto glyphs = utf8_glyphs(text);
  if (center)
    x -= static_cast<int>(glyphs.size());

  for (size_t i = 0; i < glyphs.size(); ++i)
  {
    set_char(glyphs[i], x + static_cast<int>(i) * 2, y, color);
  }
}

auto braille_buffer_t::term_color(color_t fg, color_t bg) const -> std::string
{
  color_t effective_bg = bg ? bg : m_global_background;
  if (fg && effective_bg)
    return std::format("\x1B[38;5;{};48;5;{}m", fg, effective_bg);
  if (fg)
    return std::format("\x1B[49;38;5;{}m", fg);
  if (effective_bg)
    return std::format("\x1B[39;48;5;{}m", effective_bg);
  return TERM_RESET;
}

template <typename Fn> auto braille_buffer_t::for_each_cell(int cy, Fn &&fn) const -> void
{
  int skip = 0;
  for (int cx = 0; cx < m_char_width; ++cx)
  {
    size_t idx = static_cast<size_t>(cy) * m_char_width + cx;

    if (skip > 0)
    {
      --skip;
      fn(idx, nullptr);
      continue;
    }

    if (m_chars[idx])
    {
      const std::string &glyph = *m_chars[idx];
      fn(idx, &glyph);
      // Wide overrides cover the following cells
      skip = std::max(0, utf8_length(glyph) - 1);
    }
    else
    {
      std::string glyph = braille_glyph(m_pixels[idx]);
      fn(idx, &glyph);
    }
  }
}

auto braille_buffer_t::to_lines() const -> std::vector<std::string>
{
  std::vector<std::string> lines;
  lines.reserve(m_char_height);

  // Every line ends with a reset, so each one starts from the default colours
  for (int cy = 0; cy < m_char_height; ++cy)
  {
    std::string line;
    std::string current_color;
    for_each_cell(cy,
                  [&](size_t idx, const std::string *glyph)
                  {
                    auto code = term_color(m_foreground[idx], m_background[idx]);
                    if (code != current_color)
                    {
                      current_color = code;
                      line += code;
                    }
                    if (glyph)
                      line += *glyph;
                  });
    line += TERM_RESET;
    lines.push_back(std::move(line));
  }
  return lines;
}

auto braille_buffer_t::to_plain_lines() const -> std::vector<std::string>
{
  std::vector<std::string> lines;
  lines.reserve(m_char_height);

  for (int cy = 0; cy < m_char_height; ++cy)
  {
    std::string line;
    for_each_cell(cy,
                  [&](size_t, const std::string *glyph)
                  {
                    if (glyph)
                      line += *glyph;
                  });
    lines.push_back(std::move(line));
  }
  return lines;
}

auto braille_buffer_t::to_colored_cells() const -> std::vector<std::vector<colored_cell_t>>
{
  std::vector<std::vector<colored_cell_t>> rows;
  rows.reserve(m_char_height);

  for (int cy = 0; cy < m_char_height; ++cy)
  {
    std::vector<colored_cell_t> row;
    for_each_cell(cy,
                  [&](size_t idx, const std::string *glyph)
                  {
                    if (!glyph)
                      return;
                    color_t fg = m_foreground[idx];
                    row.push_back({*glyph, fg ? color::xterm_to_hex(fg) : "#000000"});
                  });
    rows.push_back(std::move(row));
  }
  return rows;
}

auto braille_buffer_t::frame() const -> std::string
{
  std::string out;
  auto lines = to_lines();
  for (size_t i = 0; i < lines.size(); ++i)
  {
    if (i > 0)
      out += '\n';
    out += lines[i];
  }
  return out;
}

} // namespace braille_map
