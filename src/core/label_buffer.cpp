#include "core/label_buffer.hpp"
#include "core/braille_buffer.hpp"

namespace braille_map
{

// Labels are short; a cell of 8x8 characters keeps buckets small
constexpr double LABEL_CELL_SIZE = 8.0;

label_buffer_t::label_buffer_t(int margin) : m_default_margin(margin), m_index(LABEL_CELL_SIZE)
{
}

auto label_buffer_t::clear() -> void
{
  m_index.clear();
}

auto label_buffer_t::write_if_possible(const std::string &text, int x, int y) -> bool
{
  return write_if_possible(text, x, y, m_default_margin);
}

auto label_buffer_t::write_if_possible(const std::string &text, int x, int y, int margin) -> bool
{
  // Project braille pixels onto character cells
  int cx = x >> 1;
  int cy = y >> 2;

  auto area = calculate_area(text, cx, cy, margin);
  if (m_index.collides(area))
    return false;

  m_index.insert({area, text});
  return true;
}

auto label_buffer_t::features_at(int cx, int cy) const -> std::vector<const label_entry_t *>
{
  bbox_t point{static_cast<double>(cx), static_cast<double>(cy), static_cast<double>(cx), static_cast<double>(cy)};
  return m_index.search(point);
}

auto label_buffer_t::calculate_area(const std::string &text, int cx, int cy, int margin) const -> bbox_t
{
  bbox_t area;
  area.min_x = cx - margin;
  area.min_y = cy - margin / 2;
  area.max_x = cx + margin + utf8_length(text);
  area.max_y = cy + margin / 2;
  return area;
}

} // namespace braille_map
