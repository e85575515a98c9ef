#pragma once

#include "core/spatial_index.hpp"
#include <string>
#include <vector>

namespace braille_map
{

// Placed label rectangle in character cell space
struct label_entry_t
{
  bbox_t bounds;
  std::string text;
};

// Collision index for label placement. Cleared every frame.
class label_buffer_t
{
public:
  explicit label_buffer_t(int margin = 5);

  auto clear() -> void;

  // Try to reserve space for text at braille pixel position (x, y).
  // Returns false, without inserting, if the area overlaps a placed label.
  auto write_if_possible(const std::string &text, int x, int y) -> bool;
  auto write_if_possible(const std::string &text, int x, int y, int margin) -> bool;

  // Labels covering a character cell
  auto features_at(int cx, int cy) const -> std::vector<const label_entry_t *>;

  auto size() const -> size_t
  {
    return m_index.size();
  }

private:
  int m_default_margin;
  spatial_index_t<label_entry_t> m_index;

  auto calculate_area(const std::string &text, int cx, int cy, int margin) const -> bbox_t;
};

} // namespace braille_map
